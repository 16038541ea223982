#include "chat_cmdline_util.h"
#include "chat_console.h"
#include "chat_session.h"
#include "chat_transcript.h"
#include "shared_common_util.h"
#include "shared_net_socket_util.h"

#include <asio/io_context.hpp>

#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <system_error>

namespace
{

std::error_code open_connection(asio::io_context &io, const ChatConfig &config,
                                Connection &conn)
{
    if (config.role == Role::Responder)
    {
        std::error_code ec;
        auto acceptor = make_listen_socket_asio(io, config.port, 1, &ec);
        if (!acceptor)
        {
            log_event(std::cerr, "bind failed on port " +
                                     std::to_string(config.port) + ": " +
                                     ec.message());
            return ec;
        }
        const auto bound = acceptor->local_endpoint(ec);
        if (ec)
            return ec;
        log_event(std::cout, "[SERVER] Listening on port " +
                                 std::to_string(bound.port()) + "...");

        if ((ec = accept_single_peer(*acceptor, conn)))
        {
            log_event(std::cerr, "accept failed: " + ec.message());
            return ec;
        }

        const auto remote = conn.remote_endpoint(ec);
        if (!ec)
            log_event(std::cout, "[SERVER] Client connected from " +
                                     remote.address().to_string() + ":" +
                                     std::to_string(remote.port()) + "\n");
        return {};
    }

    log_event(std::cout, "[CLIENT] Connecting to " + config.host + ":" +
                             std::to_string(config.remote_port) + "...");
    if (auto ec = connect_to_host(io, config.host, config.remote_port, conn))
    {
        log_event(std::cerr, "connection failed: " + ec.message());
        return ec;
    }
    log_event(std::cout, "[CLIENT] Connected!\n");
    return {};
}

} // namespace

int main(int argc, char **argv)
{
    std::string error;
    const auto  config =
        parse_command_line_args(std::span<char *>(argv, argc), error);
    if (!config)
    {
        std::cerr << error << "\n";
        print_usage(std::cerr);
        return 1;
    }
    if (config->help)
    {
        print_usage(std::cout);
        return 0;
    }

    debug_mode = config->debug;

    try
    {
        asio::io_context io;
        Connection       conn(io);
        if (open_connection(io, *config, conn))
            return 1;

        ConsoleLineSource input(std::cin, std::cout);
        ConsoleLineSink   output(std::cout, role_str(peer_role(config->role)));
        SessionTranscript transcript(std::cout);

        ChatSession session(conn, config->role, input, output, transcript,
                            config->keystream_preview);
        const std::error_code ec = session.run();

        std::error_code close_ec;
        conn.shutdown(asio::ip::tcp::socket::shutdown_both, close_ec);
        if (close_ec)
            dev_println("[NETWORK] shutdown: " + close_ec.message());
        conn.close(close_ec);
        if (close_ec)
            dev_println("[NETWORK] close: " + close_ec.message());

        switch (session.close_reason())
        {
        case CloseReason::HandshakeFailed:
        case CloseReason::WriteFailed:
            log_event(std::cerr, "session aborted: " + ec.message());
            return 1;
        default:
            return 0;
        }
    }
    catch (const std::exception &e)
    {
        log_event(std::cerr, std::string("fatal: ") + e.what());
        return 1;
    }
}
