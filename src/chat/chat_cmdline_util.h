#ifndef CHAT_CMDLINE_UTIL_H
#define CHAT_CMDLINE_UTIL_H

#include "shared_net_common_protocol.h"

#include <cstdint>
#include <exception>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct ChatConfig
{
    Role           role = Role::Responder;
    unsigned short port{};        // responder: local port to bind
    std::string    host;          // initiator: remote host
    unsigned short remote_port{}; // initiator: remote port
    bool           debug             = false;
    bool           help              = false;
    size_t         keystream_preview = DEFAULT_KEYSTREAM_PREVIEW;
};

inline void print_usage(std::ostream &out)
{
    out << "Usage: streamchat server <port> [--debug] [--preview <n>]\n"
           "       streamchat client <host:port> [--debug] [--preview <n>]\n\n"
           "Stream cipher chat with Diffie-Hellman key agreement.\n"
           "The server (responder) waits for one connection and receives\n"
           "first; the client (initiator) connects and sends first.\n"
           "--preview <n> shows the first n keystream bytes (default "
        << DEFAULT_KEYSTREAM_PREVIEW << ").\n";
}

[[nodiscard]] inline std::optional<unsigned long>
parse_number(std::string_view s, unsigned long max)
{
    if (s.empty() || s.size() > 10)
        return std::nullopt;
    unsigned long v = 0;
    for (const char c : s)
    {
        if (c < '0' || c > '9')
            return std::nullopt;
        v = v * 10 + static_cast<unsigned long>(c - '0');
    }
    if (v > max)
        return std::nullopt;
    return v;
}

// "host:port", "1.2.3.4:port" or "[::1]:port".
[[nodiscard]] inline bool split_host_port(std::string_view addr,
                                          std::string &host, unsigned short &port)
{
    const auto colon = addr.rfind(':');
    if (colon == std::string_view::npos || colon == 0)
        return false;

    std::string_view h = addr.substr(0, colon);
    if (h.front() == '[')
    {
        if (h.size() < 3 || h.back() != ']')
            return false;
        h = h.substr(1, h.size() - 2);
    }
    else if (h.find(':') != std::string_view::npos)
    {
        return false; // bare IPv6 needs brackets
    }

    const auto p = parse_number(addr.substr(colon + 1), 65535);
    if (!p || *p == 0)
        return false;

    host = std::string(h);
    port = static_cast<unsigned short>(*p);
    return true;
}

// Returns std::nullopt on a usage error, with the reason in `error`.
[[nodiscard]] inline std::optional<ChatConfig>
parse_command_line_args(std::span<char *> args, std::string &error)
{
    ChatConfig                    config;
    std::vector<std::string_view> positional;

    for (std::size_t i = 1; i < args.size(); ++i)
    {
        const std::string_view a(args[i]);
        if (a == "--debug")
            config.debug = true;
        else if (a == "-h" || a == "--help")
            config.help = true;
        else if (a == "--preview")
        {
            const auto n = i + 1 < args.size()
                               ? parse_number(args[++i], MAX_KEYSTREAM_PREVIEW)
                               : std::nullopt;
            if (!n)
            {
                error = "--preview expects a byte count (0-" +
                        std::to_string(MAX_KEYSTREAM_PREVIEW) + ")";
                return std::nullopt;
            }
            config.keystream_preview = *n;
        }
        else if (a.starts_with("-"))
        {
            error = "unknown option: " + std::string(a);
            return std::nullopt;
        }
        else
            positional.push_back(a);
    }

    if (config.help)
        return config;

    if (positional.size() != 2)
    {
        error = "expected a role and one argument";
        return std::nullopt;
    }

    if (positional[0] == "server")
    {
        const auto p = parse_number(positional[1], 65535);
        if (!p)
        {
            error = "Invalid port number";
            return std::nullopt;
        }
        config.role = Role::Responder;
        config.port = static_cast<unsigned short>(*p);
    }
    else if (positional[0] == "client")
    {
        if (!split_host_port(positional[1], config.host, config.remote_port))
        {
            error = "Invalid address, expected <host:port>";
            return std::nullopt;
        }
        config.role = Role::Initiator;
    }
    else
    {
        error = "unknown role: " + std::string(positional[0]);
        return std::nullopt;
    }

    return config;
}

#endif
