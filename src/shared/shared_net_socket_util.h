#ifndef SHARED_NET_SOCKET_UTIL_H
#define SHARED_NET_SOCKET_UTIL_H

#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <fcntl.h>

#include <memory>
#include <string>
#include <system_error>

// The raw byte stream between the two peers. Owned by the role driver and lent
// to the handshake and the session.
using Connection = asio::ip::tcp::socket;

inline void set_cloexec(int native) noexcept {
  if (native < 0)
    return;
  int fd_flags = ::fcntl(native, F_GETFD);
  if (fd_flags >= 0)
    ::fcntl(native, F_SETFD, fd_flags | FD_CLOEXEC);
}

[[nodiscard]] inline std::shared_ptr<asio::ip::tcp::acceptor>
make_listen_socket_asio(asio::io_context &io, unsigned short port,
                        int backlog = 1,
                        std::error_code *out_ec = nullptr) noexcept {
  try {
    auto acceptor = std::make_shared<asio::ip::tcp::acceptor>(io);
    acceptor->open(asio::ip::tcp::v4());
    acceptor->set_option(asio::ip::tcp::acceptor::reuse_address(true));
    set_cloexec(acceptor->native_handle());
    acceptor->bind(asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port));
    acceptor->listen(backlog);
    if (out_ec)
      *out_ec = std::error_code();
    return acceptor;
  } catch (const std::system_error &e) {
    if (out_ec)
      *out_ec = e.code();
    return nullptr;
  } catch (const std::bad_alloc &) {
    if (out_ec)
      *out_ec = std::make_error_code(std::errc::not_enough_memory);
    return nullptr;
  }
}

// Accept exactly one peer, then stop listening.
[[nodiscard]] inline std::error_code
accept_single_peer(asio::ip::tcp::acceptor &acceptor, Connection &out) {
  std::error_code ec;
  acceptor.accept(out, ec);
  std::error_code close_ec;
  acceptor.close(close_ec);
  if (ec)
    return ec;
  set_cloexec(out.native_handle());
  return close_ec;
}

[[nodiscard]] inline std::error_code
connect_to_host(asio::io_context &io, const std::string &host,
                unsigned short port, Connection &out) {
  std::error_code ec;
  asio::ip::tcp::resolver resolver(io);
  const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec)
    return ec;
  asio::connect(out, endpoints, ec);
  if (ec)
    return ec;
  set_cloexec(out.native_handle());
  return {};
}

#endif
