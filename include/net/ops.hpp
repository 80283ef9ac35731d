#pragma once

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>.
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/beast/core.hpp>
#include <chrono>
#include <expected>
#include <string>

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

// namespace netops: thin std::expected wrappers over the Asio/Beast calls the
// sessions need, so call sites read as a straight sequence of checked steps.
namespace netops {

using Status = std::expected<void, beast::error_code>;
using Endpoints = tcp::resolver::results_type;

inline Status MakeStatus(const beast::error_code &ec) {
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

inline std::expected<Endpoints, beast::error_code>
AsyncResolve(tcp::resolver &resolver, const std::string &host,
             const std::string &port, net::yield_context yield) {
  beast::error_code ec;
  auto r = resolver.async_resolve(host, port, yield[ec]);
  if (ec) {
    return std::unexpected(ec);
  }
  return r;
}

// Connect with its own deadline; expiry surfaces as beast::error::timeout.
inline Status AsyncConnect(beast::tcp_stream &stream,
                           const Endpoints &endpoints,
                           std::chrono::milliseconds timeout,
                           net::yield_context yield) {
  beast::error_code ec;
  stream.expires_after(timeout);
  stream.async_connect(endpoints, yield[ec]);
  return MakeStatus(ec);
}

inline void SetTcpNoDelay(beast::tcp_stream &stream) {
  beast::error_code ec;
  stream.socket().set_option(net::ip::tcp::no_delay(true), ec);
  (void)ec;
}

inline void WaitAsync(net::any_io_executor ex, net::yield_context yield,
                      std::chrono::milliseconds delay) {
  boost::system::error_code ec;
  net::steady_timer t(ex);
  t.expires_after(delay);
  t.async_wait(yield[ec]);
  (void)ec;
}

} // namespace netops
