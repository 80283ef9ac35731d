#pragma once

#include "net/ops.hpp"
#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

enum class TransportErrc { connect, timeout, eof, read, write };

struct TransportError {
  TransportErrc kind;
  beast::error_code ec;

  const char *KindName() const {
    switch (kind) {
    case TransportErrc::connect:
      return "connect";
    case TransportErrc::timeout:
      return "timeout";
    case TransportErrc::eof:
      return "eof";
    case TransportErrc::read:
      return "read";
    case TransportErrc::write:
      return "write";
    }
    return "unknown";
  }

  std::string Describe() const {
    return std::string(KindName()) + ": " + ec.message();
  }
};

// ILineTransport: one newline-delimited byte stream. Every operation takes
// its own timeout and re-arms the deadline from "now", so only a single
// stalled operation can trip it.
class ILineTransport {
public:
  virtual ~ILineTransport() = default;

  virtual std::expected<void, TransportError>
  Open(const netops::Endpoints &endpoints, std::chrono::milliseconds timeout,
       net::yield_context yield) = 0;

  // `line` must not contain '\n'; the terminator is appended here.
  virtual std::expected<void, TransportError>
  SendLine(std::string_view line, std::chrono::milliseconds timeout,
           net::yield_context yield) = 0;

  // Returns the next line without its "\n" or "\r\n" terminator.
  virtual std::expected<std::string, TransportError>
  ReadLine(std::chrono::milliseconds timeout, net::yield_context yield) = 0;

  // Idempotent.
  virtual void Close() = 0;
};

// TcpLineTransport
// Threading model:
// - Used by exactly one session coroutine; never shared, no locking
// - All waits are asynchronous on the reactor's io_context via yield_context
// - Deadlines come from beast::tcp_stream::expires_after, which closes the
//   socket on expiry and completes the pending operation with
//   beast::error::timeout
class TcpLineTransport final : public ILineTransport {
public:
  static constexpr std::size_t kMaxLineBytes = 1 << 20;

  explicit TcpLineTransport(net::any_io_executor ex) : stream_(ex) {}

  ~TcpLineTransport() override { Close(); }

  TcpLineTransport(const TcpLineTransport &) = delete;
  TcpLineTransport &operator=(const TcpLineTransport &) = delete;

  std::expected<void, TransportError>
  Open(const netops::Endpoints &endpoints, std::chrono::milliseconds timeout,
       net::yield_context yield) override {
    if (stream_.socket().is_open()) {
      return std::unexpected(
          TransportError{TransportErrc::connect, net::error::already_connected});
    }
    buffer_.clear();
    auto st = netops::AsyncConnect(stream_, endpoints, timeout, yield);
    if (!st) {
      const auto kind = st.error() == beast::error::timeout
                            ? TransportErrc::timeout
                            : TransportErrc::connect;
      Close();
      return std::unexpected(TransportError{kind, st.error()});
    }
    netops::SetTcpNoDelay(stream_);
    return {};
  }

  std::expected<void, TransportError>
  SendLine(std::string_view line, std::chrono::milliseconds timeout,
           net::yield_context yield) override {
    std::string out;
    out.reserve(line.size() + 1);
    out.append(line);
    out += '\n';
    beast::error_code ec;
    stream_.expires_after(timeout);
    net::async_write(stream_, net::buffer(out), yield[ec]);
    if (ec) {
      return std::unexpected(TransportError{
          ec == beast::error::timeout ? TransportErrc::timeout
                                      : TransportErrc::write,
          ec});
    }
    return {};
  }

  std::expected<std::string, TransportError>
  ReadLine(std::chrono::milliseconds timeout,
           net::yield_context yield) override {
    beast::error_code ec;
    stream_.expires_after(timeout);
    std::size_t n = net::async_read_until(
        stream_, net::dynamic_buffer(buffer_, kMaxLineBytes), '\n',
        yield[ec]);
    if (ec) {
      TransportErrc kind = TransportErrc::read;
      if (ec == beast::error::timeout) {
        kind = TransportErrc::timeout;
      } else if (ec == net::error::eof) {
        kind = TransportErrc::eof;
      }
      return std::unexpected(TransportError{kind, ec});
    }
    std::string line = buffer_.substr(0, n - 1);
    buffer_.erase(0, n);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    return line;
  }

  void Close() override {
    auto &sock = stream_.socket();
    if (sock.is_open()) {
      beast::error_code ec;
      sock.shutdown(tcp::socket::shutdown_both, ec);
      (void)ec;
      stream_.close();
    }
  }

private:
  beast::tcp_stream stream_;
  std::string buffer_;
};
