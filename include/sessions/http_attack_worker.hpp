#pragma once

#include "core/counters.hpp"
#include "core/isession.hpp"
#include "logging/console.hpp"
#include "net/ops.hpp"
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>

namespace http = beast::http;

struct AttackTarget {
  std::string host;
  std::string port;
  std::string target;
  netops::Endpoints endpoints;
};

// HttpAttackWorker
// Threading model:
// - Runs as one coroutine on the reactor, one keep-alive connection per
//   worker, requests strictly sequential
// - Stops cooperatively: the shared stop_token is checked at the top of each
//   iteration, so one in-flight request may still complete after the deadline
// - A failed request costs a fixed short pause and a reconnect on the next
//   iteration; there is no backoff growth
class HttpAttackWorker : public ISession {
public:
  static constexpr std::chrono::milliseconds kErrorPause{50};

  HttpAttackWorker(int index, net::any_io_executor ex,
                   const AttackTarget &target,
                   std::chrono::milliseconds requestTimeout,
                   std::stop_token stop, ICounters &counters)
      : index_(index), ex_(std::move(ex)), target_(target),
        timeout_(requestTimeout), stop_(std::move(stop)), counters_(counters) {
  }

  void Run(net::yield_context yield) override {
    while (!stop_.stop_requested()) {
      counters_.RequestSent();
      auto status = Request(yield);
      if (!status) {
        counters_.RequestFailed();
        if (logging::Console::Verbose()) {
          OnError(status.error());
        }
        stream_.reset();
        netops::WaitAsync(ex_, yield, kErrorPause);
        continue;
      }
      if (*status == 200) {
        counters_.RequestSucceeded();
      } else {
        counters_.RequestFailed();
      }
    }
    if (stream_.has_value()) {
      beast::error_code ec;
      stream_->socket().shutdown(tcp::socket::shutdown_both, ec);
      (void)ec;
    }
  }

private:
  std::expected<unsigned, beast::error_code> Request(net::yield_context yield) {
    if (!stream_.has_value()) {
      stream_.emplace(ex_);
      auto st =
          netops::AsyncConnect(*stream_, target_.endpoints, timeout_, yield);
      if (!st) {
        return std::unexpected(st.error());
      }
      netops::SetTcpNoDelay(*stream_);
      buffer_.clear();
    }

    http::request<http::empty_body> req{http::verb::get, target_.target, 11};
    req.set(http::field::host, target_.host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    req.keep_alive(true);

    beast::error_code ec;
    stream_->expires_after(timeout_);
    http::async_write(*stream_, req, yield[ec]);
    if (ec) {
      return std::unexpected(ec);
    }

    http::response<http::string_body> res;
    stream_->expires_after(timeout_);
    http::async_read(*stream_, buffer_, res, yield[ec]);
    if (ec) {
      return std::unexpected(ec);
    }
    if (!res.keep_alive()) {
      stream_.reset();
    }
    return res.result_int();
  }

  void OnError(const beast::error_code &ec) {
    logging::Line(logging::Level::debug)
        << "[attacker " << index_ << "] request error: " << ec.message();
  }

  int index_;
  net::any_io_executor ex_;
  AttackTarget target_;
  std::chrono::milliseconds timeout_;
  std::stop_token stop_;
  ICounters &counters_;
  std::optional<beast::tcp_stream> stream_;
  beast::flat_buffer buffer_;
};
