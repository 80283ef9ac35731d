#pragma once

#include "net/line_transport.hpp"
#include <chrono>
#include <deque>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Scripted stand-in for TcpLineTransport. The test keeps a shared_ptr to the
// script to feed reads up front and inspect sends afterwards.
struct TransportScript {
  std::optional<TransportError> open_error;
  std::deque<std::expected<std::string, TransportError>> reads;
  // Zero-based index of the SendLine call that fails, if any.
  std::optional<std::size_t> fail_send_at;

  std::vector<std::string> sent;
  std::vector<std::chrono::milliseconds> read_timeouts;
  int opens = 0;
  int closes = 0;
  bool open = false;

  void PushLine(std::string line) { reads.emplace_back(std::move(line)); }
  void PushError(TransportErrc kind, beast::error_code ec) {
    reads.emplace_back(std::unexpected(TransportError{kind, ec}));
  }
};

class ScriptedTransport final : public ILineTransport {
public:
  explicit ScriptedTransport(std::shared_ptr<TransportScript> script)
      : script_(std::move(script)) {}

  std::expected<void, TransportError>
  Open(const netops::Endpoints &, std::chrono::milliseconds,
       net::yield_context) override {
    ++script_->opens;
    if (script_->open_error) {
      return std::unexpected(*script_->open_error);
    }
    script_->open = true;
    return {};
  }

  std::expected<void, TransportError>
  SendLine(std::string_view line, std::chrono::milliseconds,
           net::yield_context) override {
    const std::size_t index = sends_++;
    if (script_->fail_send_at && *script_->fail_send_at == index) {
      return std::unexpected(
          TransportError{TransportErrc::write, net::error::broken_pipe});
    }
    script_->sent.emplace_back(line);
    return {};
  }

  std::expected<std::string, TransportError>
  ReadLine(std::chrono::milliseconds timeout, net::yield_context) override {
    script_->read_timeouts.push_back(timeout);
    if (script_->reads.empty()) {
      return std::unexpected(TransportError{TransportErrc::eof, net::error::eof});
    }
    auto next = std::move(script_->reads.front());
    script_->reads.pop_front();
    return next;
  }

  void Close() override {
    if (script_->open) {
      script_->open = false;
      ++script_->closes;
    }
  }

private:
  std::shared_ptr<TransportScript> script_;
  std::size_t sends_ = 0;
};
