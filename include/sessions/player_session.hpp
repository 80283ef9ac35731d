#pragma once

#include "core/counters.hpp"
#include "core/isession.hpp"
#include "core/message.hpp"
#include "logging/console.hpp"
#include "net/line_transport.hpp"
#include "protocol/codec.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <utility>
#include <vector>

enum class SessionState { connecting, registering, joining, interacting, terminated };

inline const char *StateName(SessionState s) {
  switch (s) {
  case SessionState::connecting:
    return "connecting";
  case SessionState::registering:
    return "registering";
  case SessionState::joining:
    return "joining";
  case SessionState::interacting:
    return "interacting";
  case SessionState::terminated:
    return "terminated";
  }
  return "?";
}

struct Credentials {
  std::string username;
  std::string password;

  static Credentials ForId(std::uint64_t id, const std::string &user_prefix,
                           const std::string &password_prefix) {
    return Credentials{.username = user_prefix + std::to_string(id),
                       .password = password_prefix + std::to_string(id)};
  }
};

struct SessionTimeouts {
  std::chrono::milliseconds connect{10000};
  std::chrono::milliseconds io{10000};
  std::chrono::milliseconds activity{60000};
};

struct SessionConfig {
  std::string user_prefix = "over-";
  std::string password_prefix = "password";
  SessionTimeouts timeouts;
  // Stop right after a successful registration (player flood).
  bool register_only = false;
};

// PlayerSession
// Threading model:
// - Runs as one coroutine on the reactor; owns its transport exclusively and
//   performs strictly sequential send/receive on it
// - The only shared state it touches is ICounters
// Lifecycle: connecting -> registering -> joining -> interacting ->
// terminated, never re-entering a state. Every failure is absorbed here and
// becomes a counter increment and/or a log line.
class PlayerSession : public ISession {
public:
  PlayerSession(std::uint64_t id, const SessionConfig &cfg,
                const netops::Endpoints &endpoints,
                std::unique_ptr<ILineTransport> transport, ICounters &counters)
      : cfg_(cfg), endpoints_(endpoints), transport_(std::move(transport)),
        counters_(counters),
        creds_(Credentials::ForId(id, cfg.user_prefix, cfg.password_prefix)),
        log_prefix_("[" + creds_.username + "] ") {}

  void Run(net::yield_context yield) override {
    Enter(SessionState::connecting);
    while (state_ != SessionState::terminated) {
      switch (state_) {
      case SessionState::connecting:
        Enter(Connect(yield));
        break;
      case SessionState::registering:
        Enter(Register(yield));
        break;
      case SessionState::joining:
        Enter(Join(yield));
        break;
      case SessionState::interacting:
        Enter(Interact(yield));
        break;
      case SessionState::terminated:
        break;
      }
    }
    Debug() << "Session ended.";
  }

  SessionState State() const { return state_; }
  const std::vector<SessionState> &History() const { return history_; }
  bool AllInDone() const { return all_in_done_; }
  const Credentials &Creds() const { return creds_; }

private:
  logging::Line Debug() const {
    return logging::Line(logging::Level::debug, log_prefix_);
  }
  logging::Line Warn() const {
    return logging::Line(logging::Level::warn, log_prefix_);
  }

  void Enter(SessionState next) {
    state_ = next;
    history_.push_back(next);
    if (next == SessionState::terminated) {
      transport_->Close();
    }
  }

  SessionState Connect(net::yield_context yield) {
    auto st = transport_->Open(endpoints_, cfg_.timeouts.connect, yield);
    if (!st) {
      Warn() << "connect error: " << st.error().Describe();
      counters_.RegistrationFailed();
      return SessionState::terminated;
    }
    return SessionState::registering;
  }

  SessionState Register(net::yield_context yield) {
    const proto::Request reg =
        proto::Registration{creds_.username, creds_.password};
    if (!Send(reg, yield)) {
      counters_.RegistrationFailed();
      return SessionState::terminated;
    }
    auto resp = ReadResponse(cfg_.timeouts.io, yield);
    if (!resp) {
      counters_.RegistrationFailed();
      return SessionState::terminated;
    }
    if (codec::Classify(*resp) == proto::ResponseKind::registered) {
      counters_.RegistrationSucceeded();
      Debug() << "Successfully registered.";
      return cfg_.register_only ? SessionState::terminated
                                : SessionState::joining;
    }
    if (resp->code != 0) {
      Warn() << "registration failed: code " << resp->code
             << ", message: " << resp->message;
    } else {
      Warn() << "registration resulted in unexpected response: type='"
             << resp->type << "', message='" << resp->message << "'";
    }
    counters_.RegistrationFailed();
    return SessionState::terminated;
  }

  SessionState Join(net::yield_context yield) {
    if (!Send(proto::Action{proto::Join{}}, yield)) {
      return SessionState::terminated;
    }
    counters_.GameJoined();
    Debug() << "Sent join action. Waiting for game events...";
    return SessionState::interacting;
  }

  SessionState Interact(net::yield_context yield) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + cfg_.timeouts.activity;
    for (;;) {
      const auto now = clock::now();
      if (now >= deadline) {
        Debug() << "Game activity timeout. Ending session.";
        return SessionState::terminated;
      }
      const auto left =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      auto resp = ReadResponse(std::min(cfg_.timeouts.io, left), yield);
      if (!resp) {
        return SessionState::terminated;
      }

      switch (codec::Classify(*resp)) {
      case proto::ResponseKind::bet_turn:
        if (resp->player.player_id != creds_.username) {
          break;
        }
        if (!OnOwnBetTurn(*resp, yield)) {
          return SessionState::terminated;
        }
        break;
      case proto::ResponseKind::terminal:
        Debug() << "Received terminal event: " << resp->type
                << ". Ending session.";
        if (resp->type == proto::kGameOverType && !resp->event.empty()) {
          Debug() << "Game over event data: " << resp->event;
        }
        return SessionState::terminated;
      case proto::ResponseKind::bare_error:
        Debug() << "Received error from server: code " << resp->code
                << ", message: " << resp->message;
        break;
      case proto::ResponseKind::ambiguous:
        Debug() << "Received message with empty type and no error code.";
        break;
      case proto::ResponseKind::registered:
      case proto::ResponseKind::other:
        break;
      }
    }
  }

  // All-in once, fold ever after. A fold forced by an empty stack leaves the
  // all-in flag unset, so a later turn with chips may still go all-in.
  bool OnOwnBetTurn(const proto::Response &resp, net::yield_context yield) {
    const std::int64_t chips = resp.player.chips;
    Debug() << "It's my turn to bet. Stage: " << resp.stage
            << ", my chips: " << chips;
    if (all_in_done_) {
      Debug() << "Already performed all-in, now folding.";
      return SendFold(yield);
    }
    if (chips <= 0) {
      Debug() << "Chips are " << chips
              << ", cannot make a positive bet. Folding instead of all-in.";
      return SendFold(yield);
    }
    Debug() << "Going all-in with " << chips << " chips.";
    if (!Send(proto::Action{proto::Bet{chips}}, yield)) {
      return false;
    }
    counters_.AllInMade();
    all_in_done_ = true;
    return true;
  }

  bool SendFold(net::yield_context yield) {
    if (!Send(proto::Action{proto::Fold{}}, yield)) {
      return false;
    }
    counters_.FoldMade();
    return true;
  }

  bool Send(const proto::Request &request, net::yield_context yield) {
    const std::string line = codec::Encode(request);
    Debug() << "Sending: " << line;
    auto st = transport_->SendLine(line, cfg_.timeouts.io, yield);
    if (!st) {
      Debug() << "send error: " << st.error().Describe();
      return false;
    }
    return true;
  }

  // Read and decode one line; any failure has been logged on return.
  std::expected<proto::Response, std::string>
  ReadResponse(std::chrono::milliseconds timeout, net::yield_context yield) {
    auto line = transport_->ReadLine(timeout, yield);
    if (!line) {
      Debug() << "read error: " << line.error().Describe();
      return std::unexpected(line.error().Describe());
    }
    Debug() << "Received: " << *line;
    auto resp = codec::Decode(*line);
    if (!resp) {
      Debug() << "decode error: " << resp.error().reason << " in '" << *line
              << "'";
      return std::unexpected(resp.error().reason);
    }
    return std::move(*resp);
  }

  SessionConfig cfg_;
  netops::Endpoints endpoints_;
  std::unique_ptr<ILineTransport> transport_;
  ICounters &counters_;
  Credentials creds_;
  std::string log_prefix_;
  SessionState state_ = SessionState::connecting;
  std::vector<SessionState> history_;
  bool all_in_done_ = false;
};
