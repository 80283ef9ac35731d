#pragma once

#include "core/isession.hpp"
#include "logging/console.hpp"
#include <algorithm>
#include <atomic>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <cstdint>
#include <exception>
#include <functional>
#include <latch>
#include <memory>
#include <optional>

namespace net = boost::asio;

using SessionFactory = std::function<std::unique_ptr<ISession>(std::uint64_t)>;

struct PoolStats {
  std::uint64_t launched = 0;
  std::uint64_t completed = 0;
  std::uint64_t peak_in_flight = 0;
};

// SessionPool
// Threading model:
// - Spawns min(total, maxConcurrency) worker coroutines on the given
//   io_context; each claims the next id from an atomic cursor, runs that
//   session to completion, then claims another
// - The worker count is the admission bound: no more than maxConcurrency
//   sessions can be inside ISession::Run at any instant
// - Wait() blocks the calling (non-reactor) thread until every worker has
//   exited, at which point every id in [first, first + total) has run exactly
//   once
class SessionPool {
public:
  static constexpr std::uint64_t kProgressEvery = 100;

  explicit SessionPool(net::io_context &ioc) : ioc_(ioc) {}

  SessionPool(const SessionPool &) = delete;
  SessionPool &operator=(const SessionPool &) = delete;

  void Start(std::uint64_t firstId, std::uint64_t total,
             std::size_t maxConcurrency, SessionFactory factory,
             bool logProgress = false) {
    first_id_ = firstId;
    total_ = total;
    factory_ = std::move(factory);
    log_progress_ = logProgress;
    const std::uint64_t workers =
        std::min<std::uint64_t>(total, std::max<std::size_t>(1, maxConcurrency));
    done_.emplace(static_cast<std::ptrdiff_t>(workers));
    for (std::uint64_t i = 0; i < workers; ++i) {
      net::spawn(ioc_, [this](net::yield_context yield) { Worker(yield); });
    }
  }

  void Wait() {
    if (done_.has_value()) {
      done_->wait();
    }
  }

  PoolStats Stats() const {
    return PoolStats{
        .launched = std::min(next_.load(std::memory_order_relaxed), total_),
        .completed = completed_.load(std::memory_order_relaxed),
        .peak_in_flight = peak_.load(std::memory_order_relaxed)};
  }

private:
  void Worker(net::yield_context yield) {
    struct CountDown {
      std::latch &latch;
      ~CountDown() { latch.count_down(); }
    } guard{*done_};

    for (;;) {
      const std::uint64_t n = next_.fetch_add(1, std::memory_order_relaxed);
      if (n >= total_) {
        return;
      }
      const std::uint64_t id = first_id_ + n;
      if (log_progress_ && (n + 1) % kProgressEvery == 0) {
        logging::Line(logging::Level::info)
            << "Launched session " << (n + 1) << " of " << total_ << "...";
      }
      std::unique_ptr<ISession> session = factory_(id);
      EnterFlight();
      try {
        session->Run(yield);
      } catch (const std::exception &e) {
        logging::Line(logging::Level::warn)
            << "[session " << id << "] aborted: " << e.what();
      }
      session.reset();
      in_flight_.fetch_sub(1, std::memory_order_relaxed);
      completed_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  void EnterFlight() {
    const std::uint64_t now =
        in_flight_.fetch_add(1, std::memory_order_relaxed) + 1;
    std::uint64_t peak = peak_.load(std::memory_order_relaxed);
    while (now > peak &&
           !peak_.compare_exchange_weak(peak, now, std::memory_order_relaxed)) {
    }
  }

  net::io_context &ioc_;
  std::uint64_t first_id_ = 0;
  std::uint64_t total_ = 0;
  SessionFactory factory_;
  bool log_progress_ = false;
  std::optional<std::latch> done_;
  std::atomic<std::uint64_t> next_{0};
  std::atomic<std::uint64_t> in_flight_{0};
  std::atomic<std::uint64_t> peak_{0};
  std::atomic<std::uint64_t> completed_{0};
};
