#pragma once

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>.
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <optional>
#include <thread>
#include <vector>

namespace net = boost::asio;

// Reactor
// Threading model:
// - Owns a single io_context shared by every session and attack worker
// - Runs io_context::run() on N std::jthread workers; sessions execute as
//   stackful coroutines on these threads, each on its own strand
// - Join() drops the work guard and waits for the context to run out of
//   work, i.e. for every spawned coroutine to return
class Reactor {
public:
  Reactor() = default;

  Reactor(const Reactor &) = delete;
  Reactor &operator=(const Reactor &) = delete;

  net::io_context &GetIoContext() { return ioc_; }
  net::any_io_executor GetExecutor() { return ioc_.get_executor(); }

  void Start(int numThreads = 1) {
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    if (numThreads < 1) {
      numThreads = 1;
    }
    threads_.reserve(static_cast<std::size_t>(numThreads));
    for (int i = 0; i < numThreads; ++i) {
      threads_.emplace_back([this] { ioc_.run(); });
    }
  }

  void Join() {
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
    for (auto &t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    threads_.clear();
  }

  void Stop() {
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
    ioc_.stop();
  }

  ~Reactor() {
    Stop();
    Join();
  }

private:
  net::io_context ioc_;
  std::vector<std::jthread> threads_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};
