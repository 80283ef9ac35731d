#include "core/reactor.hpp"
#include "core/session_pool.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>

using namespace std::chrono_literals;

namespace {

// Records which ids ran and how many were inside Run() at once; holds the
// slot for a short timer so sessions overlap.
struct Ledger {
  std::mutex mu;
  std::map<std::uint64_t, int> runs;
  std::atomic<int> active{0};
  std::atomic<int> max_active{0};
};

class SleepySession : public ISession {
public:
  SleepySession(std::uint64_t id, net::io_context &ioc, Ledger &ledger,
                std::chrono::milliseconds hold, bool throws = false)
      : id_(id), ioc_(ioc), ledger_(ledger), hold_(hold), throws_(throws) {}

  void Run(net::yield_context yield) override {
    const int now = ++ledger_.active;
    int seen = ledger_.max_active.load();
    while (now > seen && !ledger_.max_active.compare_exchange_weak(seen, now)) {
    }
    {
      std::lock_guard<std::mutex> lock(ledger_.mu);
      ++ledger_.runs[id_];
    }
    net::steady_timer t(ioc_);
    t.expires_after(hold_);
    boost::system::error_code ec;
    t.async_wait(yield[ec]);
    --ledger_.active;
    if (throws_) {
      throw std::runtime_error("session blew up");
    }
  }

private:
  std::uint64_t id_;
  net::io_context &ioc_;
  Ledger &ledger_;
  std::chrono::milliseconds hold_;
  bool throws_;
};

PoolStats RunPool(std::uint64_t first, std::uint64_t total,
                  std::size_t concurrency, Ledger &ledger,
                  std::chrono::milliseconds hold = 2ms,
                  std::uint64_t throwing_id = ~0ull) {
  Reactor reactor;
  reactor.Start(4);
  SessionPool pool(reactor.GetIoContext());
  auto &ioc = reactor.GetIoContext();
  pool.Start(first, total, concurrency, [&](std::uint64_t id) {
    return std::unique_ptr<ISession>(std::make_unique<SleepySession>(
        id, ioc, ledger, hold, id == throwing_id));
  });
  pool.Wait();
  reactor.Join();
  return pool.Stats();
}

} // namespace

TEST(SessionPool, RunsEveryIdExactlyOnce) {
  Ledger ledger;
  const PoolStats stats = RunPool(1000, 200, 7, ledger);

  EXPECT_EQ(stats.launched, 200u);
  EXPECT_EQ(stats.completed, 200u);
  ASSERT_EQ(ledger.runs.size(), 200u);
  EXPECT_EQ(ledger.runs.begin()->first, 1000u);
  EXPECT_EQ(ledger.runs.rbegin()->first, 1199u);
  for (const auto &[id, count] : ledger.runs) {
    EXPECT_EQ(count, 1) << "id " << id;
  }
}

TEST(SessionPool, NeverExceedsConcurrencyBound) {
  Ledger ledger;
  const PoolStats stats = RunPool(0, 60, 5, ledger, 15ms);

  EXPECT_LE(ledger.max_active.load(), 5);
  EXPECT_LE(stats.peak_in_flight, 5u);
  EXPECT_GE(stats.peak_in_flight, 2u);
  EXPECT_EQ(ledger.active.load(), 0);
}

TEST(SessionPool, BoundLargerThanTotal) {
  Ledger ledger;
  const PoolStats stats = RunPool(0, 3, 100, ledger);

  EXPECT_EQ(stats.completed, 3u);
  EXPECT_LE(stats.peak_in_flight, 3u);
  EXPECT_EQ(ledger.runs.size(), 3u);
}

TEST(SessionPool, SingleSlotRunsSequentially) {
  Ledger ledger;
  const PoolStats stats = RunPool(0, 20, 1, ledger);

  EXPECT_EQ(ledger.max_active.load(), 1);
  EXPECT_EQ(stats.peak_in_flight, 1u);
  EXPECT_EQ(stats.completed, 20u);
}

TEST(SessionPool, ZeroSessionsReturnsImmediately) {
  Ledger ledger;
  const PoolStats stats = RunPool(0, 0, 8, ledger);

  EXPECT_EQ(stats.launched, 0u);
  EXPECT_EQ(stats.completed, 0u);
  EXPECT_TRUE(ledger.runs.empty());
}

TEST(SessionPool, ThrowingSessionIsStillAccountedFor) {
  Ledger ledger;
  const PoolStats stats = RunPool(0, 30, 4, ledger, 1ms, /*throwing_id=*/11);

  EXPECT_EQ(stats.completed, 30u);
  EXPECT_EQ(ledger.runs.size(), 30u);
  EXPECT_EQ(ledger.active.load(), 0);
}
