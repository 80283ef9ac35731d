#pragma once

#include <atomic>
#include <cstdint>
#include <ostream>

// ICounters: sink for per-session outcomes. Sessions and attack workers only
// ever increment; the runner reads a snapshot once all of them have joined.
class ICounters {
public:
  virtual ~ICounters() = default;

  virtual void RegistrationSucceeded() = 0;
  virtual void RegistrationFailed() = 0;
  virtual void GameJoined() = 0;
  virtual void AllInMade() = 0;
  virtual void FoldMade() = 0;

  virtual void RequestSent() = 0;
  virtual void RequestSucceeded() = 0;
  virtual void RequestFailed() = 0;
};

struct CounterSnapshot {
  std::uint64_t registrations_ok = 0;
  std::uint64_t registrations_failed = 0;
  std::uint64_t games_joined = 0;
  std::uint64_t all_ins = 0;
  std::uint64_t folds = 0;
  std::uint64_t requests_sent = 0;
  std::uint64_t requests_ok = 0;
  std::uint64_t requests_failed = 0;
};

// AtomicCounters
// Threading model:
// - Incremented concurrently from every reactor thread with relaxed
//   fetch_add; there is no ordering relation between counters
// - Snapshot() is meant to be taken after the reactor has been joined, which
//   already provides the happens-before edge
class AtomicCounters final : public ICounters {
public:
  void RegistrationSucceeded() override { Bump(registrations_ok_); }
  void RegistrationFailed() override { Bump(registrations_failed_); }
  void GameJoined() override { Bump(games_joined_); }
  void AllInMade() override { Bump(all_ins_); }
  void FoldMade() override { Bump(folds_); }

  void RequestSent() override { Bump(requests_sent_); }
  void RequestSucceeded() override { Bump(requests_ok_); }
  void RequestFailed() override { Bump(requests_failed_); }

  CounterSnapshot Snapshot() const {
    return CounterSnapshot{
        .registrations_ok = Load(registrations_ok_),
        .registrations_failed = Load(registrations_failed_),
        .games_joined = Load(games_joined_),
        .all_ins = Load(all_ins_),
        .folds = Load(folds_),
        .requests_sent = Load(requests_sent_),
        .requests_ok = Load(requests_ok_),
        .requests_failed = Load(requests_failed_)};
  }

private:
  using Counter = std::atomic<std::uint64_t>;

  static void Bump(Counter &c) { c.fetch_add(1, std::memory_order_relaxed); }
  static std::uint64_t Load(const Counter &c) {
    return c.load(std::memory_order_relaxed);
  }

  Counter registrations_ok_{0};
  Counter registrations_failed_{0};
  Counter games_joined_{0};
  Counter all_ins_{0};
  Counter folds_{0};
  Counter requests_sent_{0};
  Counter requests_ok_{0};
  Counter requests_failed_{0};
};

inline void PrintSessionSummary(std::ostream &os, const CounterSnapshot &s) {
  os << "Successful registrations: " << s.registrations_ok << "\n"
     << "Failed registrations: " << s.registrations_failed << "\n"
     << "Games joined: " << s.games_joined << "\n"
     << "All-in bets made: " << s.all_ins << "\n"
     << "Folds made: " << s.folds << "\n";
}

inline void PrintAttackSummary(std::ostream &os, const CounterSnapshot &s) {
  os << "Total requests sent: " << s.requests_sent << "\n"
     << "Successful hits (200 OK): " << s.requests_ok << "\n"
     << "Failed hits (errors or non-200): " << s.requests_failed << "\n";
}
