#pragma once

#include "core/counters.hpp"
#include "core/isession.hpp"
#include "core/reactor.hpp"
#include "core/session_pool.hpp"
#include "logging/console.hpp"
#include "net/line_transport.hpp"
#include "net/ops.hpp"
#include "sessions/http_attack_worker.hpp"
#include "sessions/player_session.hpp"
#include "util/time.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

// Runner composition/threading overview:
// - Preflight: private io_context on the calling thread; resolves the target
//   and opens one probe connection so an unreachable server fails the run
//   before any session starts
// - Reactor: io_context on `threads` jthreads, hosts every coroutine
// - SessionPool: `concurrency` worker coroutines pulling session ids; the
//   main thread blocks in Wait() until each id has run exactly once
// - Attack: `workers` HttpAttackWorker coroutines on the same pool; the main
//   thread sleeps to the deadline, broadcasts stop, then drains the pool
// - Counters: AtomicCounters shared by all coroutines, printed after join
enum class RunMode { play, registration, attack };

inline const char *RunModeName(RunMode m) {
  switch (m) {
  case RunMode::play:
    return "play";
  case RunMode::registration:
    return "register";
  case RunMode::attack:
    return "attack";
  }
  return "?";
}

struct RunOptions {
  RunMode mode = RunMode::play;
  std::string host = "127.0.0.1";
  std::string port = "8083";
  std::uint64_t numSessions = 100;
  std::uint64_t firstId = 0;
  std::size_t concurrency = 100;
  SessionConfig session;

  std::string urlHost;
  std::string urlPort;
  std::string urlTarget;
  int workers = 50;
  int seconds = 30;
  std::chrono::milliseconds requestTimeout{10000};

  int threads = 1;
};

inline std::expected<netops::Endpoints, std::string>
Preflight(const std::string &host, const std::string &port,
          std::chrono::milliseconds connectTimeout) {
  net::io_context ioc;
  std::expected<netops::Endpoints, std::string> result =
      std::unexpected(std::string("preflight did not run"));
  net::spawn(ioc, [&](net::yield_context yield) {
    tcp::resolver resolver(ioc);
    auto eps = netops::AsyncResolve(resolver, host, port, yield);
    if (!eps) {
      result = std::unexpected("resolve " + host + ":" + port +
                               " error: " + eps.error().message());
      return;
    }
    beast::tcp_stream probe(ioc);
    auto st = netops::AsyncConnect(probe, *eps, connectTimeout, yield);
    if (!st) {
      result = std::unexpected("connect " + host + ":" + port +
                               " error: " + st.error().message());
      return;
    }
    beast::error_code ec;
    probe.socket().shutdown(tcp::socket::shutdown_both, ec);
    (void)ec;
    result = *eps;
  });
  ioc.run();
  return result;
}

// Runs numSessions player sessions (play or register-only) with at most
// `concurrency` in flight; returns once every session has terminated.
inline PoolStats RunPlayers(const RunOptions &opt,
                            const netops::Endpoints &endpoints,
                            ICounters &counters) {
  Reactor reactor;
  reactor.Start(opt.threads);
  SessionConfig cfg = opt.session;
  cfg.register_only = opt.mode == RunMode::registration;
  auto ex = reactor.GetExecutor();

  SessionPool pool(reactor.GetIoContext());
  pool.Start(
      opt.firstId, opt.numSessions, opt.concurrency,
      [&endpoints, &counters, ex, cfg](std::uint64_t id) {
        return std::unique_ptr<ISession>(std::make_unique<PlayerSession>(
            id, cfg, endpoints, std::make_unique<TcpLineTransport>(ex),
            counters));
      },
      /*logProgress=*/true);
  pool.Wait();
  reactor.Join();
  return pool.Stats();
}

// Runs `workers` HTTP workers against one target for `seconds` of wall clock,
// then stops them cooperatively and drains.
inline PoolStats RunAttack(const RunOptions &opt, const AttackTarget &target,
                           ICounters &counters) {
  Reactor reactor;
  reactor.Start(opt.threads);
  std::stop_source stop;
  auto ex = reactor.GetExecutor();
  const auto workers = static_cast<std::uint64_t>(opt.workers);

  SessionPool pool(reactor.GetIoContext());
  pool.Start(0, workers, workers,
             [&target, &counters, &opt, &stop, ex](std::uint64_t id) {
               return std::unique_ptr<ISession>(
                   std::make_unique<HttpAttackWorker>(
                       static_cast<int>(id), ex, target, opt.requestTimeout,
                       stop.get_token(), counters));
             });

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(opt.seconds);
  std::this_thread::sleep_until(deadline);
  stop.request_stop();

  logging::Line(logging::Level::info)
      << "Attack duration ended. Waiting for workers to finish...";
  pool.Wait();
  reactor.Join();
  return pool.Stats();
}

inline void PrintBanner(std::ostream &os, const RunOptions &opt) {
  os << "--- tableflood (" << RunModeName(opt.mode) << ") ---\n";
  if (opt.mode == RunMode::attack) {
    os << "Target URL: http://" << opt.urlHost << ":" << opt.urlPort
       << opt.urlTarget << "\n"
       << "Concurrent attackers: " << opt.workers << "\n"
       << "Attack duration: " << opt.seconds << " seconds\n";
  } else {
    os << "Target TCP server: " << opt.host << ":" << opt.port << "\n"
       << "Players to create: " << opt.numSessions << " (ids from "
       << opt.firstId << ")\n"
       << "Concurrency level: " << opt.concurrency << "\n";
  }
  os << "Reactor threads: " << opt.threads << "\n"
     << "-----------------------------------------\n";
}

inline int Run(const RunOptions &opt) {
  PrintBanner(std::cout, opt);
  AtomicCounters counters;
  const auto started = std::chrono::steady_clock::now();

  if (opt.mode == RunMode::attack) {
    auto endpoints =
        Preflight(opt.urlHost, opt.urlPort, opt.requestTimeout);
    if (!endpoints) {
      std::cerr << "Cannot reach attack target: " << endpoints.error() << "\n";
      return 1;
    }
    AttackTarget target{.host = opt.urlHost,
                        .port = opt.urlPort,
                        .target = opt.urlTarget,
                        .endpoints = *endpoints};
    const PoolStats stats = RunAttack(opt, target, counters);
    const auto snap = counters.Snapshot();
    std::cout << "-----------------------------------------\n"
              << "Attack finished.\n"
              << "Duration: "
              << timeutil::FormatDuration(std::chrono::steady_clock::now() -
                                          started)
              << "\n"
              << "Workers drained: " << stats.completed << "\n";
    PrintAttackSummary(std::cout, snap);
    return 0;
  }

  auto endpoints = Preflight(opt.host, opt.port, opt.session.timeouts.connect);
  if (!endpoints) {
    std::cerr << "Cannot reach game server: " << endpoints.error() << "\n";
    return 1;
  }
  const PoolStats stats = RunPlayers(opt, *endpoints, counters);
  const auto snap = counters.Snapshot();
  std::cout << "-----------------------------------------\n"
            << "All player session attempts completed.\n"
            << "Duration: "
            << timeutil::FormatDuration(std::chrono::steady_clock::now() -
                                        started)
            << "\n"
            << "Peak sessions in flight: " << stats.peak_in_flight << "\n";
  PrintSessionSummary(std::cout, snap);
  std::cout << "Total player sessions attempted: " << stats.launched << "\n";
  return 0;
}
