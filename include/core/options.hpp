#pragma once

#include "core/runner.hpp"
#include "net/url.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <expected>
#include <string>
#include <thread>

struct Options {
  std::string mode = "play";
  std::string address = "127.0.0.1:8083";
  std::uint64_t num = 100;
  std::uint64_t first_id = 0;
  int concurrency = 100;
  std::string user_prefix = "over-";
  std::string password_prefix = "password";
  int connect_timeout_ms = 10000;
  int io_timeout_ms = 10000;
  int activity_timeout_s = 60;
  std::string url;
  int workers = 50;
  int seconds = 30;
  int request_timeout_ms = 10000;
  int threads = static_cast<int>(
      std::max(1u, std::thread::hardware_concurrency()));
  bool verbose = false;
  bool help = false;
};

inline const char *Usage() {
  return "usage: tableflood [options]\n"
         "  -m, --mode play|register|attack   (default play)\n"
         "  -a, --address host:port           game server (default "
         "127.0.0.1:8083)\n"
         "  -n, --num N                       sessions to launch\n"
         "  -c, --concurrency N               sessions in flight\n"
         "      --first-id N                  first session id\n"
         "      --user-prefix S               username prefix\n"
         "      --password-prefix S           password prefix\n"
         "      --connect-timeout-ms N\n"
         "      --io-timeout-ms N\n"
         "      --activity-timeout-s N\n"
         "  -u, --url http://host[:port]/path attack target\n"
         "  -w, --workers N                   attack workers\n"
         "  -t, --seconds N                   attack duration\n"
         "      --request-timeout-ms N\n"
         "      --threads N                   reactor threads\n"
         "  -v, --verbose\n"
         "  -h, --help\n";
}

inline std::expected<Options, std::string> ParseArgs(int argc, char **argv) {
  Options opt;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    const bool has_value = i + 1 < argc;
    if ((a == "-m" || a == "--mode") && has_value)
      opt.mode = argv[++i];
    else if ((a == "-a" || a == "--address") && has_value)
      opt.address = argv[++i];
    else if ((a == "-n" || a == "--num") && has_value)
      opt.num = std::strtoull(argv[++i], nullptr, 10);
    else if ((a == "-c" || a == "--concurrency") && has_value)
      opt.concurrency = std::max(1, std::atoi(argv[++i]));
    else if (a == "--first-id" && has_value)
      opt.first_id = std::strtoull(argv[++i], nullptr, 10);
    else if (a == "--user-prefix" && has_value)
      opt.user_prefix = argv[++i];
    else if (a == "--password-prefix" && has_value)
      opt.password_prefix = argv[++i];
    else if (a == "--connect-timeout-ms" && has_value)
      opt.connect_timeout_ms = std::max(1, std::atoi(argv[++i]));
    else if (a == "--io-timeout-ms" && has_value)
      opt.io_timeout_ms = std::max(1, std::atoi(argv[++i]));
    else if (a == "--activity-timeout-s" && has_value)
      opt.activity_timeout_s = std::max(0, std::atoi(argv[++i]));
    else if ((a == "-u" || a == "--url") && has_value)
      opt.url = argv[++i];
    else if ((a == "-w" || a == "--workers") && has_value)
      opt.workers = std::max(1, std::atoi(argv[++i]));
    else if ((a == "-t" || a == "--seconds") && has_value)
      opt.seconds = std::max(0, std::atoi(argv[++i]));
    else if (a == "--request-timeout-ms" && has_value)
      opt.request_timeout_ms = std::max(1, std::atoi(argv[++i]));
    else if (a == "--threads" && has_value)
      opt.threads = std::max(1, std::atoi(argv[++i]));
    else if (a == "-v" || a == "--verbose")
      opt.verbose = true;
    else if (a == "-h" || a == "--help")
      opt.help = true;
    else
      return std::unexpected("unknown or incomplete option: " + a);
  }
  return opt;
}

inline std::expected<RunOptions, std::string>
MakeRunOptions(const Options &opt) {
  RunOptions ro;
  if (opt.mode == "play") {
    ro.mode = RunMode::play;
  } else if (opt.mode == "register") {
    ro.mode = RunMode::registration;
  } else if (opt.mode == "attack") {
    ro.mode = RunMode::attack;
  } else {
    return std::unexpected("invalid mode (expected play|register|attack): " +
                           opt.mode);
  }

  if (ro.mode == RunMode::attack) {
    auto url = URL::ParseHttpUrl(opt.url);
    if (!url) {
      return std::unexpected(
          "invalid URL (expected http://host[:port]/path): " + opt.url);
    }
    ro.urlHost = url->host;
    ro.urlPort = url->port;
    ro.urlTarget = url->target;
  } else {
    auto hp = URL::ParseHostPort(opt.address);
    if (!hp) {
      return std::unexpected("invalid address (expected host:port): " +
                             opt.address);
    }
    ro.host = hp->host;
    ro.port = hp->port;
  }

  ro.numSessions = opt.num;
  ro.firstId = opt.first_id;
  ro.concurrency = static_cast<std::size_t>(opt.concurrency);
  ro.session.user_prefix = opt.user_prefix;
  ro.session.password_prefix = opt.password_prefix;
  ro.session.timeouts.connect =
      std::chrono::milliseconds(opt.connect_timeout_ms);
  ro.session.timeouts.io = std::chrono::milliseconds(opt.io_timeout_ms);
  ro.session.timeouts.activity = std::chrono::seconds(opt.activity_timeout_s);
  ro.workers = opt.workers;
  ro.seconds = opt.seconds;
  ro.requestTimeout = std::chrono::milliseconds(opt.request_timeout_ms);
  ro.threads = opt.threads;
  return ro;
}
