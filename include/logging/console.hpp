#pragma once

#include "util/time.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace logging {

enum class Level { debug, info, warn };

// Console
// Threading model:
// - Any session coroutine (on any reactor thread) may log concurrently
// - Each line is assembled privately and written to std::cerr under one
//   process-wide mutex, so lines from different sessions never interleave
// - debug lines are dropped unless verbose output was enabled
class Console {
public:
  static void SetVerbose(bool on) {
    verbose_flag().store(on, std::memory_order_relaxed);
  }
  static bool Verbose() {
    return verbose_flag().load(std::memory_order_relaxed);
  }

  static bool Enabled(Level level) {
    return level != Level::debug || Verbose();
  }

  static void Write(Level level, std::string_view text) {
    std::string out = timeutil::ClockTime();
    out += LevelTag(level);
    out.append(text);
    out += '\n';
    std::lock_guard<std::mutex> lock(mutex());
    std::cerr << out;
  }

private:
  static const char *LevelTag(Level level) {
    switch (level) {
    case Level::debug:
      return " D ";
    case Level::info:
      return " I ";
    case Level::warn:
      return " W ";
    }
    return " ? ";
  }

  static std::atomic<bool> &verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
  }
  static std::mutex &mutex() {
    static std::mutex m;
    return m;
  }
};

// Line: stream-style builder for a single log line; flushed on destruction.
//   logging::Line(Level::warn, prefix_) << "connect error: " << ec.message();
class Line {
public:
  explicit Line(Level level, std::string_view prefix = {})
      : level_(level), enabled_(Console::Enabled(level)) {
    if (enabled_) {
      oss_ << prefix;
    }
  }

  Line(const Line &) = delete;
  Line &operator=(const Line &) = delete;

  ~Line() {
    if (enabled_) {
      Console::Write(level_, oss_.str());
    }
  }

  template <typename T> Line &operator<<(const T &value) {
    if (enabled_) {
      oss_ << value;
    }
    return *this;
  }

private:
  Level level_;
  bool enabled_;
  std::ostringstream oss_;
};

} // namespace logging
