#pragma once

// Boost 1.74 asio/awaitable.hpp uses std::exchange without including <utility>.
#include <utility>
#include <boost/asio/spawn.hpp>

class ISession {
public:
  virtual ~ISession() = default;
  virtual void Run(boost::asio::yield_context yield) = 0;
};

// ISession: minimal interface to run heterogeneous units of load (player
// sessions, HTTP attack workers) polymorphically. The pool drives Run() on a
// reactor coroutine; returning from Run() means the unit has terminated and
// released everything it owned.
