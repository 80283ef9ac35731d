#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <optional>
#include <string>

namespace URL {

struct UrlParts {
  std::string scheme;
  std::string host;
  std::string port;
  std::string target;
};

struct HostPort {
  std::string host;
  std::string port;
};

// "host:port" or "[v6addr]:port"; the port is mandatory.
inline std::optional<HostPort> ParseHostPort(const std::string &s) {
  std::string host;
  std::string port;
  if (!s.empty() && s.front() == '[') {
    auto close = s.find(']');
    if (close == std::string::npos || close + 1 >= s.size() ||
        s[close + 1] != ':') {
      return std::nullopt;
    }
    host = s.substr(1, close - 1);
    port = s.substr(close + 2);
  } else {
    auto colon = s.rfind(':');
    if (colon == std::string::npos) {
      return std::nullopt;
    }
    host = s.substr(0, colon);
    port = s.substr(colon + 1);
  }
  if (host.empty() || port.empty() ||
      port.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  return HostPort{.host = host, .port = port};
}

// Plain http:// only; the attack target is never TLS.
inline std::optional<UrlParts> ParseHttpUrl(const std::string &url) {
  if (!boost::algorithm::istarts_with(url, "http://")) {
    return std::nullopt;
  }
  std::string rest = url.substr(7);
  auto slash = rest.find('/');
  std::string hostport =
      slash == std::string::npos ? rest : rest.substr(0, slash);
  std::string target = slash == std::string::npos ? "/" : rest.substr(slash);
  std::string host = hostport;
  std::string port = "80";
  auto colon = hostport.find(':');
  if (colon != std::string::npos) {
    host = hostport.substr(0, colon);
    port = hostport.substr(colon + 1);
  }
  if (host.empty() || port.empty()) {
    return std::nullopt;
  }
  return UrlParts{
      .scheme = "http", .host = host, .port = port, .target = target};
}

} // namespace URL
