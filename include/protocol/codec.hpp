#pragma once

#include "core/message.hpp"
#include <algorithm>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

// namespace codec: JSON line encoding of requests and decoding of server
// responses. One message per line; the transport owns the '\n' terminator.
namespace codec {

using json = nlohmann::ordered_json;

// Deepest array/object nesting accepted in an inbound line. Serializing a
// value recurses once per level on the session coroutine's small stack.
constexpr int kMaxNestingDepth = 256;

struct DecodeError {
  std::string reason;
};

inline json ActionToJson(const proto::Action &action) {
  return std::visit(
      [](const auto &a) -> json {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, proto::Join>) {
          return json{{"action", "join"}};
        } else if constexpr (std::is_same_v<T, proto::Bet>) {
          return json{{"action", "bet"}, {"amount", a.amount}};
        } else {
          return json{{"action", "bet"}, {"amount", proto::kFoldWireAmount}};
        }
      },
      action);
}

inline std::string Encode(const proto::Request &request) {
  json j;
  if (const auto *reg = std::get_if<proto::Registration>(&request)) {
    j = json{{"username", reg->username}, {"password", reg->password}};
  } else {
    j = ActionToJson(std::get<proto::Action>(request));
  }
  // Invalid UTF-8 in a configured prefix becomes U+FFFD instead of throwing.
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

namespace detail {

// Field readers: absent or null keeps the zero value, a present field of the
// wrong JSON type is a decode error.
inline bool ReadString(const json &obj, const char *key, std::string &out,
                       std::string &err) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    err = std::string("field '") + key + "' is not a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

inline bool ReadInt(const json &obj, const char *key, std::int64_t &out,
                    std::string &err) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number_integer()) {
    err = std::string("field '") + key + "' is not an integer";
    return false;
  }
  out = it->get<std::int64_t>();
  return true;
}

inline bool ReadObject(const json &obj, const char *key, const json *&out,
                       std::string &err) {
  out = nullptr;
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return true;
  }
  if (!it->is_object()) {
    err = std::string("field '") + key + "' is not an object";
    return false;
  }
  out = &*it;
  return true;
}

// Bracket depth of a JSON text, ignoring brackets inside string literals.
// Stops counting once `limit` is exceeded.
inline int NestingDepth(std::string_view text, int limit) {
  int depth = 0;
  int deepest = 0;
  bool in_string = false;
  bool escaped = false;
  for (char c : text) {
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    switch (c) {
    case '"':
      in_string = true;
      break;
    case '[':
    case '{':
      deepest = std::max(deepest, ++depth);
      if (deepest > limit) {
        return deepest;
      }
      break;
    case ']':
    case '}':
      --depth;
      break;
    default:
      break;
    }
  }
  return deepest;
}

} // namespace detail

inline std::expected<proto::Response, DecodeError> Decode(std::string_view line) {
  if (detail::NestingDepth(line, kMaxNestingDepth) > kMaxNestingDepth) {
    return std::unexpected(DecodeError{"nesting too deep"});
  }
  json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    return std::unexpected(DecodeError{"malformed JSON"});
  }
  if (!j.is_object()) {
    return std::unexpected(DecodeError{"top-level value is not an object"});
  }

  proto::Response resp;
  std::string err;
  const json *state = nullptr;
  const json *player = nullptr;
  bool ok = detail::ReadString(j, "type", resp.type, err) &&
            detail::ReadInt(j, "code", resp.code, err) &&
            detail::ReadString(j, "message", resp.message, err) &&
            detail::ReadString(j, "game_id", resp.game_id, err) &&
            detail::ReadString(j, "stage", resp.stage, err) &&
            detail::ReadInt(j, "minimum_bet", resp.minimum_bet, err) &&
            detail::ReadObject(j, "state", state, err);
  if (ok && state != nullptr) {
    ok = detail::ReadObject(*state, "player", player, err);
  }
  if (ok && player != nullptr) {
    ok = detail::ReadString(*player, "player_id", resp.player.player_id,
                            err) &&
         detail::ReadInt(*player, "chips", resp.player.chips, err);
  }
  if (!ok) {
    return std::unexpected(DecodeError{std::move(err)});
  }
  if (auto it = j.find("event"); it != j.end() && !it->is_null()) {
    resp.event =
        it->dump(-1, ' ', false, json::error_handler_t::replace);
  }
  return resp;
}

inline proto::ResponseKind Classify(const proto::Response &resp) {
  using proto::ResponseKind;
  if (resp.type.empty()) {
    return resp.code != 0 ? ResponseKind::bare_error : ResponseKind::ambiguous;
  }
  if (resp.type == proto::kRegisteredType) {
    return ResponseKind::registered;
  }
  if (resp.type == proto::kBetTurnType) {
    return ResponseKind::bet_turn;
  }
  if (resp.type == proto::kGameOverType ||
      resp.type == proto::kLeaderboardEndType) {
    return ResponseKind::terminal;
  }
  return ResponseKind::other;
}

} // namespace codec
