#pragma once

#include <cstdint>
#include <string>
#include <variant>

// Wire-level message types for the line-delimited game protocol.
namespace proto {

struct Registration {
  std::string username;
  std::string password;
};

// Action: what a player sends once registered. A fold travels on the wire as
// a bet with a negative amount; here it is its own alternative.
struct Join {};
struct Bet {
  std::int64_t amount = 0;
};
struct Fold {};
using Action = std::variant<Join, Bet, Fold>;

using Request = std::variant<Registration, Action>;

inline constexpr std::int64_t kFoldWireAmount = -1;

inline constexpr const char *kRegisteredType =
    "event_player_leaderboard_entry_start";
inline constexpr const char *kBetTurnType = "action_player_bet";
inline constexpr const char *kGameOverType = "event_game_over";
inline constexpr const char *kLeaderboardEndType =
    "event_player_leaderboard_entry_end";

struct PlayerState {
  std::string player_id;
  std::int64_t chips = 0;
};

// Response: every inbound line. Fields missing on the wire keep their zero
// value; `event` is kept as raw JSON text (empty when absent).
struct Response {
  std::string type;
  std::string event;
  std::int64_t code = 0;
  std::string message;
  std::string game_id;
  std::string stage;
  PlayerState player;
  std::int64_t minimum_bet = 0;
};

enum class ResponseKind {
  registered,
  bet_turn,
  terminal,
  bare_error,
  ambiguous,
  other
};

} // namespace proto
