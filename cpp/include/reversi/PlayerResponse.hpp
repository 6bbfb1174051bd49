#pragma once

#include "reversi/BasicTypes.hpp"

#include <cstdint>

namespace reversi {

/*
 * What a player wants to do on its turn. Only kMakeMove carries a Move.
 *
 * Non-human players only ever return kMakeMove. kHelp, kRules and kInvalidResponse are produced
 * by HumanTuiPlayer::parse_command() and handled inside HumanTuiPlayer, so GameRunner never sees
 * them.
 */
class PlayerResponse {
 public:
  enum response_type_t : uint8_t {
    kInvalidResponse,
    kMakeMove,
    kUndo,
    kRestart,
    kSaveAndQuit,
    kForfeit,
    kQuit,
    kHelp,
    kRules
  };

  PlayerResponse(const Move& move) : move_(move), type_(kMakeMove) {}

  static PlayerResponse undo() { return PlayerResponse(kUndo); }
  static PlayerResponse restart() { return PlayerResponse(kRestart); }
  static PlayerResponse save_and_quit() { return PlayerResponse(kSaveAndQuit); }
  static PlayerResponse forfeit() { return PlayerResponse(kForfeit); }
  static PlayerResponse quit() { return PlayerResponse(kQuit); }
  static PlayerResponse help() { return PlayerResponse(kHelp); }
  static PlayerResponse rules() { return PlayerResponse(kRules); }
  static PlayerResponse invalid() { return PlayerResponse(kInvalidResponse); }

  response_type_t type() const { return type_; }
  const Move& get_move() const { return move_; }

  bool operator==(const PlayerResponse&) const = default;

 private:
  explicit PlayerResponse(response_type_t type) : type_(type) {}

  Move move_;
  response_type_t type_ = kInvalidResponse;
};

}  // namespace reversi
