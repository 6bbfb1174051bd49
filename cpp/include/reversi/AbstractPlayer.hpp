#pragma once

#include "reversi/BasicTypes.hpp"
#include "reversi/Board.hpp"
#include "reversi/PlayerResponse.hpp"

#include <string>

namespace reversi {

/*
 * Base class for all players.
 *
 * There are 4 main virtual functions to override:
 *
 * - start_game()
 * - receive_state_change()
 * - get_response()
 * - end_game()
 *
 * receive_state_change() is called after every move, including the player's own moves and the
 * passes recorded automatically by Board::play(). It is not called on undo or restart: the next
 * get_response() call sees the rolled-back Board directly.
 *
 * get_response() is called when it is the player's turn and the player has at least one legal
 * move. The passed-in Board is the runner's own, so players must not keep references to it.
 */
class AbstractPlayer {
 public:
  virtual ~AbstractPlayer() = default;
  void set_name(const std::string& name) { name_ = name; }
  const std::string& get_name() const { return name_; }
  Color get_color() const { return color_; }

  void init_game(Color color) { color_ = color; }

  // start_game() should return false if the player refuses to play the game.
  virtual bool start_game() { return true; }

  virtual void receive_state_change(const Board&, const Move&) {}

  virtual PlayerResponse get_response(const Board& board) = 0;

  virtual void end_game(const Board&) {}

  // GameRunner only redraws the screen before the turn of a human player.
  virtual bool is_human() const { return false; }

 private:
  std::string name_;
  Color color_ = Color::kEmpty;
};

}  // namespace reversi
