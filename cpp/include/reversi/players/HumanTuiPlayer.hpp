#pragma once

#include "reversi/AbstractPlayer.hpp"
#include "reversi/BasicTypes.hpp"
#include "reversi/Board.hpp"
#include "reversi/PlayerResponse.hpp"

#include <iostream>
#include <string>

namespace reversi {

/*
 * Reads commands from a text stream, one per line.
 *
 * Invalid input, illegal moves, "?" and "r" are handled here by reprompting, so get_response() only
 * returns moves that are legal on the passed-in Board, or one of the game-control commands. End of
 * input is treated as "q".
 */
class HumanTuiPlayer : public AbstractPlayer {
 public:
  HumanTuiPlayer(std::istream& in = std::cin, std::ostream& out = std::cout);

  void receive_state_change(const Board&, const Move& move) override { last_move_ = move; }
  PlayerResponse get_response(const Board& board) override;
  void end_game(const Board& board) override;
  bool is_human() const override { return true; }

  /*
   * Commands, after surrounding whitespace is stripped:
   *
   * d3       play a move (column letter, 1-based row; upper-case letters accepted)
   * u        undo back to my previous turn
   * restart  restart from the initial position
   * s, sh    save the game and quit
   * ff       forfeit
   * q        quit without saving
   * r        rules
   * ?        help
   *
   * Anything else, including the pass sentinel "-1-1" and cells outside a dim x dim board, is
   * kInvalidResponse. Legality is not checked here.
   */
  static PlayerResponse parse_command(const std::string& input, int dim);

  static void print_help(std::ostream& os);
  static void print_rules(std::ostream& os);

 private:
  std::istream& in_;
  std::ostream& out_;
  Move last_move_ = Move::pass();
};

}  // namespace reversi
