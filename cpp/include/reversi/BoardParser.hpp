#pragma once

#include "reversi/BasicTypes.hpp"
#include "reversi/Board.hpp"

#include <string>
#include <vector>

namespace reversi {

/*
 * Reads the save-file format written by Board::export_game():
 *
 *   # comments run from '#' to the end of the line; blank lines are ignored
 *   O                      <- side to move
 *   _ _ _ _ _ _ _ _        <- N rows of N cells, N in {6, 8, 10, 12}
 *   ...
 *   1. X f5 O d6           <- optional history, turn numbers strictly sequential
 *   2. X c3 O -1-1         <- -1-1 is a pass
 *   3. X e3                <- the last line may omit white's move
 *
 * Without a history section, the grid is taken as-is and the resulting Board has an empty history.
 * With one, the moves are replayed from the canonical start and the final position must equal the
 * grid and side to move.
 *
 * Automatic passes recorded by Board::play() must appear as -1-1 at their place in the history.
 *
 * Every failure throws ParseError with the 1-based line number.
 */
class BoardParser {
 public:
  static Board parse(const std::string& text);

 private:
  explicit BoardParser(const std::string& text);

  Board run();
  bool next_content_line();
  Color parse_side_to_move();
  BoardSize parse_grid_size();
  void parse_grid(Bitboard& black, Bitboard& white);
  void parse_history_line(Board& board);
  void replay_move(Board& board, Color color, const std::string& token);
  int last_line() const;

  std::vector<std::string> lines_;
  std::vector<std::string> tokens_;
  int num_tokens_ = 0;
  int line_index_ = -1;
  size_t replayed_ = 0;  // history entries matched so far
};

}  // namespace reversi
