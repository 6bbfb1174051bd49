#pragma once

#include "reversi/AbstractPlayer.hpp"
#include "reversi/BasicTypes.hpp"
#include "reversi/Board.hpp"

#include <boost/filesystem.hpp>

#include <array>
#include <cstdint>
#include <iostream>
#include <memory>

namespace reversi {

/*
 * Drives a single game between two players on one Board.
 *
 * Before each turn the runner prints the board and the last few history entries. A side with no
 * legal move (only possible at the start of a loaded position) passes without being asked. The
 * passes recorded automatically by Board::play() are announced.
 */
class GameRunner {
 public:
  using player_ptr_t = std::unique_ptr<AbstractPlayer>;
  using player_array_t = std::array<player_ptr_t, 2>;  // indexed by Color

  static constexpr int kNumRecentMoves = 5;

  struct Result {
    enum end_t : uint8_t { kCompleted, kForfeited, kSaved, kQuit };

    end_t end = kCompleted;
    Color winner = Color::kEmpty;  // kEmpty on a draw, and for kSaved and kQuit
    int black_discs = 0;
    int white_discs = 0;
  };

  GameRunner(const Board& board, player_ptr_t black, player_ptr_t white,
             const boost::filesystem::path& save_path, std::ostream& out = std::cout);

  Result run();

  const Board& board() const { return board_; }

 private:
  AbstractPlayer* player(Color color) const { return players_[static_cast<int>(color)].get(); }
  void display(bool clear) const;
  void print_recent_moves() const;
  void notify(const Move& move);
  void undo();
  Result make_result(Result::end_t end, Color winner) const;

  Board board_;
  player_array_t players_;
  const boost::filesystem::path save_path_;
  std::ostream& out_;
  Move last_move_ = Move::pass();
};

}  // namespace reversi
