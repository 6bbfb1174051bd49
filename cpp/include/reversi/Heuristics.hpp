#pragma once

#include "reversi/BasicTypes.hpp"
#include "reversi/Board.hpp"

#include <cstdint>
#include <string>

namespace reversi {

enum class HeuristicKind : int8_t { kCornersCaptured, kCoinParity, kMobility, kAllInOne };

/*
 * Static evaluation functions. Each scores board from the point of view of max_player: higher is
 * better for max_player.
 *
 * The first three return 100 * (mine - theirs) / (mine + theirs), truncated toward zero, over
 * their respective counts, and 0 when both counts are zero. So they are bounded by [-100, 100]
 * and are exactly 0 on a tie.
 */
struct Heuristics {
  using function_t = int (*)(const Board&, Color max_player);

  static constexpr int kCornersWeight = 10;
  static constexpr int kMobilityWeight = 4;
  static constexpr int kCoinsWeight = 1;

  // Over the four corner cells.
  static int corners_captured(const Board& board, Color max_player);

  // Over all discs.
  static int coin_parity(const Board& board, Color max_player);

  // Over the number of legal moves of each side.
  static int mobility(const Board& board, Color max_player);

  // kCornersWeight * corners + kMobilityWeight * mobility + kCoinsWeight * coins
  static int all_in_one(const Board& board, Color max_player);

  static function_t get(HeuristicKind kind);

  /*
   * Accepts "corners_captured", "coin_parity", "mobility" and "all_in_one", as well as the
   * aliases "default" (all_in_one) and "other" (coin_parity).
   *
   * Throws util::CleanException on an unknown name.
   */
  static HeuristicKind parse(const std::string& name);
  static const char* to_str(HeuristicKind kind);

 private:
  static int normalized_difference(int mine, int theirs);
};

}  // namespace reversi
