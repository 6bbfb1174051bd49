#include "reversi/Heuristics.hpp"

#include "util/Exceptions.hpp"

#include <array>

namespace reversi {

int Heuristics::corners_captured(const Board& board, Color max_player) {
  int last = board.dim() - 1;
  const std::array<Move, 4> corners = {Move{0, 0}, Move{last, 0}, Move{0, last}, Move{last, last}};

  int mine = 0;
  int theirs = 0;
  for (const Move& corner : corners) {
    Color c = board.get_player_at(corner.x, corner.y);
    if (c == max_player) {
      mine++;
    } else if (c == ~max_player) {
      theirs++;
    }
  }
  return normalized_difference(mine, theirs);
}

int Heuristics::coin_parity(const Board& board, Color max_player) {
  return normalized_difference(board.popcount(max_player), board.popcount(~max_player));
}

int Heuristics::mobility(const Board& board, Color max_player) {
  return normalized_difference(board.legal_moves(max_player).popcount(),
                               board.legal_moves(~max_player).popcount());
}

int Heuristics::all_in_one(const Board& board, Color max_player) {
  return kCornersWeight * corners_captured(board, max_player) +
         kMobilityWeight * mobility(board, max_player) +
         kCoinsWeight * coin_parity(board, max_player);
}

Heuristics::function_t Heuristics::get(HeuristicKind kind) {
  switch (kind) {
    case HeuristicKind::kCornersCaptured:
      return &corners_captured;
    case HeuristicKind::kCoinParity:
      return &coin_parity;
    case HeuristicKind::kMobility:
      return &mobility;
    case HeuristicKind::kAllInOne:
      return &all_in_one;
  }
  throw util::Exception("Unknown heuristic kind {}", int(kind));
}

HeuristicKind Heuristics::parse(const std::string& name) {
  if (name == "corners_captured") return HeuristicKind::kCornersCaptured;
  if (name == "coin_parity" || name == "other") return HeuristicKind::kCoinParity;
  if (name == "mobility") return HeuristicKind::kMobility;
  if (name == "all_in_one" || name == "default") return HeuristicKind::kAllInOne;
  throw util::CleanException(
    "Unknown heuristic '{}' (expected corners_captured, coin_parity, mobility or all_in_one)",
    name);
}

const char* Heuristics::to_str(HeuristicKind kind) {
  switch (kind) {
    case HeuristicKind::kCornersCaptured:
      return "corners_captured";
    case HeuristicKind::kCoinParity:
      return "coin_parity";
    case HeuristicKind::kMobility:
      return "mobility";
    case HeuristicKind::kAllInOne:
      return "all_in_one";
  }
  return "unknown";
}

int Heuristics::normalized_difference(int mine, int theirs) {
  if (mine + theirs == 0) return 0;
  return 100 * (mine - theirs) / (mine + theirs);
}

}  // namespace reversi
