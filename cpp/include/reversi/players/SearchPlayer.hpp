#pragma once

#include "reversi/AbstractPlayer.hpp"
#include "reversi/Board.hpp"
#include "reversi/Heuristics.hpp"
#include "reversi/PlayerResponse.hpp"
#include "reversi/Search.hpp"

namespace reversi {

/*
 * Plays Search::find_best_move() from its own point of view.
 */
class SearchPlayer : public AbstractPlayer {
 public:
  struct Params {
    int depth = 3;
    SearchAlgorithm algorithm = SearchAlgorithm::kMinimax;
    HeuristicKind heuristic = HeuristicKind::kAllInOne;
  };

  explicit SearchPlayer(const Params& params) : params_(params) {}

  PlayerResponse get_response(const Board& board) override;

  const Params& params() const { return params_; }
  const SearchStats& total_stats() const { return total_stats_; }

 private:
  const Params params_;
  SearchStats total_stats_;
};

}  // namespace reversi
