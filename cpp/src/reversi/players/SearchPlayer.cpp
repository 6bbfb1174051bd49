#include "reversi/players/SearchPlayer.hpp"

#include "util/LoggingUtil.hpp"

#include <chrono>

namespace reversi {

PlayerResponse SearchPlayer::get_response(const Board& board) {
  auto start = std::chrono::steady_clock::now();

  SearchStats stats;
  Move move = Search::find_best_move(board, params_.depth, get_color(), params_.algorithm,
                                     params_.heuristic, &stats);

  auto elapsed = std::chrono::steady_clock::now() - start;
  int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

  total_stats_.nodes += stats.nodes;
  total_stats_.cutoffs += stats.cutoffs;
  LOG_INFO("{} ({} depth={} heuristic={}) plays {}: nodes={} cutoffs={} time={}ms", get_name(),
           Search::to_str(params_.algorithm), params_.depth,
           Heuristics::to_str(params_.heuristic), move.to_str(), stats.nodes, stats.cutoffs, ms);
  return move;
}

}  // namespace reversi
