#include "reversi/Search.hpp"

#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <algorithm>
#include <vector>

namespace reversi {

int Search::minimax(Board& board, int depth, Color max_player, Heuristics::function_t heuristic,
                    SearchStats* stats) {
  if (stats) stats->nodes++;
  if (depth <= 0 || board.is_game_over()) {
    return heuristic(board, max_player);
  }

  Color player = board.current_player();
  Bitboard moves = board.legal_moves(player);
  if (moves.empty()) {
    board.play(Move::pass());
    int score = minimax(board, depth, max_player, heuristic, stats);
    board.pop();
    return score;
  }

  bool maximizing = player == max_player;
  int best = maximizing ? -kInfinity : kInfinity;
  for (const Move& move : moves.set_cells()) {
    board.play(move);
    int score = minimax(board, depth - 1, max_player, heuristic, stats);
    board.pop();
    best = maximizing ? std::max(best, score) : std::min(best, score);
  }
  return best;
}

int Search::alphabeta(Board& board, int depth, int alpha, int beta, Color max_player,
                      Heuristics::function_t heuristic, SearchStats* stats) {
  if (stats) stats->nodes++;
  if (depth <= 0 || board.is_game_over()) {
    return heuristic(board, max_player);
  }

  Color player = board.current_player();
  Bitboard moves = board.legal_moves(player);
  if (moves.empty()) {
    board.play(Move::pass());
    int score = alphabeta(board, depth, alpha, beta, max_player, heuristic, stats);
    board.pop();
    return score;
  }

  if (player == max_player) {
    int value = -kInfinity;
    for (const Move& move : moves.set_cells()) {
      board.play(move);
      int score = alphabeta(board, depth - 1, alpha, beta, max_player, heuristic, stats);
      value = std::max(value, score);
      board.pop();
      alpha = std::max(alpha, value);
      if (beta <= alpha) {
        if (stats) stats->cutoffs++;
        break;
      }
    }
    return value;
  } else {
    int value = kInfinity;
    for (const Move& move : moves.set_cells()) {
      board.play(move);
      int score = alphabeta(board, depth - 1, alpha, beta, max_player, heuristic, stats);
      value = std::min(value, score);
      board.pop();
      beta = std::min(beta, value);
      if (beta <= alpha) {
        if (stats) stats->cutoffs++;
        break;
      }
    }
    return value;
  }
}

Move Search::find_best_move(const Board& board, int depth, Color max_player,
                            SearchAlgorithm algorithm, HeuristicKind heuristic,
                            SearchStats* stats) {
  if (depth <= 0 || board.is_game_over()) {
    return Move::pass();
  }

  Color player = board.current_player();
  std::vector<Move> moves = board.legal_moves(player).set_cells();
  if (moves.empty()) {
    throw util::Exception("find_best_move(): {} has no legal move and must pass",
                          reversi::to_str(player));
  }

  Heuristics::function_t fn = Heuristics::get(heuristic);
  bool maximizing = player == max_player;

  Board scratch(board);
  Move best_move = moves[0];
  int best_score = 0;
  bool first = true;
  for (const Move& move : moves) {
    scratch.play(move);
    int score = algorithm == SearchAlgorithm::kMinimax
                  ? minimax(scratch, depth - 1, max_player, fn, stats)
                  : alphabeta(scratch, depth - 1, -kInfinity, kInfinity, max_player, fn, stats);
    scratch.pop();

    LOG_DEBUG("find_best_move(): {} {} scores {}", reversi::to_str(player), move.to_str(), score);
    if (first || (maximizing ? score > best_score : score < best_score)) {
      best_move = move;
      best_score = score;
      first = false;
    }
  }

  LOG_DEBUG("find_best_move(): {} depth={} algorithm={} heuristic={} -> {} ({})",
            reversi::to_str(player), depth, to_str(algorithm), Heuristics::to_str(heuristic),
            best_move.to_str(), best_score);
  return best_move;
}

Move Search::random_move(std::mt19937& prng, const Board& board) {
  std::vector<Move> moves = board.legal_moves().set_cells();
  if (moves.empty()) return Move::pass();
  return util::Random::choice(prng, moves);
}

Move Search::random_move(const Board& board) {
  return random_move(util::Random::default_prng(), board);
}

SearchAlgorithm Search::parse_algorithm(const std::string& name) {
  if (name == "minimax") return SearchAlgorithm::kMinimax;
  if (name == "ab" || name == "alphabeta") return SearchAlgorithm::kAlphaBeta;
  throw util::CleanException("Unknown search algorithm '{}' (expected minimax or ab)", name);
}

const char* Search::to_str(SearchAlgorithm algorithm) {
  switch (algorithm) {
    case SearchAlgorithm::kMinimax:
      return "minimax";
    case SearchAlgorithm::kAlphaBeta:
      return "alphabeta";
  }
  return "unknown";
}

}  // namespace reversi
