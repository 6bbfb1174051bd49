#pragma once

#include "reversi/BasicTypes.hpp"
#include "reversi/Board.hpp"
#include "reversi/Heuristics.hpp"

#include <cstdint>
#include <limits>
#include <random>
#include <string>

namespace reversi {

enum class SearchAlgorithm : int8_t { kMinimax, kAlphaBeta };

struct SearchStats {
  int64_t nodes = 0;    // positions visited, leaves included
  int64_t cutoffs = 0;  // alpha-beta prunes
};

/*
 * Depth-limited game-tree search.
 *
 * minimax() and alphabeta() walk the tree in place on the Board they are given, via play()/pop(),
 * and leave it exactly as they found it. A side with no legal move (while the game is not over)
 * passes without consuming depth.
 *
 * IllegalMoveError and CannotUndoError are never caught here: either one means the move
 * enumeration or the play/pop symmetry is broken.
 */
struct Search {
  static constexpr int kInfinity = std::numeric_limits<int>::max();

  static int minimax(Board& board, int depth, Color max_player, Heuristics::function_t heuristic,
                     SearchStats* stats = nullptr);

  // With alpha = -kInfinity and beta = kInfinity, returns exactly what minimax() returns.
  static int alphabeta(Board& board, int depth, int alpha, int beta, Color max_player,
                       Heuristics::function_t heuristic, SearchStats* stats = nullptr);

  /*
   * Scores each legal move of the side to move at depth - 1 and returns the best one: max score if
   * max_player is to move, min score otherwise. Ties go to the first move in bit-index order, so
   * the result is deterministic.
   *
   * Returns Move::pass() if depth <= 0 or the game is over. Throws util::Exception if the side to
   * move has no legal move: the caller should play(Move::pass()) instead of searching.
   */
  static Move find_best_move(const Board& board, int depth, Color max_player,
                             SearchAlgorithm algorithm, HeuristicKind heuristic,
                             SearchStats* stats = nullptr);

  // Uniformly random legal move of the side to move, or Move::pass() if it has none.
  static Move random_move(std::mt19937& prng, const Board& board);
  static Move random_move(const Board& board);

  // Accepts "minimax", "ab" and "alphabeta". Throws util::CleanException otherwise.
  static SearchAlgorithm parse_algorithm(const std::string& name);
  static const char* to_str(SearchAlgorithm algorithm);
};

}  // namespace reversi
