#pragma once

#include "reversi/AbstractPlayer.hpp"
#include "reversi/Board.hpp"
#include "reversi/PlayerResponse.hpp"
#include "reversi/Search.hpp"

namespace reversi {

/*
 * RandomPlayer always chooses uniformly at random among the set of legal moves, using the default
 * prng of util::Random (seeded by --seed).
 */
class RandomPlayer : public AbstractPlayer {
 public:
  PlayerResponse get_response(const Board& board) override { return Search::random_move(board); }
};

}  // namespace reversi
