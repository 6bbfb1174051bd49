#include "reversi/GameParams.hpp"

#include "reversi/Heuristics.hpp"
#include "reversi/Search.hpp"
#include "util/Exceptions.hpp"

namespace reversi {

void GameParams::validate() const {
  get_board_size();
  if (ai != "" && ai != "X" && ai != "O" && ai != "A") {
    throw util::CleanException("Invalid --ai value \"{}\" (expected X, O or A)", ai);
  }
  if (ai_depth <= 0) {
    throw util::CleanException("Invalid --ai-depth {} (must be positive)", ai_depth);
  }
  Search::parse_algorithm(ai_mode);
  Heuristics::parse(ai_heuristic);
}

BoardSize GameParams::get_board_size() const { return to_board_size(board_size); }

SearchPlayer::Params GameParams::get_search_params() const {
  SearchPlayer::Params params;
  params.depth = ai_depth;
  params.algorithm = Search::parse_algorithm(ai_mode);
  params.heuristic = Heuristics::parse(ai_heuristic);
  return params;
}

bool GameParams::is_computer(Color color) const {
  if (ai == "A") return true;
  if (ai == "X") return color == Color::kBlack;
  if (ai == "O") return color == Color::kWhite;
  return false;
}

}  // namespace reversi
