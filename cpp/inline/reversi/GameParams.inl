#include "reversi/GameParams.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace reversi {

inline auto GameParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Game options");

  return desc
    .template add_option<"size", 's'>(po::value<int>(&board_size)->default_value(board_size),
                                      "board size: 6, 8, 10 or 12")
    .template add_option<"ai", 'a'>(
      po::value<std::string>(&ai)->implicit_value("X"),
      "let the computer play X (black), O (white) or A (both). Without a value, plays X")
    .template add_option<"ai-depth">(po::value<int>(&ai_depth)->default_value(ai_depth),
                                     "search depth of the computer player")
    .template add_option<"ai-mode">(po::value<std::string>(&ai_mode)->default_value(ai_mode),
                                    "search algorithm: minimax, ab or alphabeta")
    .template add_option<"ai-heuristic">(
      po::value<std::string>(&ai_heuristic)->default_value(ai_heuristic),
      "evaluation function: corners_captured, coin_parity, mobility, all_in_one, default or "
      "other")
    .template add_option<"random-opponent">(
      po::bool_switch(&random_opponent),
      "the computer plays uniformly random legal moves instead of searching")
    .template add_option<"save-file">(po::value<std::string>(&save_file)->default_value(save_file),
                                      "where the s command saves the game")
    .template add_option<"load-file">(po::value<std::string>(&load_file),
                                      "resume from a save file. Can also be passed positionally")
    .template add_option<"config">(po::value<std::string>(&config_file),
                                   "read options from this key=value file (default: .reversirc "
                                   "in the working directory, if present)");
}

}  // namespace reversi
