#pragma once

#include "reversi/BasicTypes.hpp"
#include "reversi/SaveFile.hpp"
#include "reversi/players/SearchPlayer.hpp"

#include <string>

namespace reversi {

/*
 * Command-line and config-file options of the reversi executable.
 *
 * The same names are accepted as "key=value" lines of a --config file. Values given on the command
 * line take precedence over the file.
 */
struct GameParams {
  static constexpr const char* kDefaultConfigFilename = ".reversirc";

  auto make_options_description();

  // Throws util::CleanException on an out-of-range or unknown value.
  void validate() const;

  // Throws IllegalBoardSizeError.
  BoardSize get_board_size() const;
  SearchPlayer::Params get_search_params() const;

  // Whether color is played by the computer, per --ai.
  bool is_computer(Color color) const;

  int board_size = 8;
  std::string ai;  // "", "X", "O" or "A"
  int ai_depth = 3;
  std::string ai_mode = "minimax";
  std::string ai_heuristic = "default";
  bool random_opponent = false;
  std::string save_file = SaveFile::kDefaultFilename;
  std::string load_file;
  std::string config_file;
};

}  // namespace reversi

#include "inline/reversi/GameParams.inl"
