#include "reversi/AbstractPlayer.hpp"
#include "reversi/Board.hpp"
#include "reversi/GameParams.hpp"
#include "reversi/GameRunner.hpp"
#include "reversi/SaveFile.hpp"
#include "reversi/players/HumanTuiPlayer.hpp"
#include "reversi/players/RandomPlayer.hpp"
#include "reversi/players/SearchPlayer.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"
#include "util/Rendering.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <iostream>
#include <memory>
#include <string>

namespace {

using player_ptr_t = reversi::GameRunner::player_ptr_t;

player_ptr_t make_player(const reversi::GameParams& params, reversi::Color color) {
  player_ptr_t player;
  std::string kind;
  if (!params.is_computer(color)) {
    player = std::make_unique<reversi::HumanTuiPlayer>();
    kind = "Human";
  } else if (params.random_opponent) {
    player = std::make_unique<reversi::RandomPlayer>();
    kind = "Random";
  } else {
    player = std::make_unique<reversi::SearchPlayer>(params.get_search_params());
    kind = "Computer";
  }
  player->set_name(fmt::format("{}-{}", kind, reversi::to_char(color)));
  return player;
}

}  // namespace

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    reversi::GameParams game_params;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    util::Rendering::Params rendering_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help")
                  .add(game_params.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description())
                  .add(rendering_params.make_options_description());

    po::positional_options_description positional;
    positional.add("load-file", 1);

    po::variables_map vm = po2::parse_args(desc, positional, ac, av);

    if (vm.count("help")) {
      std::cout << "Usage: reversi [OPTIONS] [FILENAME]\n\n" << desc << std::endl;
      reversi::HumanTuiPlayer::print_help(std::cout);
      return 0;
    }

    boost::filesystem::path config_path = game_params.config_file;
    const char* default_config = reversi::GameParams::kDefaultConfigFilename;
    if (config_path.empty() && boost::filesystem::exists(default_config)) {
      config_path = default_config;
    }
    if (!config_path.empty()) {
      po2::parse_config_file(desc, config_path, vm);
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);
    util::Rendering::init(rendering_params);
    game_params.validate();

    if (!config_path.empty()) {
      LOG_INFO("Read options from {}", config_path.string());
    }

    reversi::Board board(game_params.get_board_size());
    if (!game_params.load_file.empty()) {
      board = reversi::SaveFile::load(game_params.load_file);
      LOG_INFO("Loaded {}x{} game from {} ({} to move)", board.dim(), board.dim(),
               game_params.load_file, reversi::to_str(board.current_player()));
    }

    reversi::GameRunner runner(board, make_player(game_params, reversi::Color::kBlack),
                               make_player(game_params, reversi::Color::kWhite),
                               game_params.save_file);
    runner.run();
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
