#include "reversi/GameRunner.hpp"

#include "reversi/SaveFile.hpp"
#include "util/CppUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Rendering.hpp"
#include "util/ScreenUtil.hpp"

#include <fmt/format.h>

#include <vector>

namespace reversi {

GameRunner::GameRunner(const Board& board, player_ptr_t black, player_ptr_t white,
                       const boost::filesystem::path& save_path, std::ostream& out)
    : board_(board), save_path_(save_path), out_(out) {
  players_[static_cast<int>(Color::kBlack)] = std::move(black);
  players_[static_cast<int>(Color::kWhite)] = std::move(white);

  if (!board_.history().empty()) {
    last_move_ = board_.history().back().move;
  }
}

GameRunner::Result GameRunner::run() {
  for (Color color : {Color::kBlack, Color::kWhite}) {
    player(color)->init_game(color);
    if (!player(color)->start_game()) {
      throw util::CleanException("{} refused to play {}", player(color)->get_name(),
                                 to_str(color));
    }
  }
  LOG_INFO("Starting {}x{} game: {} (X) vs {} (O)", board_.dim(), board_.dim(),
           player(Color::kBlack)->get_name(), player(Color::kWhite)->get_name());

  while (!board_.is_game_over()) {
    Color color = board_.current_player();
    AbstractPlayer* p = player(color);

    if (!board_.has_legal_move(color)) {
      out_ << fmt::format("{} has no legal move and passes.\n", p->get_name());
      board_.play(Move::pass());
      notify(Move::pass());
      continue;
    }

    display(p->is_human());

    PlayerResponse response = p->get_response(board_);
    switch (response.type()) {
      case PlayerResponse::kMakeMove: {
        const Move& move = response.get_move();
        PlayOutcome outcome = board_.play(move);
        LOG_INFO("{} ({}) plays {}", p->get_name(), to_char(color), move.to_str());
        notify(move);
        if (outcome == PlayOutcome::kPassed) {
          out_ << fmt::format("{} has no legal move and passes. {} plays again.\n",
                              player(~color)->get_name(), p->get_name());
          notify(Move::pass());
        }
        break;
      }
      case PlayerResponse::kUndo:
        undo();
        break;
      case PlayerResponse::kRestart:
        LOG_INFO("{} restarts the game", p->get_name());
        board_.restart();
        last_move_ = Move::pass();
        break;
      case PlayerResponse::kSaveAndQuit:
        SaveFile::save(board_, save_path_);
        LOG_INFO("Saved game to {}", save_path_.string());
        out_ << fmt::format("Game saved to {}\n", save_path_.string());
        return make_result(Result::kSaved, Color::kEmpty);
      case PlayerResponse::kForfeit:
        LOG_INFO("{} forfeits", p->get_name());
        out_ << fmt::format("{} forfeits. {} wins!\n", p->get_name(), player(~color)->get_name());
        return make_result(Result::kForfeited, ~color);
      case PlayerResponse::kQuit:
        LOG_INFO("{} quits", p->get_name());
        return make_result(Result::kQuit, Color::kEmpty);
      default:
        throw util::Exception("Unexpected response type {} from {}", int(response.type()),
                              p->get_name());
    }
  }

  display(false);
  for (Color color : {Color::kBlack, Color::kWhite}) {
    player(color)->end_game(board_);
  }

  Result result = make_result(Result::kCompleted, board_.winner());
  out_ << fmt::format("Final score: X {} - O {}\n", result.black_discs, result.white_discs);
  if (result.winner == Color::kEmpty) {
    out_ << "Draw!\n";
  } else {
    out_ << fmt::format("Winner: {} ({})\n", player(result.winner)->get_name(),
                        to_char(result.winner));
  }
  LOG_INFO("Game over: X {} - O {}, winner: {}", result.black_discs, result.white_discs,
           to_str(result.winner));
  return result;
}

void GameRunner::display(bool clear) const {
  if (clear && util::Rendering::mode() == util::Rendering::kTerminal) {
    util::clearscreen(out_);
  }
  board_.print(out_, last_move_);
  print_recent_moves();
}

void GameRunner::print_recent_moves() const {
  const Board::history_t& history = board_.history();
  if (history.empty()) return;

  std::vector<int> recent;
  for (int i = 0; i < static_cast<int>(history.size()); ++i) {
    util::stuff_back<kNumRecentMoves - 1>(recent, i);
  }

  out_ << "Recent moves:\n";
  for (int i : recent) {
    const Board::HistoryEntry& entry = history[i];
    out_ << fmt::format("  {}. {} {}{}\n", i / 2 + 1, to_char(entry.player), entry.move.to_str(),
                        entry.forced ? " (forced pass)" : "");
  }
}

void GameRunner::notify(const Move& move) {
  last_move_ = move;
  for (Color color : {Color::kBlack, Color::kWhite}) {
    player(color)->receive_state_change(board_, move);
  }
}

void GameRunner::undo() {
  Color requester = board_.current_player();
  if (board_.history().empty()) {
    out_ << "Nothing to undo.\n";
    return;
  }

  // Pop until it is the requester's turn again, so that an opponent's reply is undone too.
  do {
    board_.pop();
  } while (!board_.history().empty() && board_.current_player() != requester);

  last_move_ = board_.history().empty() ? Move::pass() : board_.history().back().move;
  LOG_INFO("{} undoes to turn {}", player(requester)->get_name(), board_.turn_number());
}

GameRunner::Result GameRunner::make_result(Result::end_t end, Color winner) const {
  Result result;
  result.end = end;
  result.winner = winner;
  result.black_discs = board_.popcount(Color::kBlack);
  result.white_discs = board_.popcount(Color::kWhite);
  return result;
}

}  // namespace reversi
