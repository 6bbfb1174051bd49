#include "reversi/players/HumanTuiPlayer.hpp"

#include "util/StringUtil.hpp"

#include <fmt/format.h>

namespace reversi {

HumanTuiPlayer::HumanTuiPlayer(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

PlayerResponse HumanTuiPlayer::get_response(const Board& board) {
  int n = board.dim();
  std::string prompt =
    fmt::format("{} to move. Enter move [a1-{}{}] or command (? for help): ",
                to_char(get_color()), char('a' + n - 1), n);

  while (true) {
    out_ << prompt;
    out_.flush();

    std::string input;
    if (!std::getline(in_, input)) {
      out_ << '\n';
      return PlayerResponse::quit();
    }

    PlayerResponse response = parse_command(input, n);
    switch (response.type()) {
      case PlayerResponse::kInvalidResponse:
        out_ << "Invalid input!\n";
        continue;
      case PlayerResponse::kHelp:
        print_help(out_);
        continue;
      case PlayerResponse::kRules:
        print_rules(out_);
        continue;
      case PlayerResponse::kMakeMove: {
        const Move& move = response.get_move();
        if (!board.legal_moves(get_color()).get(move.x, move.y)) {
          out_ << fmt::format("Illegal move {}!\n", move.to_str());
          continue;
        }
        return response;
      }
      default:
        return response;
    }
  }
}

void HumanTuiPlayer::end_game(const Board& board) {
  Color winner = board.winner();
  if (winner == get_color()) {
    out_ << "Congratulations, you win!" << std::endl;
  } else if (winner == Color::kEmpty) {
    out_ << "The game has ended in a draw." << std::endl;
  } else {
    out_ << "Sorry, you lose." << std::endl;
  }
}

PlayerResponse HumanTuiPlayer::parse_command(const std::string& input, int dim) {
  std::string s = util::strip(input);

  if (s == "?") return PlayerResponse::help();
  if (s == "r") return PlayerResponse::rules();
  if (s == "u") return PlayerResponse::undo();
  if (s == "restart") return PlayerResponse::restart();
  if (s == "s" || s == "sh") return PlayerResponse::save_and_quit();
  if (s == "ff") return PlayerResponse::forfeit();
  if (s == "q") return PlayerResponse::quit();

  std::optional<Move> move = Move::from_str(s, dim);
  if (!move || move->is_pass()) return PlayerResponse::invalid();
  return *move;
}

void HumanTuiPlayer::print_help(std::ostream& os) {
  os << "Commands:\n"
        "  d3       play a disc on column d, row 3\n"
        "  u        undo back to your previous turn\n"
        "  restart  restart the game\n"
        "  s, sh    save the game and quit\n"
        "  ff       forfeit\n"
        "  q        quit without saving\n"
        "  r        show the rules\n"
        "  ?        show this help\n";
}

void HumanTuiPlayer::print_rules(std::ostream& os) {
  os << "Rules:\n"
        "  Black (X) moves first. A move places a disc so that it brackets a straight line of\n"
        "  opponent discs, in any of the eight directions, between itself and another disc of\n"
        "  the mover's color. Every bracketed line is flipped.\n"
        "  A player without a legal move passes. The game ends when neither player can move,\n"
        "  and the player with more discs wins.\n";
}

}  // namespace reversi
