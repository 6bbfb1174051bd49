#include "reversi/BoardParser.hpp"

#include "reversi/Exceptions.hpp"
#include "util/StringUtil.hpp"

#include <fmt/format.h>

#include <cctype>

namespace reversi {

Board BoardParser::parse(const std::string& text) {
  BoardParser parser(text);
  return parser.run();
}

BoardParser::BoardParser(const std::string& text) : lines_(util::splitlines(text)) {}

Board BoardParser::run() {
  if (!next_content_line()) {
    throw ParseError("missing side to move", last_line());
  }
  Color current_player = parse_side_to_move();

  if (!next_content_line()) {
    throw ParseError("missing board grid", last_line());
  }
  BoardSize size = parse_grid_size();
  Bitboard black(size);
  Bitboard white(size);
  parse_grid(black, white);

  if (!next_content_line()) {
    return Board::from_position(black, white, current_player);
  }

  int history_line = line_index_ + 1;
  Board board(size);
  do {
    parse_history_line(board);
  } while (next_content_line());

  if (board.black() != black || board.white() != white ||
      board.current_player() != current_player) {
    throw ParseError("replayed history does not match the board", history_line);
  }
  return board;
}

// Advances to the next line holding anything besides whitespace and comments, and splits it into
// tokens_. Returns false at end of input.
bool BoardParser::next_content_line() {
  while (++line_index_ < (int)lines_.size()) {
    std::string line = lines_[line_index_];
    size_t comment = line.find('#');
    if (comment != std::string::npos) {
      line.resize(comment);
    }
    num_tokens_ = util::split(tokens_, line);
    if (num_tokens_ > 0) return true;
  }
  return false;
}

Color BoardParser::parse_side_to_move() {
  int line = line_index_ + 1;
  if (num_tokens_ != 1 || tokens_[0].size() != 1) {
    throw ParseError("expected a single side-to-move token (X or O)", line);
  }
  std::optional<Color> color = color_from_char(tokens_[0][0]);
  if (!color) {
    throw ParseError(fmt::format("invalid side to move '{}'", tokens_[0]), line);
  }
  return *color;
}

// The first grid row fixes the board size.
BoardSize BoardParser::parse_grid_size() {
  try {
    return to_board_size(num_tokens_);
  } catch (const IllegalBoardSizeError& e) {
    throw ParseError(e.what(), line_index_ + 1);
  }
}

// Expects tokens_ to hold the first grid row.
void BoardParser::parse_grid(Bitboard& black, Bitboard& white) {
  int n = black.dim();
  for (int y = 0; y < n; ++y) {
    if (y > 0 && !next_content_line()) {
      throw ParseError(fmt::format("expected {} board rows, got {}", n, y), last_line());
    }
    int line = line_index_ + 1;
    if (num_tokens_ != n) {
      throw ParseError(fmt::format("expected {} cells, got {}", n, num_tokens_), line);
    }
    for (int x = 0; x < n; ++x) {
      const std::string& token = tokens_[x];
      if (token == "X") {
        black.set(x, y);
      } else if (token == "O") {
        white.set(x, y);
      } else if (token != "_") {
        throw ParseError(fmt::format("invalid cell '{}'", token), line);
      }
    }
  }
}

void BoardParser::parse_history_line(Board& board) {
  int line = line_index_ + 1;
  if (num_tokens_ != 3 && num_tokens_ != 5) {
    throw ParseError("expected '<turn>. X <move> [O <move>]'", line);
  }

  const std::string& turn_token = tokens_[0];
  if (turn_token.size() < 2 || turn_token.back() != '.') {
    throw ParseError(fmt::format("invalid turn number '{}'", turn_token), line);
  }
  int turn = 0;
  for (size_t i = 0; i + 1 < turn_token.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(turn_token[i]))) {
      throw ParseError(fmt::format("invalid turn number '{}'", turn_token), line);
    }
    turn = turn * 10 + (turn_token[i] - '0');
  }
  if (board.history().size() > replayed_ && board.history()[replayed_].player == Color::kWhite) {
    throw ParseError("missing -1-1 for white's automatic pass on the previous line", line);
  }
  if (turn != board.turn_number()) {
    throw ParseError(
      fmt::format("incorrect turn number in history (expected {}, got {})", board.turn_number(),
                  turn),
      line);
  }

  if (tokens_[1] != "X") {
    throw ParseError(fmt::format("expected X, got '{}'", tokens_[1]), line);
  }
  replay_move(board, Color::kBlack, tokens_[2]);

  if (num_tokens_ == 5) {
    if (tokens_[3] != "O") {
      throw ParseError(fmt::format("expected O, got '{}'", tokens_[3]), line);
    }
    replay_move(board, Color::kWhite, tokens_[4]);
  }
}

void BoardParser::replay_move(Board& board, Color color, const std::string& token) {
  int line = line_index_ + 1;
  std::optional<Move> move = Move::from_str(token, board.dim());
  if (!move) {
    throw ParseError(fmt::format("invalid move '{}'", token), line);
  }

  // play() already recorded this entry as an automatic pass.
  if (board.history().size() > replayed_) {
    if (!move->is_pass()) {
      throw ParseError(
        fmt::format("{} had no legal move, expected -1-1 but got '{}'", to_str(color), token),
        line);
    }
    replayed_++;
    return;
  }

  if (board.current_player() != color) {
    throw ParseError(fmt::format("{} is not to move", to_str(color)), line);
  }
  try {
    board.play(*move);
  } catch (const IllegalMoveError& e) {
    throw ParseError(e.what(), line);
  }
  replayed_++;
}

int BoardParser::last_line() const { return lines_.empty() ? 1 : (int)lines_.size(); }

}  // namespace reversi
