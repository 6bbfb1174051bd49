#include "reversi/Board.hpp"

#include "reversi/Exceptions.hpp"
#include "util/AnsiCodes.hpp"
#include "util/Asserts.hpp"
#include "util/Rendering.hpp"

#include <fmt/format.h>

namespace reversi {

Board::Board(BoardSize size) : size_(size), black_(size), white_(size) {
  int h = dim() / 2;
  white_.set(h - 1, h - 1);
  white_.set(h, h);
  black_.set(h, h - 1);
  black_.set(h - 1, h);
}

Board Board::from_position(const Bitboard& black, const Bitboard& white, Color current_player) {
  CLEAN_ASSERT(black.size() == white.size(), "Bitboard size mismatch ({} vs {})", black.dim(),
               white.dim());
  CLEAN_ASSERT((black & white).empty(), "A cell cannot hold both a black and a white disc");
  CLEAN_ASSERT(current_player != Color::kEmpty, "The side to move must be black or white");

  Board board(black.size());
  board.black_ = black;
  board.white_ = white;
  board.current_player_ = current_player;
  board.history_from_start_ = false;
  return board;
}

const Bitboard& Board::discs(Color color) const {
  switch (color) {
    case Color::kBlack:
      return black_;
    case Color::kWhite:
      return white_;
    default:
      throw util::Exception("No discs for color {}", to_str(color));
  }
}

Bitboard& Board::mutable_discs(Color color) {
  switch (color) {
    case Color::kBlack:
      return black_;
    case Color::kWhite:
      return white_;
    default:
      throw util::Exception("No discs for color {}", to_str(color));
  }
}

Bitboard Board::empty_cells() const { return (black_ | white_) ^ Bitboard::full(size_); }

Bitboard Board::legal_moves(Color player) const {
  const Bitboard& P = discs(player);
  const Bitboard& O = discs(~player);
  Bitboard empty = empty_cells();

  Bitboard moves(size_);
  for (Direction dir : kAllDirections) {
    Bitboard candidates = O & P.shift(dir);
    while (!candidates.empty()) {
      Bitboard next = candidates.shift(dir);
      moves |= empty & next;
      candidates = O & next;
    }
  }
  return moves;
}

Bitboard Board::capture_mask(int x, int y, Color player) const {
  const Bitboard& P = discs(player);
  const Bitboard& O = discs(~player);

  Bitboard placed(size_);
  placed.set(x, y);

  Bitboard capture = placed;
  for (Direction dir : kAllDirections) {
    Bitboard run(size_);
    Bitboard cursor = placed.shift(dir);
    while (!(cursor & O).empty()) {
      run |= cursor;
      cursor = cursor.shift(dir);
    }
    if (!(cursor & P).empty()) {
      capture |= run;
    }
  }
  return capture;
}

PlayOutcome Board::play(int x, int y) {
  Color player = current_player_;
  Move move{x, y};

  if (move.is_pass()) {
    // A pass is only a legal move when it is the only way for the game to continue.
    if (has_legal_move(player) || !has_legal_move(~player)) {
      throw IllegalMoveError(x, y, player);
    }
    push_history(move, player, false);
  } else {
    int n = dim();
    if (x < 0 || x >= n || y < 0 || y >= n || !legal_moves(player).get(x, y)) {
      throw IllegalMoveError(x, y, player);
    }
    Bitboard capture = capture_mask(x, y, player);
    push_history(move, player, false);
    apply(capture, player);
  }

  current_player_ = ~player;
  if (has_legal_move(current_player_)) return PlayOutcome::kContinued;

  if (has_legal_move(player)) {
    push_history(Move::pass(), current_player_, true);
    current_player_ = player;
    return PlayOutcome::kPassed;
  }
  return PlayOutcome::kGameOver;
}

void Board::pop() {
  if (history_.empty()) {
    throw CannotUndoError();
  }

  if (history_.back().forced) {
    history_.pop_back();
    RELEASE_ASSERT(!history_.empty(), "Forced pass without a preceding move");
  }

  const HistoryEntry& entry = history_.back();
  black_ = entry.black;
  white_ = entry.white;
  current_player_ = entry.player;
  history_.pop_back();
}

bool Board::is_game_over() const {
  if (forced_game_over_) return true;
  return !has_legal_move(Color::kBlack) && !has_legal_move(Color::kWhite);
}

void Board::restart() { *this = Board(size_); }

Color Board::get_player_at(int x, int y) const {
  if (black_.get(x, y)) return Color::kBlack;
  if (white_.get(x, y)) return Color::kWhite;
  return Color::kEmpty;
}

Color Board::winner() const {
  int b = black_.popcount();
  int w = white_.popcount();
  if (b > w) return Color::kBlack;
  if (w > b) return Color::kWhite;
  return Color::kEmpty;
}

std::string Board::to_string(bool show_legal_moves) const {
  Bitboard legal = show_legal_moves ? legal_moves() : Bitboard(size_);
  return detail::render_grid(dim(), [&](int x, int y) {
    if (legal.get(x, y)) return '.';
    return to_char(get_player_at(x, y));
  });
}

void Board::print(std::ostream& os, const Move& last_move) const {
  if (util::Rendering::mode() == util::Rendering::kText) {
    os << to_string(true) << fmt::format("\nScore: X {}  O {}\n", popcount(Color::kBlack),
                                         popcount(Color::kWhite));
    return;
  }

  Bitboard legal = legal_moves();
  std::string black_disc = ansi::style(ansi::kBlue, ansi::kCircle);
  std::string white_disc = ansi::style(ansi::kWhite, ansi::kCircle);

  os << detail::render_grid(dim(), [&](int x, int y) -> std::string {
    bool last = !last_move.is_pass() && last_move == Move{x, y};
    switch (get_player_at(x, y)) {
      case Color::kBlack:
        return last ? ansi::style(ansi::kBlink, black_disc) : black_disc;
      case Color::kWhite:
        return last ? ansi::style(ansi::kBlink, white_disc) : white_disc;
      default:
        return legal.get(x, y) ? ansi::style(ansi::kGreen, ".") : "_";
    }
  });
  os << fmt::format("\nScore: {} {}  {} {}\n", black_disc, popcount(Color::kBlack), white_disc,
                    popcount(Color::kWhite));
}

std::string Board::export_game() const {
  int n = dim();
  std::string s = fmt::format("# reversi {}x{} save file\n", n, n);
  s += to_char(current_player_);
  s += '\n';
  for (int y = 0; y < n; ++y) {
    for (int x = 0; x < n; ++x) {
      if (x) s += ' ';
      s += to_char(get_player_at(x, y));
    }
    s += '\n';
  }
  if (history_from_start_ && !history_.empty()) {
    s += '\n';
    s += export_history();
  }
  return s;
}

std::string Board::export_history() const {
  std::string s;
  bool line_open = false;
  for (size_t i = 0; i < history_.size(); ++i) {
    const HistoryEntry& entry = history_[i];
    if (!line_open) {
      s += fmt::format("{}.", i / 2 + 1);
      line_open = true;
    }
    s += fmt::format(" {} {}", to_char(entry.player), entry.move.to_str());
    if (entry.player == Color::kWhite) {
      s += '\n';
      line_open = false;
    }
  }
  if (line_open) s += '\n';
  return s;
}

void Board::apply(const Bitboard& capture, Color player) {
  mutable_discs(player) |= capture;
  Bitboard& opponent = mutable_discs(~player);
  opponent &= ~capture;
}

void Board::push_history(const Move& move, Color player, bool forced) {
  history_.push_back(HistoryEntry{black_, white_, move, player, forced});
}

}  // namespace reversi
