#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

/*
 * Coordinates: x is the column, y is the row, origin top-left. Cell (x, y) lives at bit index
 * y * N + x of a Bitboard.
 *
 * Algebraic notation is a lower-case column letter followed by a 1-based row number, so (5, 4) is
 * "f5" and (11, 11) on a 12x12 board is "l12". The pass sentinel (-1, -1) is written "-1-1".
 */
namespace reversi {

enum class Color : int8_t { kBlack, kWhite, kEmpty };

// ~kEmpty == kEmpty.
constexpr Color operator~(Color c) {
  switch (c) {
    case Color::kBlack:
      return Color::kWhite;
    case Color::kWhite:
      return Color::kBlack;
    default:
      return Color::kEmpty;
  }
}

constexpr Color opposite(Color c) { return ~c; }

// Save-file glyph: X, O or _.
char to_char(Color c);

// "black", "white" or "empty".
const char* to_str(Color c);

// Inverse of to_char() for X and O. Returns std::nullopt for anything else.
std::optional<Color> color_from_char(char c);

enum class BoardSize : int8_t { k6x6 = 6, k8x8 = 8, k10x10 = 10, k12x12 = 12 };

constexpr std::array<BoardSize, 4> kAllBoardSizes = {BoardSize::k6x6, BoardSize::k8x8,
                                                     BoardSize::k10x10, BoardSize::k12x12};

constexpr int dimension(BoardSize size) { return static_cast<int>(size); }

// Throws IllegalBoardSizeError for values outside {6, 8, 10, 12}.
BoardSize to_board_size(int n);

enum class Direction : int8_t { kN, kS, kE, kW, kNE, kNW, kSE, kSW };

constexpr std::array<Direction, 8> kAllDirections = {Direction::kN,  Direction::kS,
                                                     Direction::kE,  Direction::kW,
                                                     Direction::kNE, Direction::kNW,
                                                     Direction::kSE, Direction::kSW};

struct Move {
  int x = -1;
  int y = -1;

  static constexpr Move pass() { return Move{-1, -1}; }
  constexpr bool is_pass() const { return x == -1 && y == -1; }

  bool operator==(const Move&) const = default;

  std::string to_str() const;

  /*
   * Parses algebraic notation ("f5", "F5", "-1-1") for a board of the given dimension. Returns
   * std::nullopt if s is malformed or lies outside the board.
   */
  static std::optional<Move> from_str(const std::string& s, int dim);
};

/*
 * Result of Board::play().
 *
 * kPassed: the move was applied, the opponent had no reply, so an automatic pass was recorded and
 * the mover is to play again.
 *
 * kGameOver: the move was applied and neither side has a legal move left.
 */
enum class PlayOutcome : int8_t { kContinued, kPassed, kGameOver };

}  // namespace reversi
