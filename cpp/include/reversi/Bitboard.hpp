#pragma once

#include "reversi/BasicTypes.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace reversi {

/*
 * A set of cells of an N x N board, one bit per cell. Bit index = y * N + x.
 *
 * Up to 144 cells are needed (12x12), so the bits are spread over three 64-bit words, with bit i
 * living in words_[i / 64] at position i % 64. Bits at index >= N*N are always zero: every
 * operation masks its result with the full-board mask.
 *
 * Boolean operations between boards of different sizes fail fast with util::ReleaseAssertionError.
 */
class Bitboard {
 public:
  using word_t = uint64_t;
  static constexpr int kNumWords = 3;
  static constexpr int kBitsPerWord = 64;
  using words_t = std::array<word_t, kNumWords>;

  /*
   * full: all N*N cells.
   * west: all cells except column 0. Applied after any shift with an eastward component.
   * east: all cells except column N-1. Applied after any shift with a westward component.
   */
  struct Masks {
    words_t full;
    words_t west;
    words_t east;
  };

  static const Masks& masks(BoardSize size);

  explicit Bitboard(BoardSize size = BoardSize::k8x8) : size_(size), words_{} {}

  // Bits outside of the board are silently dropped.
  Bitboard(BoardSize size, const words_t& words);
  Bitboard(BoardSize size, word_t low_word);

  static Bitboard full(BoardSize size);

  BoardSize size() const { return size_; }
  int dim() const { return dimension(size_); }
  const words_t& words() const { return words_; }

  // Both throw IndexOutOfBoundsError if (x, y) is off the board.
  bool get(int x, int y) const;
  void set(int x, int y, bool value = true);

  Bitboard shift(Direction dir) const;

  Bitboard operator&(const Bitboard& other) const;
  Bitboard operator|(const Bitboard& other) const;
  Bitboard operator^(const Bitboard& other) const;

  // Complement within the board.
  Bitboard operator~() const;

  Bitboard& operator&=(const Bitboard& other);
  Bitboard& operator|=(const Bitboard& other);
  Bitboard& operator^=(const Bitboard& other);

  bool operator==(const Bitboard& other) const = default;

  int popcount() const;
  bool empty() const;

  // Set cells in increasing bit-index order.
  std::vector<Move> set_cells() const;

  /*
   * Example, 6x6 board with (0, 0) and (3, 2) set:
   *
   *    a b c d e f
   *  1 * _ _ _ _ _
   *  2 _ _ _ _ _ _
   *  3 _ _ _ * _ _
   *  4 _ _ _ _ _ _
   *  5 _ _ _ _ _ _
   *  6 _ _ _ _ _ _
   */
  std::string to_string() const;

 private:
  bool test_bit(int index) const;
  void check_same_size(const Bitboard& other) const;
  void apply_mask(const words_t& mask);
  Bitboard shift_left(int n, const words_t& mask) const;
  Bitboard shift_right(int n, const words_t& mask) const;

  BoardSize size_;
  words_t words_;
};

namespace detail {

// Renders the column-letter header and one line per row, with glyph(x, y) for each cell. glyph
// may return a char or a std::string.
template <typename GlyphFunc>
std::string render_grid(int dim, GlyphFunc glyph);

}  // namespace detail

}  // namespace reversi

#include "inline/reversi/Bitboard.inl"
