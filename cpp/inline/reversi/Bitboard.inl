#include "reversi/Bitboard.hpp"

#include "reversi/Exceptions.hpp"
#include "util/Asserts.hpp"

#include <bit>

namespace reversi {

namespace detail {

constexpr void set_word_bit(Bitboard::words_t& words, int index) {
  words[index / Bitboard::kBitsPerWord] |= Bitboard::word_t(1) << (index % Bitboard::kBitsPerWord);
}

constexpr Bitboard::Masks make_masks(int n) {
  Bitboard::Masks masks{};
  for (int y = 0; y < n; ++y) {
    for (int x = 0; x < n; ++x) {
      int index = y * n + x;
      set_word_bit(masks.full, index);
      if (x != 0) set_word_bit(masks.west, index);
      if (x != n - 1) set_word_bit(masks.east, index);
    }
  }
  return masks;
}

// Indexed by (N - 6) / 2.
inline constexpr std::array<Bitboard::Masks, 4> kMasks = {make_masks(6), make_masks(8),
                                                          make_masks(10), make_masks(12)};

static_assert(kMasks[1].full[0] == ~0ULL && kMasks[1].full[1] == 0);
static_assert(kMasks[1].west[0] == 0xfefefefefefefefeULL);
static_assert(kMasks[1].east[0] == 0x7f7f7f7f7f7f7f7fULL);
static_assert(kMasks[3].full[2] == 0xffff);

template <typename GlyphFunc>
std::string render_grid(int dim, GlyphFunc glyph) {
  std::string s = "  ";
  for (int x = 0; x < dim; ++x) {
    s += ' ';
    s += char('a' + x);
  }
  s += '\n';
  for (int y = 0; y < dim; ++y) {
    s += (y + 1 < 10) ? ' ' : char('0' + (y + 1) / 10);
    s += char('0' + (y + 1) % 10);
    for (int x = 0; x < dim; ++x) {
      s += ' ';
      s += glyph(x, y);
    }
    s += '\n';
  }
  return s;
}

}  // namespace detail

inline const Bitboard::Masks& Bitboard::masks(BoardSize size) {
  return detail::kMasks[(dimension(size) - 6) / 2];
}

inline Bitboard::Bitboard(BoardSize size, const words_t& words) : size_(size), words_(words) {
  apply_mask(masks(size).full);
}

inline Bitboard::Bitboard(BoardSize size, word_t low_word) : size_(size), words_{low_word, 0, 0} {
  apply_mask(masks(size).full);
}

inline Bitboard Bitboard::full(BoardSize size) { return Bitboard(size, masks(size).full); }

inline bool Bitboard::get(int x, int y) const {
  int n = dim();
  if (x < 0 || x >= n || y < 0 || y >= n) {
    throw IndexOutOfBoundsError(x, y, n);
  }
  return test_bit(y * n + x);
}

inline void Bitboard::set(int x, int y, bool value) {
  int n = dim();
  if (x < 0 || x >= n || y < 0 || y >= n) {
    throw IndexOutOfBoundsError(x, y, n);
  }
  int index = y * n + x;
  word_t bit = word_t(1) << (index % kBitsPerWord);
  if (value) {
    words_[index / kBitsPerWord] |= bit;
  } else {
    words_[index / kBitsPerWord] &= ~bit;
  }
}

inline Bitboard Bitboard::shift(Direction dir) const {
  const Masks& m = masks(size_);
  int n = dim();
  switch (dir) {
    case Direction::kN:
      return shift_right(n, m.full);
    case Direction::kS:
      return shift_left(n, m.full);
    case Direction::kE:
      return shift_left(1, m.west);
    case Direction::kW:
      return shift_right(1, m.east);
    case Direction::kNE:
      return shift_right(n - 1, m.west);
    case Direction::kNW:
      return shift_right(n + 1, m.east);
    case Direction::kSE:
      return shift_left(n + 1, m.west);
    case Direction::kSW:
      return shift_left(n - 1, m.east);
  }
  throw util::Exception("Unknown direction {}", int(dir));
}

inline Bitboard Bitboard::operator&(const Bitboard& other) const {
  Bitboard out(*this);
  out &= other;
  return out;
}

inline Bitboard Bitboard::operator|(const Bitboard& other) const {
  Bitboard out(*this);
  out |= other;
  return out;
}

inline Bitboard Bitboard::operator^(const Bitboard& other) const {
  Bitboard out(*this);
  out ^= other;
  return out;
}

inline Bitboard Bitboard::operator~() const {
  Bitboard out(*this);
  const words_t& full = masks(size_).full;
  for (int i = 0; i < kNumWords; ++i) {
    out.words_[i] = ~words_[i] & full[i];
  }
  return out;
}

inline Bitboard& Bitboard::operator&=(const Bitboard& other) {
  check_same_size(other);
  for (int i = 0; i < kNumWords; ++i) words_[i] &= other.words_[i];
  return *this;
}

inline Bitboard& Bitboard::operator|=(const Bitboard& other) {
  check_same_size(other);
  for (int i = 0; i < kNumWords; ++i) words_[i] |= other.words_[i];
  return *this;
}

inline Bitboard& Bitboard::operator^=(const Bitboard& other) {
  check_same_size(other);
  for (int i = 0; i < kNumWords; ++i) words_[i] ^= other.words_[i];
  return *this;
}

inline int Bitboard::popcount() const {
  int count = 0;
  for (word_t w : words_) count += std::popcount(w);
  return count;
}

inline bool Bitboard::empty() const {
  for (word_t w : words_) {
    if (w) return false;
  }
  return true;
}

inline bool Bitboard::test_bit(int index) const {
  return (words_[index / kBitsPerWord] >> (index % kBitsPerWord)) & 1;
}

inline void Bitboard::check_same_size(const Bitboard& other) const {
  RELEASE_ASSERT(size_ == other.size_, "Bitboard size mismatch ({} vs {})", dim(), other.dim());
}

inline void Bitboard::apply_mask(const words_t& mask) {
  for (int i = 0; i < kNumWords; ++i) words_[i] &= mask[i];
}

// Requires 0 < n < 64.
inline Bitboard Bitboard::shift_left(int n, const words_t& mask) const {
  Bitboard out(size_);
  for (int i = kNumWords - 1; i >= 0; --i) {
    word_t carry = i > 0 ? words_[i - 1] >> (kBitsPerWord - n) : 0;
    out.words_[i] = ((words_[i] << n) | carry) & mask[i];
  }
  return out;
}

// Requires 0 < n < 64.
inline Bitboard Bitboard::shift_right(int n, const words_t& mask) const {
  Bitboard out(size_);
  for (int i = 0; i < kNumWords; ++i) {
    word_t carry = i + 1 < kNumWords ? words_[i + 1] << (kBitsPerWord - n) : 0;
    out.words_[i] = ((words_[i] >> n) | carry) & mask[i];
  }
  return out;
}

}  // namespace reversi
