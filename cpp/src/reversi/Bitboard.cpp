#include "reversi/Bitboard.hpp"

#include <bit>

namespace reversi {

std::vector<Move> Bitboard::set_cells() const {
  std::vector<Move> cells;
  cells.reserve(popcount());
  int n = dim();
  for (int i = 0; i < kNumWords; ++i) {
    word_t w = words_[i];
    while (w) {
      int index = i * kBitsPerWord + std::countr_zero(w);
      cells.push_back(Move{index % n, index / n});
      w &= w - 1;
    }
  }
  return cells;
}

std::string Bitboard::to_string() const {
  return detail::render_grid(dim(), [&](int x, int y) { return get(x, y) ? '*' : '_'; });
}

}  // namespace reversi
