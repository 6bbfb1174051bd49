#include "reversi/Exceptions.hpp"

#include <fmt/format.h>

namespace reversi {

namespace {

// Algebraic notation where it exists, raw coordinates otherwise.
std::string describe_cell(int x, int y) {
  Move move{x, y};
  if (move.is_pass() || (x >= 0 && x < 26 && y >= 0)) return move.to_str();
  return fmt::format("({}, {})", x, y);
}

}  // namespace

IllegalMoveError::IllegalMoveError(int x, int y, Color player)
    : util::CleanException("Illegal move {} for {}", describe_cell(x, y), to_str(player)),
      x_(x),
      y_(y),
      player_(player) {}

}  // namespace reversi
