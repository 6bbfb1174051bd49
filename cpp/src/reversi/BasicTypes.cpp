#include "reversi/BasicTypes.hpp"

#include "reversi/Exceptions.hpp"

#include <fmt/format.h>

#include <cctype>

namespace reversi {

char to_char(Color c) {
  switch (c) {
    case Color::kBlack:
      return 'X';
    case Color::kWhite:
      return 'O';
    default:
      return '_';
  }
}

const char* to_str(Color c) {
  switch (c) {
    case Color::kBlack:
      return "black";
    case Color::kWhite:
      return "white";
    default:
      return "empty";
  }
}

std::optional<Color> color_from_char(char c) {
  switch (c) {
    case 'X':
      return Color::kBlack;
    case 'O':
      return Color::kWhite;
    default:
      return std::nullopt;
  }
}

BoardSize to_board_size(int n) {
  for (BoardSize size : kAllBoardSizes) {
    if (dimension(size) == n) return size;
  }
  throw IllegalBoardSizeError(n);
}

std::string Move::to_str() const {
  if (is_pass()) return "-1-1";
  return fmt::format("{}{}", char('a' + x), y + 1);
}

std::optional<Move> Move::from_str(const std::string& s, int dim) {
  if (s == "-1-1") return pass();
  if (s.size() < 2 || s.size() > 3) return std::nullopt;

  char c = std::tolower(static_cast<unsigned char>(s[0]));
  int x = c - 'a';
  if (x < 0 || x >= dim) return std::nullopt;

  int row = 0;
  for (size_t i = 1; i < s.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    row = row * 10 + (s[i] - '0');
  }
  int y = row - 1;
  if (y < 0 || y >= dim) return std::nullopt;
  return Move{x, y};
}

}  // namespace reversi
