#pragma once

#include "reversi/Board.hpp"

#include <boost/filesystem.hpp>

namespace reversi {

/*
 * Save files hold Board::export_game() text and are read back with BoardParser.
 *
 * I/O failures throw util::CleanException; malformed contents throw ParseError.
 */
struct SaveFile {
  static constexpr const char* kDefaultFilename = "default.reversi";

  static void save(const Board& board, const boost::filesystem::path& path);
  static Board load(const boost::filesystem::path& path);
};

}  // namespace reversi
