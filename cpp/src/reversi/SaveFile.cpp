#include "reversi/SaveFile.hpp"

#include "reversi/BoardParser.hpp"
#include "util/BoostUtil.hpp"

namespace reversi {

void SaveFile::save(const Board& board, const boost::filesystem::path& path) {
  boost_util::write_str_to_file(board.export_game(), path);
}

Board SaveFile::load(const boost::filesystem::path& path) {
  return BoardParser::parse(boost_util::read_file_to_str(path));
}

}  // namespace reversi
