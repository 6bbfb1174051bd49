#include "reversi/BasicTypes.hpp"
#include "reversi/Bitboard.hpp"
#include "reversi/Board.hpp"
#include "reversi/BoardParser.hpp"
#include "reversi/Exceptions.hpp"
#include "reversi/GameParams.hpp"
#include "reversi/GameRunner.hpp"
#include "reversi/Heuristics.hpp"
#include "reversi/PlayerResponse.hpp"
#include "reversi/SaveFile.hpp"
#include "reversi/Search.hpp"
#include "reversi/players/HumanTuiPlayer.hpp"
#include "reversi/players/RandomPlayer.hpp"
#include "reversi/players/SearchPlayer.hpp"
#include "util/AnsiCodes.hpp"
#include "util/Exceptions.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"
#include "util/Rendering.hpp"

#include <boost/filesystem.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

using namespace reversi;

namespace {

Board play_all(BoardSize size, const std::vector<std::string>& moves) {
  Board board(size);
  for (const std::string& s : moves) {
    board.play(*Move::from_str(s, board.dim()));
  }
  return board;
}

// Plays random moves until the game ends, calling f(board) before every move.
template <typename F>
Board play_random_game(BoardSize size, std::mt19937& prng, F f) {
  Board board(size);
  while (!board.is_game_over()) {
    f(board);
    board.play(Search::random_move(prng, board));
  }
  return board;
}

std::vector<Board> sample_positions(BoardSize size, int num_games, int seed) {
  std::mt19937 prng(seed);
  std::vector<Board> positions;
  for (int i = 0; i < num_games; ++i) {
    play_random_game(size, prng, [&](const Board& board) { positions.push_back(board); });
  }
  return positions;
}

boost::filesystem::path make_temp_path() {
  return boost::filesystem::temp_directory_path() / boost::filesystem::unique_path();
}

const std::vector<std::string> kPassingGame6x6 = {"d5", "e3", "e2", "e1", "b3", "a3",
                                                  "f1", "e5", "e4", "e6", "b5", "f3",
                                                  "f4", "c5", "d1", "f5", "a6"};

}  // namespace

TEST(BasicTypes, colors) {
  EXPECT_EQ(~Color::kBlack, Color::kWhite);
  EXPECT_EQ(~Color::kWhite, Color::kBlack);
  EXPECT_EQ(~Color::kEmpty, Color::kEmpty);
  EXPECT_EQ(opposite(Color::kBlack), Color::kWhite);

  EXPECT_EQ(to_char(Color::kBlack), 'X');
  EXPECT_EQ(to_char(Color::kWhite), 'O');
  EXPECT_EQ(to_char(Color::kEmpty), '_');
  EXPECT_EQ(color_from_char('O'), Color::kWhite);
  EXPECT_FALSE(color_from_char('_').has_value());
}

TEST(BasicTypes, board_size) {
  EXPECT_EQ(to_board_size(10), BoardSize::k10x10);
  EXPECT_THROW(to_board_size(7), IllegalBoardSizeError);
  EXPECT_THROW(to_board_size(14), IllegalBoardSizeError);
  EXPECT_THROW(to_board_size(4), util::CleanException);
}

TEST(BasicTypes, move_notation) {
  EXPECT_EQ((Move{5, 4}).to_str(), "f5");
  EXPECT_EQ((Move{11, 11}).to_str(), "l12");
  EXPECT_EQ(Move::pass().to_str(), "-1-1");

  EXPECT_EQ(Move::from_str("f5", 8), (Move{5, 4}));
  EXPECT_EQ(Move::from_str("F5", 8), (Move{5, 4}));
  EXPECT_EQ(Move::from_str("l12", 12), (Move{11, 11}));
  EXPECT_EQ(Move::from_str("-1-1", 8), Move::pass());
  EXPECT_FALSE(Move::from_str("l12", 8).has_value());
  EXPECT_FALSE(Move::from_str("a0", 8).has_value());
  EXPECT_FALSE(Move::from_str("a9", 8).has_value());
  EXPECT_FALSE(Move::from_str("5f", 8).has_value());
  EXPECT_FALSE(Move::from_str("", 8).has_value());
}

TEST(Bitboard, get_set) {
  Bitboard b(BoardSize::k8x8);
  EXPECT_TRUE(b.empty());
  b.set(3, 2);
  EXPECT_TRUE(b.get(3, 2));
  EXPECT_EQ(b.words()[0], 1ULL << 19);
  EXPECT_EQ(b.popcount(), 1);
  b.set(3, 2, false);
  EXPECT_TRUE(b.empty());

  EXPECT_THROW(b.get(8, 0), IndexOutOfBoundsError);
  EXPECT_THROW(b.set(0, -1), IndexOutOfBoundsError);
}

TEST(Bitboard, out_of_board_bits_are_dropped) {
  Bitboard b(BoardSize::k6x6, ~0ULL);
  EXPECT_EQ(b.popcount(), 36);
  EXPECT_EQ(b, Bitboard::full(BoardSize::k6x6));
  EXPECT_EQ(Bitboard::full(BoardSize::k12x12).popcount(), 144);
  EXPECT_TRUE((~Bitboard::full(BoardSize::k10x10)).empty());
}

TEST(Bitboard, shift_does_not_wrap) {
  for (BoardSize size : kAllBoardSizes) {
    int n = dimension(size);

    Bitboard east_edge(size);
    Bitboard west_edge(size);
    for (int y = 0; y < n; ++y) {
      east_edge.set(n - 1, y);
      west_edge.set(0, y);
    }
    for (Direction dir : {Direction::kE, Direction::kNE, Direction::kSE}) {
      EXPECT_TRUE(east_edge.shift(dir).empty()) << n;
    }
    for (Direction dir : {Direction::kW, Direction::kNW, Direction::kSW}) {
      EXPECT_TRUE(west_edge.shift(dir).empty()) << n;
    }

    Bitboard corner(size);
    corner.set(n - 1, n - 1);
    EXPECT_TRUE(corner.shift(Direction::kS).empty());
    EXPECT_EQ(corner.shift(Direction::kN).set_cells(), (std::vector<Move>{{n - 1, n - 2}}));
    EXPECT_EQ(corner.shift(Direction::kNW).set_cells(), (std::vector<Move>{{n - 2, n - 2}}));
  }
}

TEST(Bitboard, shift_across_words) {
  // 12x12: (0, 5) is bit 60, one row down is bit 72 in the second word.
  Bitboard b(BoardSize::k12x12);
  b.set(0, 5);
  Bitboard s = b.shift(Direction::kS);
  EXPECT_EQ(s.words()[0], 0);
  EXPECT_EQ(s.words()[1], 1ULL << 8);
  EXPECT_TRUE(s.get(0, 6));
  EXPECT_EQ(s.shift(Direction::kN), b);

  Bitboard se = b.shift(Direction::kSE);
  EXPECT_TRUE(se.get(1, 6));

  Bitboard last(BoardSize::k12x12);
  last.set(11, 11);
  EXPECT_EQ(last.words()[2], 1ULL << 15);
  EXPECT_TRUE(last.shift(Direction::kNW).get(10, 10));
}

TEST(Bitboard, size_mismatch) {
  Bitboard a(BoardSize::k6x6);
  Bitboard b(BoardSize::k8x8);
  EXPECT_THROW(a & b, util::ReleaseAssertionError);
  EXPECT_THROW(a |= b, util::ReleaseAssertionError);
}

TEST(Bitboard, to_string) {
  Bitboard b(BoardSize::k6x6);
  b.set(0, 0);
  b.set(3, 2);
  std::string expected =
    "   a b c d e f\n"
    " 1 * _ _ _ _ _\n"
    " 2 _ _ _ _ _ _\n"
    " 3 _ _ _ * _ _\n"
    " 4 _ _ _ _ _ _\n"
    " 5 _ _ _ _ _ _\n"
    " 6 _ _ _ _ _ _\n";
  EXPECT_EQ(b.to_string(), expected);

  Bitboard c(BoardSize::k10x10);
  c.set(9, 9);
  std::string s = c.to_string();
  EXPECT_NE(s.find("10 _ _ _ _ _ _ _ _ _ *\n"), std::string::npos) << s;
}

TEST(Board, initial_position) {
  for (BoardSize size : kAllBoardSizes) {
    Board board(size);
    int h = board.dim() / 2;
    EXPECT_EQ(board.get_player_at(h - 1, h - 1), Color::kWhite);
    EXPECT_EQ(board.get_player_at(h, h), Color::kWhite);
    EXPECT_EQ(board.get_player_at(h, h - 1), Color::kBlack);
    EXPECT_EQ(board.get_player_at(h - 1, h), Color::kBlack);
    EXPECT_EQ(board.current_player(), Color::kBlack);
    EXPECT_EQ(board.popcount(Color::kBlack), 2);
    EXPECT_EQ(board.popcount(Color::kWhite), 2);
    EXPECT_EQ(board.turn_number(), 1);
    EXPECT_FALSE(board.is_game_over());
  }
}

TEST(Board, opening_legal_moves) {
  Board board;
  Bitboard black = board.legal_moves(Color::kBlack);
  EXPECT_EQ(black.words()[0], 0x0000102004080000ULL);
  EXPECT_EQ(black.set_cells(), (std::vector<Move>{{3, 2}, {2, 3}, {5, 4}, {4, 5}}));

  Bitboard white = board.legal_moves(Color::kWhite);
  EXPECT_EQ(white.set_cells(), (std::vector<Move>{{4, 2}, {5, 3}, {2, 4}, {3, 5}}));

  std::string expected =
    "   a b c d e f g h\n"
    " 1 _ _ _ _ _ _ _ _\n"
    " 2 _ _ _ _ _ _ _ _\n"
    " 3 _ _ _ . _ _ _ _\n"
    " 4 _ _ . O X _ _ _\n"
    " 5 _ _ _ X O . _ _\n"
    " 6 _ _ _ _ . _ _ _\n"
    " 7 _ _ _ _ _ _ _ _\n"
    " 8 _ _ _ _ _ _ _ _\n";
  EXPECT_EQ(board.to_string(true), expected);
}

TEST(Board, capture_mask) {
  Board start;
  EXPECT_EQ(start.capture_mask(4, 5, Color::kBlack).words()[0], 0x101000000000ULL);

  Bitboard white(BoardSize::k8x8, 0x8048084888480f0ULL);
  Bitboard black(BoardSize::k8x8, 0x784844487000ULL);
  Board board = Board::from_position(black, white, Color::kWhite);
  EXPECT_EQ(board.capture_mask(4, 4, Color::kWhite).words()[0], 0x81800000000ULL);
}

TEST(Board, legal_moves_fixture) {
  Bitboard white(BoardSize::k8x8, 0x101018000000ULL);
  Bitboard black(BoardSize::k8x8, 0x10000820000000ULL);
  Board board = Board::from_position(black, white, Color::kBlack);
  EXPECT_EQ(board.legal_moves(Color::kBlack).words()[0], 0x20082004380000ULL);
  EXPECT_EQ(board.legal_moves(Color::kWhite).words()[0], 0x10000c0444400000ULL);
}

TEST(Board, play_sequence) {
  Board board(BoardSize::k8x8);
  for (const char* s : {"f5", "d6", "c6", "b6", "d7"}) {
    EXPECT_EQ(board.play(*Move::from_str(s, 8)), PlayOutcome::kContinued) << s;
  }

  std::string expected =
    "   a b c d e f g h\n"
    " 1 _ _ _ _ _ _ _ _\n"
    " 2 _ _ _ _ _ _ _ _\n"
    " 3 _ _ _ _ _ _ _ _\n"
    " 4 _ _ _ O X _ _ _\n"
    " 5 _ _ _ X X X _ _\n"
    " 6 _ O O X _ _ _ _\n"
    " 7 _ _ _ X _ _ _ _\n"
    " 8 _ _ _ _ _ _ _ _\n";
  EXPECT_EQ(board.to_string(), expected);
  EXPECT_EQ(board.current_player(), Color::kWhite);
  EXPECT_EQ(board.history().size(), 5);
  EXPECT_EQ(board.turn_number(), 3);
  EXPECT_EQ(board.export_history(), "1. X f5 O d6\n2. X c6 O b6\n3. X d7\n");
}

TEST(Board, illegal_moves) {
  Board board;
  Board before = board;

  EXPECT_THROW(board.play(0, 0), IllegalMoveError);
  EXPECT_THROW(board.play(3, 3), IllegalMoveError);  // occupied
  EXPECT_THROW(board.play(8, 8), IllegalMoveError);  // off the board
  EXPECT_THROW(board.play(Move::pass()), IllegalMoveError);
  EXPECT_EQ(board, before);

  try {
    board.play(0, 0);
  } catch (const IllegalMoveError& e) {
    EXPECT_EQ(e.x(), 0);
    EXPECT_EQ(e.y(), 0);
    EXPECT_EQ(e.player(), Color::kBlack);
    EXPECT_STREQ(e.what(), "Illegal move a1 for black");
  }

  EXPECT_STREQ(IllegalMoveError(-3, 2, Color::kWhite).what(), "Illegal move (-3, 2) for white");
  EXPECT_STREQ(IllegalMoveError(-1, -1, Color::kWhite).what(), "Illegal move -1-1 for white");
}

TEST(Board, pop) {
  Board board;
  EXPECT_THROW(board.pop(), CannotUndoError);

  board.play(5, 4);
  board.play(3, 5);
  board.pop();
  EXPECT_EQ(board, play_all(BoardSize::k8x8, {"f5"}));
  board.pop();
  EXPECT_EQ(board, Board());
  EXPECT_THROW(board.pop(), CannotUndoError);
}

TEST(Board, play_pop_inverse) {
  for (BoardSize size : kAllBoardSizes) {
    std::mt19937 prng(dimension(size));
    play_random_game(size, prng, [&](const Board& board) {
      Board copy = board;
      copy.play(Search::random_move(prng, copy));
      copy.pop();
      ASSERT_EQ(copy, board);
    });
  }
}

TEST(Board, disc_conservation) {
  for (BoardSize size : kAllBoardSizes) {
    std::mt19937 prng(100 + dimension(size));
    Board end = play_random_game(size, prng, [](const Board& board) {
      ASSERT_TRUE((board.black() & board.white()).empty());
      int placed = 0;
      for (const auto& entry : board.history()) {
        if (!entry.move.is_pass()) placed++;
      }
      ASSERT_EQ(board.popcount(Color::kBlack) + board.popcount(Color::kWhite), 4 + placed);
      ASSERT_EQ(board.turn_number(), (int)board.history().size() / 2 + 1);
    });
    EXPECT_TRUE(end.is_game_over());
    EXPECT_TRUE(end.legal_moves(Color::kBlack).empty());
    EXPECT_TRUE(end.legal_moves(Color::kWhite).empty());
  }
}

TEST(Board, automatic_pass) {
  Board board(BoardSize::k6x6);
  for (size_t i = 0; i + 2 < kPassingGame6x6.size(); ++i) {
    EXPECT_EQ(board.play(*Move::from_str(kPassingGame6x6[i], 6)), PlayOutcome::kContinued)
      << kPassingGame6x6[i];
  }

  Board before_pass = board;
  EXPECT_EQ(board.play(*Move::from_str("f5", 6)), PlayOutcome::kPassed);
  EXPECT_EQ(board.history().size(), 17);
  EXPECT_TRUE(board.history().back().forced);
  EXPECT_EQ(board.history().back().player, Color::kBlack);
  EXPECT_EQ(board.current_player(), Color::kWhite);

  // pop() undoes the automatic pass together with the move that caused it
  Board copy = board;
  copy.pop();
  EXPECT_EQ(copy, before_pass);

  EXPECT_EQ(board.play(*Move::from_str("a6", 6)), PlayOutcome::kGameOver);
  EXPECT_EQ(board.history().size(), 18);
  EXPECT_TRUE(board.is_game_over());

  std::string expected =
    "   a b c d e f\n"
    " 1 _ _ _ X X X\n"
    " 2 _ _ _ _ X _\n"
    " 3 O O O O O O\n"
    " 4 _ _ O O O O\n"
    " 5 _ O O O O O\n"
    " 6 O _ _ _ O _\n";
  EXPECT_EQ(board.to_string(), expected);
  EXPECT_EQ(board.popcount(Color::kBlack), 4);
  EXPECT_EQ(board.popcount(Color::kWhite), 17);
  EXPECT_EQ(board.winner(), Color::kWhite);
  EXPECT_EQ(board.current_player(), Color::kBlack);

  std::vector<std::string> lines;
  std::istringstream ss(board.export_history());
  for (std::string line; std::getline(ss, line);) lines.push_back(line);
  ASSERT_EQ(lines.size(), 9);
  EXPECT_EQ(lines[7], "8. X d1 O f5");
  EXPECT_EQ(lines[8], "9. X -1-1 O a6");
}

TEST(Board, tiled_board_is_game_over) {
  for (BoardSize size : kAllBoardSizes) {
    Bitboard full = Bitboard::full(size);
    Board board = Board::from_position(full, Bitboard(size), Color::kWhite);
    EXPECT_TRUE(board.is_game_over());
    EXPECT_TRUE(board.legal_moves(Color::kBlack).empty());
    EXPECT_TRUE(board.legal_moves(Color::kWhite).empty());
    EXPECT_EQ(board.winner(), Color::kBlack);
    EXPECT_THROW(board.play(Move::pass()), IllegalMoveError);
  }
}

TEST(Board, tiled_board_with_opposite_corner_is_game_over) {
  for (BoardSize size : kAllBoardSizes) {
    int n = dimension(size);
    Bitboard white(size);
    white.set(n - 1, n - 1);
    Bitboard black = ~white;

    Board board = Board::from_position(black, white, Color::kBlack);
    EXPECT_EQ(board.popcount(Color::kBlack), n * n - 1);
    EXPECT_EQ(board.popcount(Color::kWhite), 1);
    EXPECT_TRUE(board.empty_cells().empty());
    EXPECT_TRUE(board.is_game_over());
    EXPECT_EQ(board.winner(), Color::kBlack);
    EXPECT_THROW(board.play(0, 0), IllegalMoveError);
  }
}

TEST(Board, tied_board) {
  Bitboard black(BoardSize::k6x6);
  Bitboard white(BoardSize::k6x6);
  for (int y = 0; y < 6; ++y) {
    for (int x = 0; x < 6; ++x) {
      (y < 3 ? black : white).set(x, y);
    }
  }
  Board board = Board::from_position(black, white, Color::kBlack);
  EXPECT_TRUE(board.is_game_over());
  EXPECT_EQ(board.winner(), Color::kEmpty);
}

TEST(Board, print) {
  Board board;
  {
    util::Rendering::Guard guard(util::Rendering::kText);
    std::ostringstream ss;
    board.print(ss);
    EXPECT_EQ(ss.str(), board.to_string(true) + "\nScore: X 2  O 2\n");
  }

  Move f5 = *Move::from_str("f5", 8);
  board.play(f5);
  util::Rendering::Guard guard(util::Rendering::kTerminal);
  std::ostringstream ss;
  board.print(ss, f5);
  std::string s = ss.str();

  std::string black_disc = std::string(ansi::kBlue) + ansi::kCircle + ansi::kReset;
  std::string blinking = std::string(ansi::kBlink) + black_disc + ansi::kReset;
  EXPECT_NE(s.find(blinking), std::string::npos) << s;
  EXPECT_NE(s.find("Score: " + black_disc + " 4"), std::string::npos) << s;
  EXPECT_EQ(s.find(" X "), std::string::npos) << s;
}

TEST(Board, from_position_validation) {
  Bitboard a(BoardSize::k8x8);
  a.set(0, 0);
  EXPECT_THROW(Board::from_position(a, a, Color::kBlack), util::CleanException);
  EXPECT_THROW(Board::from_position(a, Bitboard(BoardSize::k6x6), Color::kBlack),
               util::CleanException);
  EXPECT_THROW(Board::from_position(a, Bitboard(BoardSize::k8x8), Color::kEmpty),
               util::CleanException);
}

TEST(Board, forced_game_over_and_restart) {
  Board board = play_all(BoardSize::k8x8, {"f5", "d6"});
  board.set_forced_game_over();
  EXPECT_TRUE(board.is_game_over());

  board.restart();
  EXPECT_FALSE(board.is_game_over());
  EXPECT_EQ(board, Board());
}

TEST(Board, explicit_pass) {
  // Black to move with no legal reply, white still has moves.
  Bitboard black(BoardSize::k6x6);
  Bitboard white(BoardSize::k6x6);
  white.set(0, 0);
  white.set(1, 0);
  black.set(2, 0);
  Board board = Board::from_position(black, white, Color::kBlack);
  ASSERT_FALSE(board.has_legal_move(Color::kBlack));
  ASSERT_TRUE(board.has_legal_move(Color::kWhite));

  EXPECT_EQ(board.play(Move::pass()), PlayOutcome::kContinued);
  EXPECT_EQ(board.current_player(), Color::kWhite);
  EXPECT_EQ(board.history().size(), 1);
  EXPECT_FALSE(board.history().back().forced);
  board.pop();
  EXPECT_EQ(board.current_player(), Color::kBlack);
}

TEST(Heuristics, start_position) {
  Board board;
  for (HeuristicKind kind : {HeuristicKind::kCornersCaptured, HeuristicKind::kCoinParity,
                             HeuristicKind::kMobility, HeuristicKind::kAllInOne}) {
    EXPECT_EQ(Heuristics::get(kind)(board, Color::kBlack), 0) << Heuristics::to_str(kind);
    EXPECT_EQ(Heuristics::get(kind)(board, Color::kWhite), 0) << Heuristics::to_str(kind);
  }
}

TEST(Heuristics, values) {
  Board board = play_all(BoardSize::k8x8, {"d3"});
  // 4 black vs 1 white
  EXPECT_EQ(Heuristics::coin_parity(board, Color::kBlack), 60);
  EXPECT_EQ(Heuristics::coin_parity(board, Color::kWhite), -60);

  Bitboard full = Bitboard::full(BoardSize::k6x6);
  Board black_only = Board::from_position(full, Bitboard(BoardSize::k6x6), Color::kWhite);
  EXPECT_EQ(Heuristics::corners_captured(black_only, Color::kBlack), 100);
  EXPECT_EQ(Heuristics::coin_parity(black_only, Color::kWhite), -100);
  EXPECT_EQ(Heuristics::mobility(black_only, Color::kBlack), 0);
  EXPECT_EQ(Heuristics::all_in_one(black_only, Color::kBlack),
            Heuristics::kCornersWeight * 100 + Heuristics::kCoinsWeight * 100);
}

TEST(Heuristics, bounds_and_symmetry) {
  std::vector<Heuristics::function_t> fns = {Heuristics::corners_captured, Heuristics::coin_parity,
                                              Heuristics::mobility};
  for (const Board& board : sample_positions(BoardSize::k8x8, 5, 7)) {
    for (Heuristics::function_t fn : fns) {
      int v = fn(board, Color::kBlack);
      ASSERT_GE(v, -100);
      ASSERT_LE(v, 100);
      ASSERT_EQ(fn(board, Color::kWhite), -v);
    }
  }
}

TEST(Heuristics, parse) {
  EXPECT_EQ(Heuristics::parse("corners_captured"), HeuristicKind::kCornersCaptured);
  EXPECT_EQ(Heuristics::parse("mobility"), HeuristicKind::kMobility);
  EXPECT_EQ(Heuristics::parse("default"), HeuristicKind::kAllInOne);
  EXPECT_EQ(Heuristics::parse("other"), HeuristicKind::kCoinParity);
  EXPECT_THROW(Heuristics::parse("greedy"), util::CleanException);
}

TEST(Search, minimax_alphabeta_agree) {
  std::vector<Board> positions = sample_positions(BoardSize::k6x6, 2, 3);
  positions.push_back(Board(BoardSize::k8x8));
  for (size_t i = 0; i < positions.size(); i += 3) {
    Board board = positions[i];
    Board original = board;
    for (int depth = 1; depth <= 4; ++depth) {
      for (Color max_player : {Color::kBlack, Color::kWhite}) {
        SearchStats mm_stats;
        SearchStats ab_stats;
        int mm = Search::minimax(board, depth, max_player, Heuristics::all_in_one, &mm_stats);
        int ab = Search::alphabeta(board, depth, -Search::kInfinity, Search::kInfinity,
                                   max_player, Heuristics::all_in_one, &ab_stats);
        ASSERT_EQ(mm, ab) << "position " << i << " depth " << depth;
        ASSERT_LE(ab_stats.nodes, mm_stats.nodes);
        ASSERT_EQ(mm_stats.cutoffs, 0);
        ASSERT_EQ(board, original);
      }
    }
  }
}

TEST(Search, alphabeta_prunes) {
  Board board;
  SearchStats mm_stats;
  SearchStats ab_stats;
  Search::minimax(board, 4, Color::kBlack, Heuristics::coin_parity, &mm_stats);
  Search::alphabeta(board, 4, -Search::kInfinity, Search::kInfinity, Color::kBlack,
                    Heuristics::coin_parity, &ab_stats);
  EXPECT_GT(ab_stats.cutoffs, 0);
  EXPECT_LT(ab_stats.nodes, mm_stats.nodes);
}

TEST(Search, find_best_move) {
  Board board;
  Move move = Search::find_best_move(board, 1, Color::kBlack, SearchAlgorithm::kMinimax,
                                     HeuristicKind::kCoinParity);
  EXPECT_EQ(move, (Move{3, 2}));

  for (int depth = 1; depth <= 3; ++depth) {
    Move mm = Search::find_best_move(board, depth, Color::kBlack, SearchAlgorithm::kMinimax,
                                     HeuristicKind::kAllInOne);
    Move ab = Search::find_best_move(board, depth, Color::kBlack, SearchAlgorithm::kAlphaBeta,
                                     HeuristicKind::kAllInOne);
    EXPECT_EQ(mm, ab) << depth;
    EXPECT_EQ(mm, Search::find_best_move(board, depth, Color::kBlack, SearchAlgorithm::kMinimax,
                                         HeuristicKind::kAllInOne));
    EXPECT_TRUE(board.legal_moves().get(mm.x, mm.y));
  }
  EXPECT_EQ(board, Board());
}

TEST(Search, find_best_move_edge_cases) {
  Board board;
  EXPECT_EQ(Search::find_best_move(board, 0, Color::kBlack, SearchAlgorithm::kMinimax,
                                   HeuristicKind::kAllInOne),
            Move::pass());

  Bitboard full = Bitboard::full(BoardSize::k8x8);
  Board over = Board::from_position(full, Bitboard(BoardSize::k8x8), Color::kBlack);
  EXPECT_EQ(Search::find_best_move(over, 3, Color::kBlack, SearchAlgorithm::kAlphaBeta,
                                   HeuristicKind::kAllInOne),
            Move::pass());

  Bitboard black(BoardSize::k6x6);
  Bitboard white(BoardSize::k6x6);
  white.set(0, 0);
  white.set(1, 0);
  black.set(2, 0);
  Board must_pass = Board::from_position(black, white, Color::kBlack);
  EXPECT_THROW(Search::find_best_move(must_pass, 2, Color::kBlack, SearchAlgorithm::kMinimax,
                                      HeuristicKind::kAllInOne),
               util::Exception);

  // The search itself passes for the side without moves.
  int mm = Search::minimax(must_pass, 2, Color::kBlack, Heuristics::coin_parity);
  int ab = Search::alphabeta(must_pass, 2, -Search::kInfinity, Search::kInfinity, Color::kBlack,
                             Heuristics::coin_parity);
  EXPECT_EQ(mm, ab);
  EXPECT_TRUE(must_pass.history().empty());
}

TEST(Search, random_move) {
  std::mt19937 prng(5);
  Board board;
  for (int i = 0; i < 20; ++i) {
    Move move = Search::random_move(prng, board);
    EXPECT_TRUE(board.legal_moves().get(move.x, move.y));
  }

  Bitboard full = Bitboard::full(BoardSize::k6x6);
  Board over = Board::from_position(full, Bitboard(BoardSize::k6x6), Color::kWhite);
  EXPECT_EQ(Search::random_move(prng, over), Move::pass());
}

TEST(Search, parse_algorithm) {
  EXPECT_EQ(Search::parse_algorithm("minimax"), SearchAlgorithm::kMinimax);
  EXPECT_EQ(Search::parse_algorithm("ab"), SearchAlgorithm::kAlphaBeta);
  EXPECT_EQ(Search::parse_algorithm("alphabeta"), SearchAlgorithm::kAlphaBeta);
  EXPECT_THROW(Search::parse_algorithm("mcts"), util::CleanException);
}

TEST(BoardParser, round_trip_with_history) {
  Board board = play_all(BoardSize::k8x8, {"f5", "d6", "c6", "b6", "d7"});
  std::string text = board.export_game();
  EXPECT_EQ(text.rfind("# reversi 8x8 save file\nO\n", 0), 0) << text;

  Board parsed = BoardParser::parse(text);
  EXPECT_EQ(parsed, board);
  EXPECT_EQ(parsed.history().size(), 5);
}

TEST(BoardParser, round_trip_with_automatic_pass) {
  Board board = play_all(BoardSize::k6x6, kPassingGame6x6);
  Board parsed = BoardParser::parse(board.export_game());
  EXPECT_EQ(parsed, board);
  EXPECT_TRUE(parsed.is_game_over());

  // Partway through, right after the automatic pass.
  board.pop();
  parsed = BoardParser::parse(board.export_game());
  EXPECT_EQ(parsed, board);
  EXPECT_TRUE(parsed.history().back().forced);
}

TEST(BoardParser, snapshot_only) {
  Bitboard white(BoardSize::k8x8, 0x101018000000ULL);
  Bitboard black(BoardSize::k8x8, 0x10000820000000ULL);
  Board board = Board::from_position(black, white, Color::kWhite);

  std::string text = board.export_game();
  EXPECT_EQ(text.find("1."), std::string::npos) << text;

  Board parsed = BoardParser::parse(text);
  EXPECT_EQ(parsed, board);
  EXPECT_FALSE(parsed.history_from_start());
  EXPECT_TRUE(parsed.history().empty());
}

TEST(BoardParser, comments_and_blank_lines) {
  std::string text =
    "# a 6x6 game\n"
    "\n"
    "X   # black to move\n"
    "_ _ _ _ _ _\n"
    "_ _ _ _ _ _\n"
    "_ _ O X _ _\n"
    "_ _ X O _ _\n"
    "\n"
    "_ _ _ _ _ _\n"
    "_ _ _ _ _ _\n";
  Board parsed = BoardParser::parse(text);
  EXPECT_EQ(parsed.size(), BoardSize::k6x6);
  EXPECT_EQ(parsed.black(), Board(BoardSize::k6x6).black());
  EXPECT_EQ(parsed.white(), Board(BoardSize::k6x6).white());
  EXPECT_EQ(parsed.current_player(), Color::kBlack);
}

namespace {

const std::string kStartGrid6x6 =
  "_ _ _ _ _ _\n"
  "_ _ _ _ _ _\n"
  "_ _ O X _ _\n"
  "_ _ X O _ _\n"
  "_ _ _ _ _ _\n"
  "_ _ _ _ _ _\n";

// After "1. X d5".
const std::string kAfterD5Grid6x6 =
  "_ _ _ _ _ _\n"
  "_ _ _ _ _ _\n"
  "_ _ O X _ _\n"
  "_ _ X X _ _\n"
  "_ _ _ X _ _\n"
  "_ _ _ _ _ _\n";

int parse_error_line(const std::string& text) {
  try {
    BoardParser::parse(text);
  } catch (const ParseError& e) {
    return e.line();
  }
  return -1;
}

std::string parse_error_message(const std::string& text) {
  try {
    BoardParser::parse(text);
  } catch (const ParseError& e) {
    return e.message();
  }
  return "";
}

}  // namespace

TEST(BoardParser, errors) {
  EXPECT_THROW(BoardParser::parse(""), ParseError);
  EXPECT_THROW(BoardParser::parse("# nothing\n"), ParseError);

  // bad side to move
  EXPECT_EQ(parse_error_line("Z\n" + kStartGrid6x6), 1);
  EXPECT_EQ(parse_error_line("X O\n" + kStartGrid6x6), 1);

  // missing grid
  EXPECT_THROW(BoardParser::parse("X\n"), ParseError);

  // grid row of an unsupported size
  EXPECT_EQ(parse_error_line("X\n_ _ _ _ _ _ _\n"), 2);

  // ragged grid
  std::string ragged = "X\n" + kStartGrid6x6;
  ragged.replace(ragged.find("_ _ O X _ _"), 11, "_ _ O X _");
  EXPECT_EQ(parse_error_line(ragged), 4);

  // invalid cell
  std::string bad_cell = "X\n" + kStartGrid6x6;
  bad_cell[2] = 'Q';
  EXPECT_EQ(parse_error_line(bad_cell), 2);

  // too few rows
  EXPECT_THROW(BoardParser::parse("X\n_ _ _ _ _ _\n_ _ _ _ _ _\n"), ParseError);

  // off-by-one turn number
  EXPECT_EQ(parse_error_message("O\n" + kAfterD5Grid6x6 + "\n2. X d5\n"),
            "incorrect turn number in history (expected 1, got 2)");
  EXPECT_EQ(parse_error_line("O\n" + kAfterD5Grid6x6 + "\n2. X d5\n"), 9);

  // illegal move in history
  EXPECT_EQ(parse_error_line("O\n" + kAfterD5Grid6x6 + "\n1. X a1\n"), 9);

  // malformed move token
  EXPECT_EQ(parse_error_line("O\n" + kAfterD5Grid6x6 + "\n1. X zz\n"), 9);

  // history does not lead to the grid
  EXPECT_EQ(parse_error_message("X\n" + kAfterD5Grid6x6 + "\n1. X d5\n"),
            "replayed history does not match the board");
  EXPECT_EQ(parse_error_message("O\n" + kStartGrid6x6 + "\n1. X d5\n"),
            "replayed history does not match the board");

  // wrong color marker
  EXPECT_THROW(BoardParser::parse("O\n" + kAfterD5Grid6x6 + "\n1. O d5\n"), ParseError);

  // the automatic pass must be written out
  Board board = play_all(BoardSize::k6x6, kPassingGame6x6);
  std::string text = board.export_game();
  size_t pos = text.find("9. X -1-1 O a6");
  ASSERT_NE(pos, std::string::npos);
  std::string missing_pass = text;
  missing_pass.replace(pos, 14, "9. X a6");
  EXPECT_THROW(BoardParser::parse(missing_pass), ParseError);
}

TEST(BoardParser, error_what) {
  ParseError e("bad thing", 4);
  EXPECT_STREQ(e.what(), "bad thing at line 4");
  EXPECT_EQ(e.message(), "bad thing");
  EXPECT_EQ(e.line(), 4);
}

TEST(SaveFile, save_and_load) {
  boost::filesystem::path path = make_temp_path();
  Board board = play_all(BoardSize::k10x10, {"g6", "e7"});
  SaveFile::save(board, path);
  EXPECT_EQ(SaveFile::load(path), board);
  boost::filesystem::remove(path);

  EXPECT_THROW(SaveFile::load(path), util::CleanException);
}

TEST(HumanTuiPlayer, parse_command) {
  using R = PlayerResponse;
  EXPECT_EQ(HumanTuiPlayer::parse_command("d3", 8), R(Move{3, 2}));
  EXPECT_EQ(HumanTuiPlayer::parse_command("  D3 \n", 8), R(Move{3, 2}));
  EXPECT_EQ(HumanTuiPlayer::parse_command("l12", 12), R(Move{11, 11}));
  EXPECT_EQ(HumanTuiPlayer::parse_command("u", 8), R::undo());
  EXPECT_EQ(HumanTuiPlayer::parse_command("restart", 8), R::restart());
  EXPECT_EQ(HumanTuiPlayer::parse_command("s", 8), R::save_and_quit());
  EXPECT_EQ(HumanTuiPlayer::parse_command("sh", 8), R::save_and_quit());
  EXPECT_EQ(HumanTuiPlayer::parse_command("ff", 8), R::forfeit());
  EXPECT_EQ(HumanTuiPlayer::parse_command("q", 8), R::quit());
  EXPECT_EQ(HumanTuiPlayer::parse_command("?", 8), R::help());
  EXPECT_EQ(HumanTuiPlayer::parse_command("r", 8), R::rules());
  EXPECT_EQ(HumanTuiPlayer::parse_command("rules", 8).type(), R::kInvalidResponse);

  EXPECT_EQ(HumanTuiPlayer::parse_command("i9", 8).type(), R::kInvalidResponse);
  EXPECT_EQ(HumanTuiPlayer::parse_command("-1-1", 8).type(), R::kInvalidResponse);
  EXPECT_EQ(HumanTuiPlayer::parse_command("", 8).type(), R::kInvalidResponse);
  EXPECT_EQ(HumanTuiPlayer::parse_command("undo", 8).type(), R::kInvalidResponse);
}

TEST(HumanTuiPlayer, get_response) {
  std::istringstream in("zz\n?\nr\na1\nd3\n");
  std::ostringstream out;
  HumanTuiPlayer player(in, out);
  player.init_game(Color::kBlack);

  PlayerResponse response = player.get_response(Board());
  EXPECT_EQ(response, PlayerResponse(Move{3, 2}));
  EXPECT_NE(out.str().find("Invalid input!"), std::string::npos);
  EXPECT_NE(out.str().find("Commands:"), std::string::npos);
  EXPECT_NE(out.str().find("Rules:"), std::string::npos);
  EXPECT_NE(out.str().find("Illegal move a1!"), std::string::npos);

  // end of input
  EXPECT_EQ(player.get_response(Board()), PlayerResponse::quit());
}

TEST(GameRunner, random_vs_random) {
  util::Random::set_seed(11);
  for (BoardSize size : {BoardSize::k6x6, BoardSize::k8x8}) {
    std::ostringstream out;
    GameRunner runner(Board(size), std::make_unique<RandomPlayer>(),
                      std::make_unique<RandomPlayer>(), make_temp_path(), out);
    GameRunner::Result result = runner.run();

    EXPECT_EQ(result.end, GameRunner::Result::kCompleted);
    EXPECT_TRUE(runner.board().is_game_over());
    EXPECT_EQ(result.black_discs, runner.board().popcount(Color::kBlack));
    EXPECT_EQ(result.white_discs, runner.board().popcount(Color::kWhite));
    EXPECT_EQ(result.winner, runner.board().winner());
    EXPECT_NE(out.str().find("Final score:"), std::string::npos);
  }
}

TEST(GameRunner, search_vs_random) {
  util::Random::set_seed(3);
  SearchPlayer::Params params;
  params.depth = 2;
  params.algorithm = SearchAlgorithm::kAlphaBeta;

  auto search_player = std::make_unique<SearchPlayer>(params);
  SearchPlayer* search_ptr = search_player.get();

  std::ostringstream out;
  GameRunner runner(Board(BoardSize::k6x6), std::move(search_player),
                    std::make_unique<RandomPlayer>(), make_temp_path(), out);
  GameRunner::Result result = runner.run();
  EXPECT_EQ(result.end, GameRunner::Result::kCompleted);
  EXPECT_GT(search_ptr->total_stats().nodes, 0);
}

TEST(GameRunner, undo_returns_to_human_turn) {
  util::Random::set_seed(1);
  std::istringstream in("d3\nu\nq\n");
  std::ostringstream out;
  GameRunner runner(Board(), std::make_unique<HumanTuiPlayer>(in, out),
                    std::make_unique<RandomPlayer>(), make_temp_path(), out);
  GameRunner::Result result = runner.run();

  EXPECT_EQ(result.end, GameRunner::Result::kQuit);
  EXPECT_EQ(runner.board(), Board());
}

TEST(GameRunner, undo_with_empty_history) {
  std::istringstream in("u\nq\n");
  std::ostringstream out;
  GameRunner runner(Board(), std::make_unique<HumanTuiPlayer>(in, out),
                    std::make_unique<RandomPlayer>(), make_temp_path(), out);
  runner.run();
  EXPECT_NE(out.str().find("Nothing to undo."), std::string::npos);
}

TEST(GameRunner, forfeit) {
  std::istringstream in("ff\n");
  std::ostringstream out;
  GameRunner runner(Board(), std::make_unique<HumanTuiPlayer>(in, out),
                    std::make_unique<RandomPlayer>(), make_temp_path(), out);
  GameRunner::Result result = runner.run();
  EXPECT_EQ(result.end, GameRunner::Result::kForfeited);
  EXPECT_EQ(result.winner, Color::kWhite);
}

TEST(GameRunner, save_and_quit) {
  util::Random::set_seed(2);
  boost::filesystem::path path = make_temp_path();
  std::istringstream in("f5\ns\n");
  std::ostringstream out;
  GameRunner runner(Board(), std::make_unique<HumanTuiPlayer>(in, out),
                    std::make_unique<RandomPlayer>(), path, out);
  GameRunner::Result result = runner.run();

  EXPECT_EQ(result.end, GameRunner::Result::kSaved);
  EXPECT_EQ(runner.board().history().size(), 2);
  EXPECT_EQ(SaveFile::load(path), runner.board());
  boost::filesystem::remove(path);
}

TEST(GameRunner, restart) {
  std::istringstream in("restart\nq\n");
  std::ostringstream out;
  Board board = play_all(BoardSize::k8x8, {"f5", "d6"});
  GameRunner runner(board, std::make_unique<HumanTuiPlayer>(in, out),
                    std::make_unique<RandomPlayer>(), make_temp_path(), out);
  runner.run();
  EXPECT_EQ(runner.board(), Board());
}

TEST(GameRunner, loaded_position_without_moves_passes) {
  Bitboard black(BoardSize::k6x6);
  Bitboard white(BoardSize::k6x6);
  white.set(0, 0);
  white.set(1, 0);
  black.set(2, 0);
  Board board = Board::from_position(black, white, Color::kBlack);

  std::ostringstream out;
  GameRunner runner(board, std::make_unique<RandomPlayer>(), std::make_unique<RandomPlayer>(),
                    make_temp_path(), out);
  GameRunner::Result result = runner.run();
  EXPECT_EQ(result.end, GameRunner::Result::kCompleted);
  EXPECT_EQ(runner.board().history().front().move, Move::pass());
  EXPECT_NE(out.str().find("has no legal move and passes."), std::string::npos);
}

TEST(GameParams, validate) {
  GameParams params;
  EXPECT_NO_THROW(params.validate());
  EXPECT_EQ(params.get_board_size(), BoardSize::k8x8);
  EXPECT_FALSE(params.is_computer(Color::kBlack));

  params.ai = "A";
  EXPECT_TRUE(params.is_computer(Color::kBlack));
  EXPECT_TRUE(params.is_computer(Color::kWhite));
  params.ai = "O";
  EXPECT_FALSE(params.is_computer(Color::kBlack));
  EXPECT_TRUE(params.is_computer(Color::kWhite));

  params.ai_mode = "ab";
  params.ai_heuristic = "other";
  SearchPlayer::Params search_params = params.get_search_params();
  EXPECT_EQ(search_params.algorithm, SearchAlgorithm::kAlphaBeta);
  EXPECT_EQ(search_params.heuristic, HeuristicKind::kCoinParity);
  EXPECT_EQ(search_params.depth, 3);

  GameParams bad_size;
  bad_size.board_size = 9;
  EXPECT_THROW(bad_size.validate(), util::CleanException);

  GameParams bad_depth;
  bad_depth.ai_depth = 0;
  EXPECT_THROW(bad_depth.validate(), util::CleanException);

  GameParams bad_ai;
  bad_ai.ai = "B";
  EXPECT_THROW(bad_ai.validate(), util::CleanException);

  GameParams bad_mode;
  bad_mode.ai_mode = "mcts";
  EXPECT_THROW(bad_mode.validate(), util::CleanException);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
