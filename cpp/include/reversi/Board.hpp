#pragma once

#include "reversi/BasicTypes.hpp"
#include "reversi/Bitboard.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace reversi {

/*
 * Game state: one Bitboard per color, the side to move, and an undo log.
 *
 * The only mutators are play(), pop() and restart(). play() pushes a HistoryEntry holding the
 * bitboards from before the move, so pop() restores them without recomputation. Search uses this
 * push/pop pair to walk the game tree depth-first on a single Board.
 *
 * Passes are recorded in the history like any other move, so entries always alternate black,
 * white, black, ... and turn_number() is history().size() / 2 + 1.
 *
 * Not thread-safe. Parallel callers must each work on their own copy.
 */
class Board {
 public:
  struct HistoryEntry {
    Bitboard black;
    Bitboard white;
    Move move;
    Color player;
    bool forced;  // automatic pass recorded by play(), undone together with the move before it

    bool operator==(const HistoryEntry&) const = default;
  };
  using history_t = std::vector<HistoryEntry>;

  // Canonical four-disc start, black to move.
  explicit Board(BoardSize size = BoardSize::k8x8);

  /*
   * An arbitrary position with an empty history. Since the history does not lead back to the
   * canonical start, export_game() will write only the snapshot.
   *
   * Throws util::CleanException if the two bitboards overlap or differ in size.
   */
  static Board from_position(const Bitboard& black, const Bitboard& white, Color current_player);

  BoardSize size() const { return size_; }
  int dim() const { return dimension(size_); }
  Color current_player() const { return current_player_; }
  const Bitboard& black() const { return black_; }
  const Bitboard& white() const { return white_; }
  const Bitboard& discs(Color color) const;
  const history_t& history() const { return history_; }
  bool history_from_start() const { return history_from_start_; }
  int turn_number() const { return history_.size() / 2 + 1; }

  Bitboard empty_cells() const;
  Bitboard legal_moves(Color player) const;
  Bitboard legal_moves() const { return legal_moves(current_player_); }
  bool has_legal_move(Color player) const { return !legal_moves(player).empty(); }

  /*
   * Cells that end up player's color if player places a disc at (x, y), the placed disc included.
   *
   * Does not check legality: for an illegal (x, y) the result is meaningless.
   */
  Bitboard capture_mask(int x, int y, Color player) const;

  /*
   * Plays (x, y) for the current player. (-1, -1) passes, which is only legal when the current
   * player has no legal move.
   *
   * Throws IllegalMoveError, leaving the board untouched, if the move is not legal.
   */
  PlayOutcome play(int x, int y);
  PlayOutcome play(const Move& move) { return play(move.x, move.y); }

  // Undoes the last play() call. Throws CannotUndoError if the history is empty.
  void pop();

  bool is_game_over() const;
  void set_forced_game_over(bool value = true) { forced_game_over_ = value; }
  void restart();

  int popcount(Color color) const { return discs(color).popcount(); }
  Color get_player_at(int x, int y) const;

  // kEmpty on a tie.
  Color winner() const;

  /*
   * Same layout as Bitboard::to_string(), with X for black, O for white and _ for empty. With
   * show_legal_moves, the current player's legal destinations are shown as '.'.
   */
  std::string to_string(bool show_legal_moves = false) const;

  /*
   * Pretty-prints the board for a terminal: colored discs, legal moves, the last move blinking,
   * and the disc count. Falls back to the to_string() glyphs in util::Rendering::kText mode.
   */
  void print(std::ostream& os, const Move& last_move = Move::pass()) const;

  // Save-file text: comment, side to move, grid and, when replayable, the history.
  std::string export_game() const;

  // "1. X f5 O d6" lines, one per turn.
  std::string export_history() const;

  bool operator==(const Board&) const = default;

 private:
  Bitboard& mutable_discs(Color color);
  void apply(const Bitboard& capture, Color player);
  void push_history(const Move& move, Color player, bool forced);

  BoardSize size_;
  Bitboard black_;
  Bitboard white_;
  Color current_player_ = Color::kBlack;
  history_t history_;
  bool forced_game_over_ = false;
  bool history_from_start_ = true;
};

}  // namespace reversi
