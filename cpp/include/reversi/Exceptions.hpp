#pragma once

#include "reversi/BasicTypes.hpp"
#include "util/Exceptions.hpp"

#include <string>

/*
 * Engine errors. All of them propagate to the caller; nothing in the engine catches them.
 *
 * The util::CleanException subclasses describe bad input (a user's move, a save file, a
 * command-line value). The plain util::Exception subclasses describe bugs in the caller.
 */
namespace reversi {

class IllegalMoveError : public util::CleanException {
 public:
  IllegalMoveError(int x, int y, Color player);

  int x() const { return x_; }
  int y() const { return y_; }
  Color player() const { return player_; }

 private:
  int x_;
  int y_;
  Color player_;
};

// Raised by Board::pop() on an empty history.
class CannotUndoError : public util::Exception {
 public:
  CannotUndoError() : util::Exception("Cannot undo: history is empty") {}
};

class IllegalBoardSizeError : public util::CleanException {
 public:
  explicit IllegalBoardSizeError(int n)
      : util::CleanException("Illegal board size {} (expected 6, 8, 10 or 12)", n) {}
};

class IndexOutOfBoundsError : public util::Exception {
 public:
  IndexOutOfBoundsError(int x, int y, int dim)
      : util::Exception("Cell ({}, {}) is outside of the {}x{} board", x, y, dim, dim) {}
};

// line is 1-based.
class ParseError : public util::CleanException {
 public:
  ParseError(const std::string& message, int line)
      : util::CleanException("{} at line {}", message, line), message_(message), line_(line) {}

  const std::string& message() const { return message_; }
  int line() const { return line_; }

 private:
  std::string message_;
  int line_;
};

}  // namespace reversi
