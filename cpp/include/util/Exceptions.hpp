#pragma once

#include <fmt/format.h>

#include <exception>
#include <string>
#include <utility>

namespace util {

// std::exception carrying an fmt-formatted message: throw util::Exception("bad size {}", n);
class Exception : public std::exception {
 public:
  Exception() = default;

  template <typename... Ts>
  Exception(fmt::format_string<Ts...> fmt, Ts&&... ts)
      : what_(fmt::format(fmt, std::forward<Ts>(ts)...)) {}

  const char* what() const noexcept override { return what_.c_str(); }

 private:
  std::string what_;
};

/*
 * An error caused by the user rather than by a bug, such as a bad command-line value or a
 * malformed save file. main() prints the message and exits with status 1, without a core dump.
 */
class CleanException : public Exception {
 public:
  using Exception::Exception;
};

// Thrown by the *_ASSERT() macros of util/Asserts.hpp.
class DebugAssertionError : public Exception {
 public:
  static constexpr const char* descr() { return "DEBUG_ASSERT"; }
  using Exception::Exception;
};

class ReleaseAssertionError : public Exception {
 public:
  static constexpr const char* descr() { return "RELEASE_ASSERT"; }
  using Exception::Exception;
};

class CleanAssertionError : public CleanException {
 public:
  static constexpr const char* descr() { return "CLEAN_ASSERT"; }
  using CleanException::CleanException;
};

}  // namespace util
