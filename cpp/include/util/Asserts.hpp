#pragma once

#include "util/CppUtil.hpp"
#include "util/Exceptions.hpp"

#include <fmt/format.h>

#include <source_location>

/*
 * DEBUG_ASSERT(cond, ...)    util::DebugAssertionError; checked in debug builds only
 * RELEASE_ASSERT(cond, ...)  util::ReleaseAssertionError; always checked
 * CLEAN_ASSERT(cond, ...)    util::CleanAssertionError; always checked, for user-facing errors
 *
 * The optional trailing arguments are an fmt format string and its arguments. Without them the
 * message is the stringified condition. A disabled DEBUG_ASSERT() still compiles its arguments but
 * never evaluates them.
 */

#define DEBUG_ASSERT(COND, ...)                                                                    \
  do {                                                                                             \
    if (IS_DEFINED(DEBUG_BUILD)) {                                                                 \
      util::detail::assert_impl<util::DebugAssertionError>(#COND, std::source_location::current(), \
                                                           COND, ##__VA_ARGS__);                   \
    }                                                                                              \
  } while (0)

#define RELEASE_ASSERT(COND, ...)                                                                  \
  do {                                                                                             \
    util::detail::assert_impl<util::ReleaseAssertionError>(#COND, std::source_location::current(), \
                                                           COND, ##__VA_ARGS__);                   \
  } while (0)

#define CLEAN_ASSERT(COND, ...)                                                                  \
  do {                                                                                           \
    util::detail::assert_impl<util::CleanAssertionError>(#COND, std::source_location::current(), \
                                                         COND, ##__VA_ARGS__);                   \
  } while (0)

namespace util {
namespace detail {

template <typename ExceptionT, typename... Ts>
inline void assert_impl([[maybe_unused]] const char* cond_str, const std::source_location& loc,
                        bool cond, fmt::format_string<Ts...> fmt, Ts&&... ts) {
  if (!cond) {
    throw ExceptionT("{} failed: {} [{}:{}]", ExceptionT::descr(),
                     fmt::format(fmt, std::forward<Ts>(ts)...), loc.file_name(), loc.line());
  }
}

template <typename ExceptionT>
inline void assert_impl(const char* cond_str, const std::source_location& loc, bool cond) {
  if (!cond) {
    throw ExceptionT("{} failed: {} [{}:{}]", ExceptionT::descr(), cond_str, loc.file_name(),
                     loc.line());
  }
}

}  // namespace detail
}  // namespace util
