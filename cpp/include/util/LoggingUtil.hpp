#pragma once

#include "util/CppUtil.hpp"

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

#include <string>

/*
 * LOG_TRACE(), LOG_DEBUG(), LOG_INFO(), LOG_WARN(), LOG_ERROR() take fmt-style arguments:
 *
 * LOG_INFO("{} played {}", player, move);
 *
 * LOG_TRACE() and LOG_DEBUG() compile to nothing unless the build sets
 * -DREVERSI_ENABLE_DEBUG_LOGGING=ON. What survives compilation is further filtered at runtime by
 * --log-level.
 */

#define LOG_TRACE(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_TRACE(__VA_ARGS__);    \
  } while (0)

#define LOG_DEBUG(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_DEBUG(__VA_ARGS__);    \
  } while (0)

#define LOG_INFO(...)             \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_INFO(__VA_ARGS__);     \
  } while (0)

#define LOG_WARN(...)             \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_WARN(__VA_ARGS__);     \
  } while (0)

#define LOG_ERROR(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_ERROR(__VA_ARGS__);    \
  } while (0)

namespace util {

struct Logging {
  struct Params {
    auto make_options_description();

    std::string log_level = "info";
    std::string log_filename;  // in addition to stderr
    bool append_mode = false;
    bool omit_timestamps = false;
  };

  // Installs the "reversi" logger as spdlog's default. Throws util::CleanException on an unknown
  // log level.
  static void init(const Params&);
};

}  // namespace util

#include "inline/util/LoggingUtil.inl"
