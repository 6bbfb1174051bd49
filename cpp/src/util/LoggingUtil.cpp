#include "util/LoggingUtil.hpp"

#include "util/Exceptions.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace util {

void Logging::init(const Params& params) {
  spdlog::level::level_enum level = spdlog::level::from_str(params.log_level);
  if (level == spdlog::level::off && params.log_level != "off") {
    throw util::CleanException("Unknown log level '{}'", params.log_level);
  }

  const char* pattern = params.omit_timestamps ? "[%l] %v" : "%Y-%m-%d %H:%M:%S.%e [%l] %v";

  // stdout belongs to the board display
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!params.log_filename.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename,
                                                                         !params.append_mode));
  }
  for (auto& sink : sinks) {
    sink->set_pattern(pattern);
  }

  auto logger = std::make_shared<spdlog::logger>("reversi", sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}

}  // namespace util
