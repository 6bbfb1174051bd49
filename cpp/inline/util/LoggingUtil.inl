#include "util/LoggingUtil.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace util {

inline auto Logging::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Logging options");

  return desc
    .template add_option<"log-level">(po::value<std::string>(&log_level)->default_value(log_level),
                                      "trace, debug, info, warn, error or off")
    .template add_option<"log-filename">(po::value<std::string>(&log_filename),
                                         "also write the log to this file")
    .template add_flag<"log-append-mode", "log-write-mode">(
      &append_mode, "append to --log-filename", "truncate --log-filename")
    .template add_flag<"omit-timestamps", "include-timestamps">(
      &omit_timestamps, "bare log lines", "prefix log lines with a timestamp");
}

}  // namespace util
