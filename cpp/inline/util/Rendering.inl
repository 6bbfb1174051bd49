#include "util/Rendering.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"

#include <boost/program_options.hpp>

namespace util {

inline auto Rendering::Params::make_options_description() {
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Display options");

  return desc.template add_flag<"no-color", "color">(
    &no_color, "plain text output, even on a terminal", "ANSI colors when stdout is a terminal");
}

inline Rendering::Guard::Guard(Mode mode) { push(mode); }

inline Rendering::Guard::~Guard() { pop(); }

inline void Rendering::init(const Params& params) {
  if (params.no_color) set(kText);
}

inline Rendering::Mode Rendering::mode() { return instance().mode_stack_.back(); }

inline void Rendering::set(Mode mode) { instance().mode_stack_.front() = mode; }

inline void Rendering::push(Mode mode) { instance().mode_stack_.push_back(mode); }

inline void Rendering::pop() {
  std::vector<Mode>& stack = instance().mode_stack_;
  if (stack.size() <= 1) {
    throw util::Exception("Rendering::pop() called without a matching push()");
  }
  stack.pop_back();
}

inline Rendering::Rendering() : mode_stack_{isatty(STDOUT_FILENO) ? kTerminal : kText} {}

inline Rendering& Rendering::instance() {
  static Rendering instance;
  return instance;
}

}  // namespace util
