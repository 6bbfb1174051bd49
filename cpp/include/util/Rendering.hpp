#pragma once

#include <cstdint>
#include <unistd.h>
#include <vector>

namespace util {

/*
 * Whether board output may use ANSI colors and glyphs (kTerminal) or must stay plain text (kText).
 *
 * The base mode is kTerminal if stdout is a tty, kText otherwise. --no-color forces kText, and the
 * gtest launcher forces kText so that expected strings do not depend on how the tests are run.
 *
 * The mode can be temporarily overridden with the RAII Guard:
 *
 *   {
 *     util::Rendering::Guard g(util::Rendering::kText);
 *     board.print(ss);
 *   }
 */
class Rendering {
 public:
  enum Mode : int8_t { kText, kTerminal };

  struct Params {
    auto make_options_description();

    bool no_color = false;
  };

  struct Guard {
    Guard(Mode mode);
    ~Guard();
  };

  static void init(const Params& params);

  static Mode mode();

  // Sets the base rendering mode (bottom of the stack).
  static void set(Mode mode);

  static void push(Mode mode);

  // Throws util::Exception if this would leave the stack empty.
  static void pop();

 private:
  Rendering();
  static Rendering& instance();

  std::vector<Mode> mode_stack_;
};

}  // namespace util

#include "inline/util/Rendering.inl"
