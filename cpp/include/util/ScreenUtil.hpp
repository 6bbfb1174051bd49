#pragma once

#include <ostream>

namespace util {

// Terminal width in columns, or 80 when stdout is not a terminal. Used to wrap --help output.
int get_screen_width();

// Writes the ANSI clear-screen sequence to os. Callers check util::Rendering::mode() first.
void clearscreen(std::ostream& os);

}  // namespace util

#include "inline/util/ScreenUtil.inl"
