#pragma once

#include "util/Rendering.hpp"

#include <string>

/*
 * ANSI escape sequences for board printing.
 *
 * Use ansi::style() rather than the raw codes: in util::Rendering::kText mode it returns the text
 * unchanged, so that piped output and test expectations stay free of escape sequences.
 */
namespace ansi {

inline constexpr const char* kBlink = "\033[5m";
inline constexpr const char* kGreen = "\033[32m";
inline constexpr const char* kBlue = "\033[34m";
inline constexpr const char* kWhite = "\033[37m";
inline constexpr const char* kReset = "\033[00m";

inline constexpr const char* kCircle = "●";

// code + text + kReset in kTerminal mode, text otherwise.
inline std::string style(const char* code, const std::string& text) {
  if (util::Rendering::mode() != util::Rendering::kTerminal) return text;
  return code + text + kReset;
}

}  // namespace ansi
