#pragma once

#include <string>
#include <vector>

namespace util {

/*
 * With an empty separator, splits on runs of whitespace and drops empty tokens. Otherwise splits on
 * every occurrence of t, keeping empty tokens: split("a,,b", ",") is {"a", "", "b"}.
 */
std::vector<std::string> split(const std::string& s, const char* t = "");

/*
 * Same tokens as split(s, t), written into the front of result. result never shrinks: entries past
 * the returned token count are stale. Lets the save-file parser reuse one vector for every line.
 */
int split(std::vector<std::string>& result, const std::string& s, const char* t = "");

// Lines of s without their '\n' or "\r\n" terminators. A final unterminated line is kept.
std::vector<std::string> splitlines(const std::string& s);

// s without leading and trailing whitespace.
std::string strip(const std::string& s);

}  // namespace util

#include "inline/util/StringUtil.inl"
