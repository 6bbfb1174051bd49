#include "util/StringUtil.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace util {

namespace detail {

inline bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)); }

}  // namespace detail

inline std::vector<std::string> split(const std::string& s, const char* t) {
  std::vector<std::string> tokens;
  tokens.resize(split(tokens, s, t));
  return tokens;
}

inline int split(std::vector<std::string>& result, const std::string& s, const char* t) {
  int n = 0;
  auto store = [&](std::string_view token) {
    if (n < (int)result.size()) {
      result[n].assign(token);
    } else {
      result.emplace_back(token);
    }
    n++;
  };

  std::string_view view(s);
  std::string_view sep(t);
  if (sep.empty()) {
    auto it = view.begin();
    while (true) {
      it = std::find_if_not(it, view.end(), detail::is_space);
      if (it == view.end()) break;
      auto token_end = std::find_if(it, view.end(), detail::is_space);
      store(std::string_view(&*it, token_end - it));
      it = token_end;
    }
    return n;
  }

  size_t pos = 0;
  for (size_t hit = view.find(sep); hit != std::string_view::npos; hit = view.find(sep, pos)) {
    store(view.substr(pos, hit - pos));
    pos = hit + sep.size();
  }
  store(view.substr(pos));
  return n;
}

inline std::vector<std::string> splitlines(const std::string& s) {
  std::vector<std::string> lines;
  size_t pos = 0;
  while (pos < s.size()) {
    size_t eol = s.find('\n', pos);
    if (eol == std::string::npos) eol = s.size();
    std::string line = s.substr(pos, eol - pos);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
    pos = eol + 1;
  }
  return lines;
}

inline std::string strip(const std::string& s) {
  auto first = std::find_if_not(s.begin(), s.end(), detail::is_space);
  auto last = std::find_if_not(s.rbegin(), std::string::const_reverse_iterator(first),
                               detail::is_space)
                .base();
  return std::string(first, last);
}

}  // namespace util
