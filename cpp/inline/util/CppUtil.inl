#include "util/CppUtil.hpp"

namespace util {

template <int N, typename T, typename U>
void stuff_back(std::vector<T>& vec, const U& u) {
  if constexpr (N >= 0) {
    if (vec.size() > size_t(N)) {
      std::move(vec.begin() + 1, vec.end(), vec.begin());
      vec.back() = u;
      return;
    }
  }
  vec.push_back(u);
}

}  // namespace util
