#pragma once

#include <concepts>
#include <random>
#include <vector>

namespace util {

/*
 * Process-wide PRNG plus a few sampling helpers.
 *
 * The default prng is seeded from the clock. --seed N (see Params) or set_seed() makes runs
 * reproducible; the unit tests seed it explicitly before every randomized game.
 *
 * Helpers come in pairs: one taking an explicit std::mt19937, one drawing from default_prng().
 */
class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;  // 0: keep the clock-based seed
  };

  static void init(const Params&);
  static void set_seed(int seed);
  static std::mt19937& default_prng();

  // A value in [lower, upper). Throws util::Exception if the range is empty.
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  template <std::integral T, std::integral U>
  static auto uniform_sample(T lower, U upper);

  // A uniformly chosen element. Throws util::Exception if values is empty.
  template <typename T>
  static const T& choice(std::mt19937& prng, const std::vector<T>& values);

  template <typename T>
  static const T& choice(const std::vector<T>& values);
};

}  // namespace util

#include "inline/util/Random.inl"
