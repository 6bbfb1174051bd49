#pragma once

#include <algorithm>
#include <cstddef>
#include <type_traits>
#include <utility>
#include <vector>

#define XSTR(a) STR(a)
#define STR(a) #a

/*
 * Constexpr check of whether a macro is defined to 1, as done by -DFOO=1 in CMakeLists.txt:
 *
 * #define FOO 1
 * // BAR not defined
 *
 * static_assert(IS_DEFINED(FOO))
 * static_assert(!IS_DEFINED(BAR))
 */
#define IS_DEFINED(macro) (XSTR(macro)[0] == '1')

/*
 * USE_UNEVALUATED(args...) marks every argument as used without evaluating any of them. The
 * LOG_*() macros rely on this so that variables referenced only in compiled-out log statements
 * don't trigger unused-variable warnings.
 */
#define USE_UNEVALUATED(...) ((void)sizeof(::util::detail::unevaluated_sink(__VA_ARGS__)))

namespace util {

namespace detail {

// Declared but never defined. Only ever appears inside sizeof().
template <typename... Ts>
char unevaluated_sink(Ts&&...);

}  // namespace detail

// A string literal usable as a template argument: foo<"bar">().
template <size_t N>
struct StringLiteral {
  constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }

  template <size_t M>
  constexpr bool operator==(const StringLiteral<M>& other) const {
    if (N != M) return false;
    return std::equal(value, value + N, other.value);
  }

  char value[N];
};

template <StringLiteral...>
struct StringLiteralSequence {};

template <int... Ints>
using int_sequence = std::integer_sequence<int, Ints...>;

template <typename T>
struct is_int_sequence : std::false_type {};
template <int... Ints>
struct is_int_sequence<int_sequence<Ints...>> : std::true_type {};

namespace concepts {

template <typename T>
concept IntSequence = is_int_sequence<T>::value;

}  // namespace concepts

// Membership tests: has_int_v<int_sequence<3, 5>, 5> is true, and likewise for has_str_v.
template <typename Seq, int K>
struct has_int;
template <int... Ints, int K>
struct has_int<int_sequence<Ints...>, K> {
  static constexpr bool value = ((Ints == K) || ...);
};
template <typename Seq, int K>
constexpr bool has_int_v = has_int<Seq, K>::value;

template <typename Seq, StringLiteral S>
struct has_str;
template <StringLiteral... Strs, StringLiteral S>
struct has_str<StringLiteralSequence<Strs...>, S> {
  static constexpr bool value = ((Strs == S) || ...);
};
template <typename Seq, StringLiteral S>
constexpr bool has_str_v = has_str<Seq, S>::value;

/*
 * concat_t<int_sequence<1, 2>, int_sequence<3>> is int_sequence<1, 2, 3>. Same for
 * StringLiteralSequence.
 */
template <typename T, typename U>
struct concat;
template <int... I1, int... I2>
struct concat<int_sequence<I1...>, int_sequence<I2...>> {
  using type = int_sequence<I1..., I2...>;
};
template <StringLiteral... S1, StringLiteral... S2>
struct concat<StringLiteralSequence<S1...>, StringLiteralSequence<S2...>> {
  using type = StringLiteralSequence<S1..., S2...>;
};
template <typename T, typename U>
using concat_t = typename concat<T, U>::type;

// Whether the two sequences have no element in common.
template <typename T, typename U>
struct no_overlap;
template <typename T, int... Ints>
struct no_overlap<T, int_sequence<Ints...>> {
  static constexpr bool value = (!has_int_v<T, Ints> && ...);
};
template <typename T, StringLiteral... Strs>
struct no_overlap<T, StringLiteralSequence<Strs...>> {
  static constexpr bool value = (!has_str_v<T, Strs> && ...);
};
template <typename T, typename U>
constexpr bool no_overlap_v = no_overlap<T, U>::value;

/*
 * Appends u to vec. For N >= 0, first drops the oldest element if vec already holds N + 1, so that
 * vec keeps the last N + 1 values in insertion order. For N < 0, vec grows without bound.
 */
template <int N, typename T, typename U>
void stuff_back(std::vector<T>& vec, const U& u);

}  // namespace util

#include "inline/util/CppUtil.inl"
