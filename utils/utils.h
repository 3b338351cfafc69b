#pragma once

#include "utils/boost_assert.h"
#include <array>
#include <cmath>
#include <concepts>
#include <fmt/format.h>
#include <functional>
#include <iterator>
#include <limits>
#include <nlohmann/json_fwd.hpp>
#include <ranges>
#include <string>
#include <utility>
#include <vector>

#define LAMBDA_1(...) [&](auto&& _1) { return (__VA_ARGS__); }
#define FILTER_VIEW(...) std::views::filter(LAMBDA_1(__VA_ARGS__))

using namespace std::literals;

namespace ranges = std::ranges;
namespace views = std::views;

using nlohmann::json;

// Alternative of std::forward_like: https://en.cppreference.com/w/cpp/utility/forward_like
template <class T, class U>
inline constexpr auto&& forward_like(U&& x) noexcept {
  constexpr bool is_adding_const = std::is_const_v<std::remove_reference_t<T>>;
  if constexpr (std::is_lvalue_reference_v<T&&>) {
    if constexpr (is_adding_const) {
      return std::as_const(x);
    } else {
      return static_cast<U&>(x);
    }
  } else {
    if constexpr (is_adding_const) {
      return std::move(std::as_const(x));
    } else {
      return std::move(x);
    }
  }
}

template <class T>
constexpr auto is_std_vector_v = false;

template <class T, class Alloc>
constexpr auto is_std_vector_v<std::vector<T, Alloc>> = true;

// e.g. forward_range_of<std::vector<float>, double> holds since implicit conversion is allowed.
template <class T, class ValueType>
concept forward_range_of =
    ranges::forward_range<T> && std::is_convertible_v<ranges::range_value_t<std::remove_cvref_t<T>>, ValueType>;

// Equivalent to range(n) in Python, or std::views::iota(0, n) in C++.
template <std::integral IntType>
inline constexpr auto range(IntType n) {
  return views::iota(static_cast<IntType>(0), n);
}

// Equivalent to range(first, last) in Python, or std::views::iota(first, last) in C++.
// first and last must be of exactly the same integer type.
template <std::integral IntType>
inline constexpr auto range(IntType first, IntType last) {
  return views::iota(first, last);
}

// Equivalent to std::ranges::subrange(first, last) in C++.
template <std::input_or_output_iterator Iter, std::sentinel_for<Iter> Sentinel>
inline constexpr auto range(Iter first, Sentinel last) {
  return ranges::subrange{first, last};
}

// Equivalent to std::accumulate(begin(range), end(range), init)
template <class T, ranges::input_range Range>
  requires(std::is_convertible_v<ranges::range_value_t<Range>, T>)
inline constexpr auto accumulate_sum(Range&& range, T init) -> T {
  for (auto&& elem : range) {
    init = init + forward_like<Range>(elem);
  }
  return init;
}

// Equivalent to std::accumulate(begin(range), end(range), T{}) where T is the value type of range.
// For arithmetic types, init = 0.
template <ranges::input_range Range>
inline constexpr auto accumulate_sum(Range&& range) -> ranges::range_value_t<Range> {
  return accumulate_sum(range, ranges::range_value_t<Range>{});
}

//   auto vec = make_reserved_vector<int>(256);
// Equivalent to the following:
//   auto vec = std::vector<int>();
//   vec.reserve(256);
template <class T>
inline auto make_reserved_vector(size_t capacity) {
  auto res = std::vector<T>{};
  res.reserve(capacity);
  return res;
}

// Converts size bytes to its string representation.
// e.g.     123'456'789 => "117.738 Mebibytes"
//      123'456'789'012 => "114.978 Gibibytes"
inline auto size_bytes_to_memory_str(size_t size_bytes) -> std::string {
  constexpr auto UNITS = std::array{"Bytes", "KibiBytes", "Mebibytes", "Gibibytes"};
  auto value = static_cast<double>(size_bytes);
  auto unit_index = 0;
  while (value >= 1024.0 && unit_index + 1 < UNITS.size()) {
    value /= 1024.0;
    unit_index += 1;
  }
  return fmt::format("{:.3f} {}", value, UNITS[unit_index]);
}

// Quiet NaN, used as the "missing value" of a metric.
constexpr auto NAN_VALUE = std::numeric_limits<double>::quiet_NaN();
