#pragma once

#include <cstddef>// std::size_t
#include <string>// std::string
#include <string_view>// std::string_view

#include <ilp_timecode/ilp_timecode_export.hpp>// ILP_TIMECODE_NO_EXPORT

namespace string_utils_internal {

// Strips leading and trailing whitespace. The returned view references the input.
[[nodiscard]] ILP_TIMECODE_NO_EXPORT auto Trim(std::string_view s) noexcept -> std::string_view;

// ASCII only.
[[nodiscard]] ILP_TIMECODE_NO_EXPORT auto ToLower(std::string_view s) -> std::string;

[[nodiscard]] ILP_TIMECODE_NO_EXPORT constexpr auto IsDigit(const char c) noexcept -> bool
{
  return '0' <= c && c <= '9';
}

// Value of the two decimal digits starting at s[pos]. Assumes both are digits.
[[nodiscard]] ILP_TIMECODE_NO_EXPORT constexpr auto TwoDigits(std::string_view s,
  const std::size_t pos) noexcept -> int
{
  return 10 * (s[pos] - '0') + (s[pos + 1] - '0');
}

// Zero-padded to (at least) two digits, e.g. 7 -> "07".
[[nodiscard]] ILP_TIMECODE_NO_EXPORT auto PadTwo(long long v) -> std::string;

}// namespace string_utils_internal
