#pragma once

#include <cstddef>// std::size_t
#include <optional>// std::optional
#include <string_view>// std::string_view

#include <ilp_timecode/ilp_timecode_export.hpp>// ILP_TIMECODE_NO_EXPORT

// clang-format off
extern "C" {
#include <libavutil/rational.h>// AVRational
}
// clang-format on

namespace rate_table_internal {

struct RateEntry
{
  std::string_view label = {};

  // Exact frames / second, e.g. [24000 / 1001] for "23.976".
  AVRational rate = { 0, 1 };

  // Zero if there is no drop frame standard for this rate.
  int drop_frames_per_10_mins = 0;
};

// Exact lookup, the label is expected to be trimmed already.
[[nodiscard]] ILP_TIMECODE_NO_EXPORT auto FindRate(std::string_view label) noexcept
  -> std::optional<RateEntry>;

// Number of entries in the table and access by position, in table order.
[[nodiscard]] ILP_TIMECODE_NO_EXPORT auto RateCount() noexcept -> std::size_t;
[[nodiscard]] ILP_TIMECODE_NO_EXPORT auto RateAt(std::size_t i) noexcept -> const RateEntry &;

// Frames per timecode second, ceil(rate.num / rate.den).
[[nodiscard]] ILP_TIMECODE_NO_EXPORT auto IntFps(const AVRational &rate) noexcept -> int;

}// namespace rate_table_internal
