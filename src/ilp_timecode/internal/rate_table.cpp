#include <internal/rate_table.hpp>

#include <algorithm>// std::find_if
#include <array>// std::array
#include <cassert>// assert

// clang-format off
extern "C" {
#include <libavutil/mathematics.h>// av_rescale_rnd
}
// clang-format on

namespace {

// Exactly 2 or 3 decimal digits are required to avoid confusion as to whether e.g. "24" means
// 24.000 or 23.976.
//
// Drop frame standards drop the first 2 (29.97) or 4 (59.94) frame numbers of minutes
// x1, x2, ..., x9.
//
// clang-format off
constexpr std::array<rate_table_internal::RateEntry, 20> kRates = {{
  { "23.976", { 24000, 1001 },  0 },// 23.976023976...
  { "23.98",  { 24000, 1001 },  0 },
  { "24.000", {    24,    1 },  0 },
  { "24.00",  {    24,    1 },  0 },
  { "25.000", {    25,    1 },  0 },
  { "25.00",  {    25,    1 },  0 },
  { "29.970", { 30000, 1001 }, 18 },// 29.97002997...
  { "29.97",  { 30000, 1001 }, 18 },
  { "30.000", {    30,    1 },  0 },
  { "30.00",  {    30,    1 },  0 },
  { "47.952", { 48000, 1001 },  0 },// 47.952047952...
  { "47.95",  { 48000, 1001 },  0 },
  { "48.000", {    48,    1 },  0 },
  { "48.00",  {    48,    1 },  0 },
  { "50.000", {    50,    1 },  0 },
  { "50.00",  {    50,    1 },  0 },
  { "59.940", { 60000, 1001 }, 36 },// 59.94005994...
  { "59.94",  { 60000, 1001 }, 36 },
  { "60.000", {    60,    1 },  0 },
  { "60.00",  {    60,    1 },  0 },
}};
// clang-format on

}// namespace

namespace rate_table_internal {

auto FindRate(const std::string_view label) noexcept -> std::optional<RateEntry>
{
  const auto iter = std::find_if(
    kRates.begin(), kRates.end(), [&](const RateEntry &e) { return e.label == label; });
  if (iter == kRates.end()) { return std::nullopt; }
  return *iter;
}

auto RateCount() noexcept -> std::size_t { return kRates.size(); }

auto RateAt(const std::size_t i) noexcept -> const RateEntry &
{
  assert(i < kRates.size());// NOLINT
  return kRates[i];// NOLINT
}

auto IntFps(const AVRational &rate) noexcept -> int
{
  assert(rate.num > 0 && rate.den > 0);// NOLINT
  return static_cast<int>(av_rescale_rnd(rate.num, 1, rate.den, AV_ROUND_UP));
}

}// namespace rate_table_internal
