#include <ilp_timecode/standard.hpp>

#include <sstream>// std::ostringstream

#include <ilp_timecode/error.hpp>// ilp_timecode::InvalidInput
#include <internal/rate_table.hpp>
#include <internal/string_utils.hpp>

namespace {

// DD.DD or DD.DDD
[[nodiscard]] auto IsFrameRateFormat(const std::string_view s) noexcept -> bool
{
  using string_utils_internal::IsDigit;
  if (!(s.size() == 5 || s.size() == 6)) { return false; }
  if (s[2] != '.') { return false; }
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (i != 2 && !IsDigit(s[i])) { return false; }
  }
  return true;
}

}// namespace

namespace ilp_timecode {

void ValidateFrameRate(const std::string_view frame_rate)
{
  const auto label = string_utils_internal::Trim(frame_rate);
  if (!IsFrameRateFormat(label)) {
    throw InvalidInput{
      R"(frameRate must contain 2 or 3 digits after period (e.g. "23.976" or "24.00"))"
    };
  }
  if (!rate_table_internal::FindRate(label).has_value()) {
    std::ostringstream oss;
    oss << "Unsupported frame rate: \"" << label << "\"";
    throw InvalidInput{ oss.str() };
  }
}

auto ResolveStandard(const std::string_view frame_rate, const std::string_view drop_type)
  -> TimecodeStandard
{
  ValidateFrameRate(frame_rate);
  const auto label = string_utils_internal::Trim(frame_rate);
  const auto entry = rate_table_internal::FindRate(label);

  const auto drop = string_utils_internal::ToLower(string_utils_internal::Trim(drop_type));
  if (drop != DropType::kDrop && drop != DropType::kNonDrop) {
    throw InvalidInput{ R"(dropType value must be "non-drop" or "drop" (without quotes))" };
  }

  TimecodeStandard tc_std = {};
  tc_std.frames = entry->rate.num;
  tc_std.per_wall_secs = entry->rate.den;
  tc_std.int_fps = rate_table_internal::IntFps(entry->rate);
  if (drop == DropType::kDrop) {
    if (entry->drop_frames_per_10_mins == 0) {
      std::ostringstream oss;
      oss << "frameRate " << label << " must be non-drop";
      throw InvalidInput{ oss.str() };
    }
    tc_std.drop_frames_per_10_mins = entry->drop_frames_per_10_mins;
  }
  return tc_std;
}

auto SupportedFrameRates() -> std::vector<std::string>
{
  std::vector<std::string> labels;
  labels.reserve(rate_table_internal::RateCount());
  for (std::size_t i = 0; i < rate_table_internal::RateCount(); ++i) {
    labels.emplace_back(rate_table_internal::RateAt(i).label);
  }
  return labels;
}

auto SupportsDropFrame(const std::string_view frame_rate) noexcept -> bool
{
  const auto entry = rate_table_internal::FindRate(string_utils_internal::Trim(frame_rate));
  return entry.has_value() && entry->drop_frames_per_10_mins > 0;
}

}// namespace ilp_timecode
