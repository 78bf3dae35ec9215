#include <ilp_timecode/timecode.hpp>

#include <cmath>// std::isfinite, std::floor
#include <sstream>// std::ostringstream

#include <ilp_timecode/error.hpp>// ilp_timecode::InvalidInput
#include <internal/string_utils.hpp>

namespace {

constexpr int kMinsPerHr = 60;
constexpr int kSecsPerMin = 60;
constexpr double kMaxPackedTimecode = 99999999.0;

[[nodiscard]] auto ParsePacked(const double packed) -> ilp_timecode::Timecode
{
  if (!std::isfinite(packed) || std::floor(packed) != packed || packed < 0.0
      || kMaxPackedTimecode < packed) {
    throw ilp_timecode::InvalidInput{
      "numerical timecode must be an integer in [0, 99999999] range"
    };
  }

  auto digits = static_cast<int>(packed);
  ilp_timecode::Timecode tc = {};
  tc.ff = digits % 100;
  digits /= 100;
  tc.ss = digits % 100;
  digits /= 100;
  tc.mm = digits % 100;
  digits /= 100;
  tc.hh = digits % 100;
  return tc;
}

[[nodiscard]] auto IsSeparator(const char c) noexcept -> bool { return c == ':' || c == ';'; }

[[nodiscard]] auto ParseText(const std::string &text) -> ilp_timecode::Timecode
{
  using string_utils_internal::IsDigit;
  using string_utils_internal::TwoDigits;

  // DD[:;]DD[:;]DD[:;]DD
  const auto s = string_utils_internal::Trim(text);
  bool ok = s.size() == 11;
  for (std::size_t i = 0; ok && i < s.size(); ++i) {
    ok = (i % 3 == 2) ? IsSeparator(s[i]) : IsDigit(s[i]);
  }
  if (!ok) {
    std::ostringstream oss;
    oss << "timecode must be in HH:MM:SS:FF format: \"" << text << "\"";
    throw ilp_timecode::InvalidInput{ oss.str() };
  }

  ilp_timecode::Timecode tc = {};
  tc.hh = TwoDigits(s, 0);
  tc.mm = TwoDigits(s, 3);
  tc.ss = TwoDigits(s, 6);
  tc.ff = TwoDigits(s, 9);
  return tc;
}

[[nodiscard]] auto RangeError(const char *field, const int max, const int value) -> std::string
{
  std::ostringstream oss;
  oss << "timecode " << field << " must be in range 00-" << string_utils_internal::PadTwo(max)
      << ": \"" << value << "\"";
  return oss.str();
}

}// namespace

namespace ilp_timecode {

auto ParseTimecode(const TimecodeArg &raw) -> Timecode
{
  if (const auto *text = std::get_if<std::string>(&raw); text != nullptr) {
    return ParseText(*text);
  }
  return ParsePacked(std::get<double>(raw));
}

void ValidateTimecode(const TimecodeArg &raw, const Timecode &tc, const TimecodeStandard &tc_std)
{
  // All two digit HH values (00-99) are valid.
  if (!(tc.mm < kMinsPerHr)) { throw InvalidInput{ RangeError("MM", kMinsPerHr - 1, tc.mm) }; }
  if (!(tc.ss < kSecsPerMin)) { throw InvalidInput{ RangeError("SS", kSecsPerMin - 1, tc.ss) }; }
  if (!(tc.ff < tc_std.int_fps)) {
    throw InvalidInput{ RangeError("FF", tc_std.int_fps - 1, tc.ff) };
  }

  if (IsDroppedFrame(tc, tc_std)) {
    std::ostringstream oss;
    oss << "timecode invalid: \"" << FormatTimecode(tc) << "\" is a dropped frame number";
    throw InvalidInput{ oss.str() };
  }

  // Semicolons are reserved for drop frame notation.
  if (const auto *text = std::get_if<std::string>(&raw); text != nullptr) {
    if (text->find(';') != std::string::npos && !IsDropFrame(tc_std)) {
      std::ostringstream oss;
      oss << "only drop timecode may use semi-colon separator: \"" << *text << "\"";
      throw InvalidInput{ oss.str() };
    }
  }
}

auto ParseValidTimecode(const TimecodeArg &raw, const TimecodeStandard &tc_std) -> Timecode
{
  const auto tc = ParseTimecode(raw);
  ValidateTimecode(raw, tc, tc_std);
  return tc;
}

auto FormatTimecode(const Timecode &tc) -> std::string
{
  using string_utils_internal::PadTwo;

  // NOTE: Drop frame timecode is commonly written with ';' before FF, but we always use ':'.
  std::ostringstream oss;
  oss << PadTwo(tc.hh) << ':' << PadTwo(tc.mm) << ':' << PadTwo(tc.ss) << ':' << PadTwo(tc.ff);
  return oss.str();
}

}// namespace ilp_timecode
