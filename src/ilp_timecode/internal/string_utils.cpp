#include <internal/string_utils.hpp>

#include <algorithm>// std::transform
#include <cctype>// std::isspace, std::tolower

namespace string_utils_internal {

auto Trim(std::string_view s) noexcept -> std::string_view
{
  const auto is_space = [](const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  while (!s.empty() && is_space(s.front())) { s.remove_prefix(1); }
  while (!s.empty() && is_space(s.back())) { s.remove_suffix(1); }
  return s;
}

auto ToLower(const std::string_view s) -> std::string
{
  std::string r{ s };
  std::transform(r.begin(), r.end(), r.begin(), [](const char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return r;
}

auto PadTwo(const long long v) -> std::string
{
  auto s = std::to_string(v);
  if (s.size() < 2) { s.insert(0, 2 - s.size(), '0'); }
  return s;
}

}// namespace string_utils_internal
