#pragma once

#include <date/date.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace clusterboot {
namespace stringutil {

inline std::string format_rfc3339(
    const std::chrono::system_clock::time_point& tp) {
  return date::format("%FT%TZ",
                      std::chrono::floor<std::chrono::seconds>(tp));
}

// Accepts "2024-01-02T03:04:05Z", "2024-01-02T05:04:05+02:00" and either
// with fractional seconds. Sub-second precision is truncated.
inline std::optional<std::chrono::system_clock::time_point> parse_rfc3339(
    const std::string& text) {
  date::sys_time<std::chrono::microseconds> tp;
  std::istringstream ss(text);
  ss >> date::parse("%FT%TZ", tp);
  if (ss.fail()) {
    ss.clear();
    ss.str(text);
    ss >> date::parse("%FT%T%Ez", tp);
    if (ss.fail()) {
      return std::nullopt;
    }
  }
  return std::chrono::system_clock::time_point(
      std::chrono::floor<std::chrono::seconds>(tp));
}

inline void remove_right_paddings(std::string& str, char padding = '=') {
  size_t pos = str.find_last_not_of(padding);
  if (pos != std::string::npos) {
    str.erase(pos + 1);
  } else {
    str.clear();
  }
}

inline std::string join(const std::vector<std::string>& parts,
                        std::string_view sep) {
  return fmt::format("{}", fmt::join(parts, sep));
}

}  // namespace stringutil
}  // namespace clusterboot
