#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include "types.h"

namespace crew {

// Returns current time in milliseconds (monotonic)
inline long long NowMillis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

// ---------- small date helpers ----------

// Parses "YYYY-MM-DD"; rejects dates mktime would have to normalize
// (2025-02-30 and the like).
inline std::optional<std::tm> parse_ymd(const std::string& ymd) {
  std::tm tm{};
  tm.tm_isdst = -1;
  std::istringstream ss(ymd);
  ss >> std::get_time(&tm, "%Y-%m-%d");
  if (ss.fail()) return std::nullopt;
  char trailing;
  if (ss >> trailing) return std::nullopt;

  const int y = tm.tm_year, m = tm.tm_mon, d = tm.tm_mday;
  tm.tm_hour = 12;  // keep DST shifts away from midnight
  if (std::mktime(&tm) == -1) return std::nullopt;
  if (tm.tm_year != y || tm.tm_mon != m || tm.tm_mday != d) return std::nullopt;
  return tm;
}

// 0=Sun..6=Sat -> Mon-based Weekday
inline std::optional<Weekday> weekday_of(const std::string& ymd) {
  auto tm = parse_ymd(ymd);
  if (!tm) return std::nullopt;
  const int w = tm->tm_wday;
  return static_cast<Weekday>(w == 0 ? 6 : w - 1);
}

inline const char* weekday_name(Weekday wd) {
  static const char* names[] = {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};
  return names[static_cast<int>(wd)];
}

inline std::optional<Weekday> weekday_from_name(const std::string& s) {
  for (int i = 0; i < 7; ++i) {
    const auto wd = static_cast<Weekday>(i);
    if (s == weekday_name(wd)) return wd;
  }
  return std::nullopt;
}

inline std::string trim(const std::string& s) {
  const char* ws = " \t\r\n\f\v";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

} // namespace crew
