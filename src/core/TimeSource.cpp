/* @file TimeSource.cpp
 * @brief epoch/ISO-8601 conversions used by the store journal and the control channel
 *
 * © 2025 Zeddring — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cstdio>
#include <ctime>

// Zeddring headers
#include "core/TimeSource.hpp"

using namespace zeddring::core;

namespace {

  std::tm toUtcTm(Timestamp t) {
    const std::time_t secs = std::chrono::system_clock::to_time_t(
        std::chrono::floor<std::chrono::seconds>(t));
    std::tm tm{};
    gmtime_r(&secs, &tm);
    return tm;
  }

  // %d accepts signs and leading blanks; only the two date separators may be '-'
  bool unsignedFields(const std::string& text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
      const char c = text[i];
      if (c == '+' || std::isspace(static_cast<unsigned char>(c)) || (c == '-' && i != 4 && i != 7))
        return false;
    }
    return true;
  }

} // namespace

std::int64_t zeddring::core::toEpochMillis(Timestamp t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

Timestamp zeddring::core::fromEpochMillis(std::int64_t ms) {
  return Timestamp{ std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds{ ms }) };
}

std::string zeddring::core::toIso8601(Timestamp t) {
  const std::tm tm = toUtcTm(t);
  const auto ms = toEpochMillis(t) - toEpochMillis(std::chrono::floor<std::chrono::seconds>(t));
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  return buf;
}

std::optional<Timestamp> zeddring::core::parseIso8601(const std::string& text) {
  std::tm tm{};
  int millis = 0;
  int consumed = 0;
  if (!unsignedFields(text))
    return std::nullopt;


  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                  &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) == 6) {
    std::string rest = text.substr(static_cast<std::size_t>(consumed));
    if (!rest.empty() && rest.front() == '.') {
      int digits = 0;
      if (std::sscanf(rest.c_str(), ".%3d%n", &millis, &digits) != 1)
        return std::nullopt;
      // ".5" means 500 ms; digits counts the leading '.'
      for (int scale = digits - 1; scale < 3; ++scale)
        millis *= 10;
      rest.erase(0, static_cast<std::size_t>(digits));
    }
    if (rest != "Z" && !rest.empty())
      return std::nullopt;
  } else if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                         &consumed) == 3 &&
             static_cast<std::size_t>(consumed) == text.size()) {
    tm.tm_hour = tm.tm_min = tm.tm_sec = 0;
  } else {
    return std::nullopt;
  }

  if (tm.tm_year < 0 || tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
      tm.tm_hour < 0 || tm.tm_hour > 23 || tm.tm_min < 0 || tm.tm_min > 59 || tm.tm_sec < 0 ||
      tm.tm_sec > 60 || millis < 0)
    return std::nullopt;

  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  const std::time_t secs = timegm(&tm);
  return std::chrono::system_clock::from_time_t(secs) + std::chrono::milliseconds{ millis };
}

std::string zeddring::core::utcDay(Timestamp t) {
  const std::tm tm = toUtcTm(t);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
  return buf;
}
