/* @file TimeFormat.cpp
 * @brief gmtime_r / timegm based conversions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <ctime>

// Carpark headers
#include "core/TimeFormat.hpp"

namespace carpark::core {

  namespace {
    std::tm toUtc(WallClock::time_point tp) {
      const std::time_t secs = WallClock::to_time_t(tp);
      std::tm utc{};
      gmtime_r(&secs, &utc);
      return utc;
    }
  } // namespace

  std::string toIso8601(WallClock::time_point tp, bool millis) {
    const std::tm utc = toUtc(tp);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    std::string out{ buf };

    if (millis) {
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
      if (ms.count() < 0)
        ms += std::chrono::milliseconds{ 1000 };
      char frac[8];
      std::snprintf(frac, sizeof(frac), ".%03d", static_cast<int>(ms.count()));
      out += frac;
    }
    return out + "Z";
  }

  std::string toClockTime(WallClock::time_point tp) {
    const std::tm utc = toUtc(tp);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &utc);
    return buf;
  }

  std::optional<WallClock::time_point> fromIso8601(const std::string& text) {
    std::tm utc{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &utc.tm_year, &utc.tm_mon,
                    &utc.tm_mday, &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &consumed) != 6)
      return std::nullopt;

    // optional fraction, then a mandatory 'Z'
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
        ++pos;
    }
    if (pos + 1 != text.size() || text[pos] != 'Z')
      return std::nullopt;

    if (utc.tm_mon < 1 || utc.tm_mon > 12 || utc.tm_mday < 1 || utc.tm_mday > 31 ||
        utc.tm_hour < 0 || utc.tm_hour > 23 || utc.tm_min < 0 || utc.tm_min > 59 ||
        utc.tm_sec < 0 || utc.tm_sec > 60)
      return std::nullopt;

    utc.tm_year -= 1900;
    utc.tm_mon -= 1;
    const std::time_t secs = timegm(&utc);
    if (secs == static_cast<std::time_t>(-1))
      return std::nullopt;
    return WallClock::from_time_t(secs);
  }

} // namespace carpark::core
