#pragma once
/** @file  TimeFormat.hpp
 *  @brief UTC wall-clock formatting shared by status payloads and the CSV log.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

namespace carpark::core {

  using WallClock = std::chrono::system_clock;

  /// "2026-10-18T10:32:05Z" (or "...05.123Z" with \p millis).
  std::string toIso8601(WallClock::time_point tp, bool millis = false);

  /// "10:32:05"
  std::string toClockTime(WallClock::time_point tp);

  /// Inverse of toIso8601 (whole seconds, fraction ignored); std::nullopt if malformed.
  std::optional<WallClock::time_point> fromIso8601(const std::string& text);

} // namespace carpark::core
