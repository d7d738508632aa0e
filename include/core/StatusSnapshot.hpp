#pragma once
/** @file  StatusSnapshot.hpp
 *  @brief Point-in-time view of one lot, handed by value to display and broadcast.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

namespace carpark::core {

  /**
   * @struct StatusSnapshot
   * @brief Plain value copied out of the OccupancyStore after an accepted change.
   *
   *  * Holds no reference back to the store; every consumer owns its copy.
   *  * Telemetry is attached by building a new copy (`withTemperature`).
   */
  struct StatusSnapshot {
    std::string location;
    int capacity{ 0 };
    int occupied{ 0 };
    std::optional<double> temperature{}; ///< °C, absent when no sensor reading
    std::chrono::system_clock::time_point timestamp{};

    int available() const { return capacity - occupied; }

    StatusSnapshot withTemperature(std::optional<double> celsius) const {
      StatusSnapshot copy = *this;
      copy.temperature = celsius;
      return copy;
    }

    bool operator==(const StatusSnapshot&) const = default;
  };

} // namespace carpark::core
