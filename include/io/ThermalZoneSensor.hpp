#pragma once
/** @file  ThermalZoneSensor.hpp
 *  @brief Temperature from a Linux thermal zone (or any file holding millidegrees).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

namespace carpark {
  namespace io {

    class ThermalZoneSensor {
    public:
      /// @param path e.g. "/sys/class/thermal/thermal_zone0/temp"
      explicit ThermalZoneSensor(std::string path);
      virtual ~ThermalZoneSensor() = default;

      /// °C, or std::nullopt if the file is missing or does not hold an integer.
      virtual std::optional<double> read() const;

      const std::string& path() const { return path_; }

    private:
      std::string path_;
    };

  } // namespace io
} // namespace carpark
