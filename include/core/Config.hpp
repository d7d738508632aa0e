#pragma once
/** @file  Config.hpp
 *  @brief Validated run-time configuration for one lot.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/RetryPolicy.hpp"

namespace carpark::core {

  /** Fatal at startup: the Coordinator is never built from a bad config. */
  class ConfigurationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  struct BrokerConfig {
    std::string host{ "localhost" };
    std::uint16_t port{ 1883 };
    std::string clientId{ "car_park_sensor" };
    std::uint16_t keepAliveSeconds{ 300 };
    std::string topic; ///< defaults to defaultTopic(location)
  };

  struct FanoutConfig {
    int attempts{ 3 };
    std::chrono::milliseconds baseDelay{ 200 };
    std::chrono::milliseconds maxDelay{ 5000 };
    std::chrono::milliseconds publishTimeout{ 3000 };
    std::chrono::milliseconds renderTimeout{ 500 };

    RetryPolicy publishPolicy() const { return { attempts, baseDelay, maxDelay, publishTimeout }; }
    RetryPolicy renderPolicy() const { return { attempts, baseDelay, maxDelay, renderTimeout }; }
  };

  struct InputConfig {
    std::string backend{ "console" }; ///< console | serial | gpio
    std::string device;               ///< tty path or /dev/gpiochipN
    int baud{ 115200 };
    unsigned int enterLine{ 0 }; ///< gpio offsets
    unsigned int exitLine{ 1 };
    bool activeLow{ true };
  };

  struct OutputConfig {
    std::string backend{ "console" }; ///< console | accessible | file
    std::string path;                 ///< required for "file"
  };

  struct TelemetryConfig {
    std::optional<std::string> thermalZone; ///< e.g. /sys/class/thermal/thermal_zone0/temp
    std::chrono::milliseconds interval{ 10000 };
  };

  struct CarparkConfig {
    std::string location;
    int capacity{ 0 };
    int initialOccupied{ 0 };
    BrokerConfig broker;
    FanoutConfig fanout;
    InputConfig input;
    OutputConfig output;
    TelemetryConfig telemetry;
    std::string logPath{ "carpark.csv" };
  };

} // namespace carpark::core
