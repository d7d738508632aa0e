#pragma once
/** @file  MqttOptions.hpp
 *  @brief Broker endpoint and session parameters shared by the publisher and the display.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <string>

#include <mqtt/connect_options.h>

namespace carpark {
  namespace io {

    struct MqttOptions {
      std::string host{ "localhost" };
      std::uint16_t port{ 1883 };
      std::string clientId{ "car_park_sensor" };
      std::uint16_t keepAliveSeconds{ 300 };
      std::chrono::milliseconds connectTimeout{ 3000 };

      /// "tcp://host:port"
      std::string serverUri() const;
    };

    /**
     * Clean session, no automatic reconnect (callers own the retry policy).
     * Paho counts the connect timeout in whole seconds, so \p timeout is rounded up.
     */
    mqtt::connect_options toConnectOptions(const MqttOptions& options,
                                           std::chrono::milliseconds timeout);

  } // namespace io
} // namespace carpark
