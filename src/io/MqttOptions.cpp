/* @file MqttOptions.cpp
 * @brief broker config → Paho connect options
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Carpark headers
#include "io/MqttOptions.hpp"

namespace carpark::io {

  std::string MqttOptions::serverUri() const {
    return "tcp://" + host + ":" + std::to_string(port);
  }

  mqtt::connect_options toConnectOptions(const MqttOptions& options,
                                         std::chrono::milliseconds timeout) {
    const auto seconds =
        std::max<std::chrono::seconds::rep>(1, std::chrono::ceil<std::chrono::seconds>(timeout).count());

    mqtt::connect_options opts;
    opts.set_clean_session(true);
    opts.set_keep_alive_interval(std::chrono::seconds{ options.keepAliveSeconds });
    opts.set_connect_timeout(std::chrono::seconds{ seconds });
    opts.set_automatic_reconnect(false);
    return opts;
  }

} // namespace carpark::io
