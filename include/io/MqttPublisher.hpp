#pragma once
/** @file  MqttPublisher.hpp
 *  @brief Publisher backed by an MQTT broker session.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <memory>
#include <string>

#include <mqtt/async_client.h>

#include "io/MqttOptions.hpp"
#include "io/Publisher.hpp"

namespace carpark {
  namespace core {
    class Logger;
  } // namespace core

  namespace io {

    /**
 * @class MqttPublisher
 * @brief QoS 1 publish; a lost session is re-established on the next attempt.
 *
 *  * `connect()` is the startup check: an unreachable broker is fatal there.
 *  * After startup a broker outage only fails attempts; the FanoutWorker retries.
 *  * `mqtt::exception` never leaves this class after construction.
 */
    class MqttPublisher : public Publisher {
    public:
      static constexpr int kQos = 1;

      MqttPublisher(MqttOptions options, std::shared_ptr<core::Logger> logger);
      ~MqttPublisher() override; ///< disconnect if connected

      /// Open the session; throws std::runtime_error if the broker refuses or is unreachable.
      void connect();

      bool publish(const std::string& topic, const std::string& payload,
                   std::chrono::milliseconds timeout) override;

      bool isConnected() const { return client_.is_connected(); }
      const MqttOptions& options() const { return options_; }

      MqttPublisher(const MqttPublisher&) = delete;
      MqttPublisher& operator=(const MqttPublisher&) = delete;

    private:
      bool tryConnect(std::chrono::milliseconds timeout);

      static constexpr std::chrono::milliseconds kDisconnectTimeout{ 1000 };

      const MqttOptions options_;
      std::shared_ptr<core::Logger> logger_;
      mqtt::async_client client_;
    };

  } // namespace io
} // namespace carpark
