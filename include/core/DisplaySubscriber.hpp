#pragma once
/** @file  DisplaySubscriber.hpp
 *  @brief Remote display: follows a lot's topic and renders every status it receives.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <mqtt/async_client.h>

#include "core/RetryPolicy.hpp"
#include "io/MqttOptions.hpp"

namespace carpark {
  namespace io {
    class OutputSink;
  } // namespace io

  namespace core {

    class Logger;

    /**
 * @class DisplaySubscriber
 * @brief Subscribes to one topic and renders `formatStatus(fromPayload(msg))` on a sink.
 *
 *  * Malformed payloads are logged and skipped.
 *  * A lost broker session is re-established with the policy's backoff;
 *    `policy.timeout` bounds each subscribe and each render.
 */
    class DisplaySubscriber {
    public:
      static constexpr int kQos = 1;

      DisplaySubscriber(io::MqttOptions options, std::string topic,
                        std::shared_ptr<io::OutputSink> sink, RetryPolicy policy,
                        std::shared_ptr<Logger> logger);
      ~DisplaySubscriber();

      /// Blocks until \p stop is set; disconnects on return.
      void run(const std::atomic<bool>& stop);

      /// Render one received message; false if it was skipped or the render failed.
      bool handleMessage(const std::string& topic, const std::string& payload);

      std::uint64_t rendered() const { return rendered_; }
      std::uint64_t malformed() const { return malformed_; }

      DisplaySubscriber(const DisplaySubscriber&) = delete;
      DisplaySubscriber& operator=(const DisplaySubscriber&) = delete;

    private:
      bool establish();
      void disconnect();
      void sleepUnlessStopped(std::chrono::milliseconds delay, const std::atomic<bool>& stop);

      static constexpr std::chrono::milliseconds kPollSlice{ 200 };
      static constexpr std::chrono::milliseconds kDisconnectTimeout{ 1000 };

      const io::MqttOptions options_;
      std::string topic_;
      std::shared_ptr<io::OutputSink> sink_;
      RetryPolicy policy_;
      std::shared_ptr<Logger> logger_;
      mqtt::async_client client_;
      std::atomic<std::uint64_t> rendered_{ 0 };
      std::atomic<std::uint64_t> malformed_{ 0 };
    };

  } // namespace core
} // namespace carpark
