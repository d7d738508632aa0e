/* @file MqttPublisher.cpp
 * @brief connect-at-startup, reconnect-on-demand publisher
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// 3rd-party headers
#include <mqtt/exception.h>

// Carpark headers
#include "core/Logger.hpp"
#include "io/MqttPublisher.hpp"

using namespace carpark::io;

namespace {
  constexpr const char* kTag = "MqttPublisher";
} // namespace

MqttPublisher::MqttPublisher(MqttOptions options, std::shared_ptr<core::Logger> logger)
    : options_(std::move(options)), logger_(std::move(logger)),
      client_(options_.serverUri(), options_.clientId) {
  if (!logger_)
    throw std::invalid_argument("[MqttPublisher] logger is required");
}

MqttPublisher::~MqttPublisher() {
  if (!client_.is_connected())
    return;
  try {
    client_.disconnect()->wait_for(kDisconnectTimeout);
  } catch (const mqtt::exception& e) {
    logger_->warn(kTag, std::string("disconnect: ") + e.what());
  }
}

void MqttPublisher::connect() {
  if (!tryConnect(options_.connectTimeout))
    throw std::runtime_error("[MqttPublisher] cannot connect to broker " + options_.serverUri());
  logger_->info(kTag, "connected to " + options_.serverUri() + " as " + options_.clientId);
}

bool MqttPublisher::tryConnect(std::chrono::milliseconds timeout) {
  try {
    if (!client_.connect(toConnectOptions(options_, timeout))->wait_for(timeout)) {
      logger_->warn(kTag, "connect to " + options_.serverUri() + " timed out");
      return false;
    }
  } catch (const mqtt::exception& e) {
    logger_->warn(kTag, "connect to " + options_.serverUri() + ": " + e.what());
    return false;
  }
  return true;
}

bool MqttPublisher::publish(const std::string& topic, const std::string& payload,
                            std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  if (!client_.is_connected()) {
    logger_->info(kTag, "session lost, reconnecting");
    if (!tryConnect(timeout))
      return false;
  }

  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  if (left.count() <= 0)
    return false;

  try {
    auto token = client_.publish(topic, payload.data(), payload.size(), kQos, false);
    if (!token->wait_for(left)) {
      logger_->warn(kTag, "publish to " + topic + " not acknowledged");
      return false;
    }
  } catch (const mqtt::exception& e) {
    logger_->warn(kTag, "publish to " + topic + ": " + e.what());
    return false;
  }
  logger_->debug(kTag, "published to " + topic);
  return true;
}
