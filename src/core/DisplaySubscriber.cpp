/* @file DisplaySubscriber.cpp
 * @brief subscribe / consume / reconnect loop of the remote display
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

// 3rd-party headers
#include <mqtt/exception.h>

// Carpark headers
#include "core/DisplaySubscriber.hpp"
#include "core/Logger.hpp"
#include "core/StatusFormat.hpp"
#include "io/OutputSink.hpp"

using namespace carpark::core;

namespace {
  constexpr const char* kTag = "DisplaySubscriber";
} // namespace

DisplaySubscriber::DisplaySubscriber(io::MqttOptions options, std::string topic,
                                     std::shared_ptr<io::OutputSink> sink, RetryPolicy policy,
                                     std::shared_ptr<Logger> logger)
    : options_(std::move(options)), topic_(std::move(topic)), sink_(std::move(sink)),
      policy_(policy), logger_(std::move(logger)),
      client_(options_.serverUri(), options_.clientId) {
  if (!sink_ || !logger_)
    throw std::invalid_argument("[DisplaySubscriber] sink and logger are required");
  if (topic_.empty())
    throw std::invalid_argument("[DisplaySubscriber] topic is required");
}

DisplaySubscriber::~DisplaySubscriber() { disconnect(); }

bool DisplaySubscriber::handleMessage(const std::string& topic, const std::string& payload) {
  if (topic != topic_) {
    logger_->debug(kTag, "ignoring message on " + topic);
    return false;
  }

  auto snap = fromPayload(payload);
  if (!snap) {
    ++malformed_;
    logger_->warn(kTag, "malformed payload on " + topic + " skipped");
    return false;
  }

  if (!sink_->render(formatStatus(*snap), policy_.timeout)) {
    logger_->warn(kTag, "render failed");
    return false;
  }
  ++rendered_;
  return true;
}

bool DisplaySubscriber::establish() {
  try {
    if (!client_.is_connected() &&
        !client_.connect(io::toConnectOptions(options_, options_.connectTimeout))
             ->wait_for(options_.connectTimeout)) {
      logger_->warn(kTag, "broker " + options_.serverUri() + " did not answer");
      return false;
    }
    if (!client_.subscribe(topic_, kQos)->wait_for(policy_.timeout)) {
      logger_->warn(kTag, "subscribe to " + topic_ + " timed out");
      return false;
    }
  } catch (const mqtt::exception& e) {
    logger_->warn(kTag, "broker " + options_.serverUri() + ": " + e.what());
    return false;
  }
  logger_->info(kTag, "subscribed to " + topic_);
  return true;
}

void DisplaySubscriber::run(const std::atomic<bool>& stop) {
  client_.start_consuming(); // before connect: installs the message queue

  int failures = 0;
  bool subscribed = false;
  while (!stop) {
    if (!subscribed) {
      if (!establish()) {
        ++failures;
        const auto delay = policy_.backoff(failures);
        logger_->info(kTag, "retrying in " + std::to_string(delay.count()) + " ms");
        sleepUnlessStopped(delay, stop);
        continue;
      }
      failures = 0;
      subscribed = true;
    }

    mqtt::const_message_ptr msg;
    if (!client_.try_consume_message_for(&msg, kPollSlice)) {
      if (!client_.is_connected()) {
        logger_->warn(kTag, "connection lost");
        subscribed = false;
      }
      continue;
    }
    if (!msg) { // the consumer queue signals a lost connection with an empty message
      logger_->warn(kTag, "connection lost");
      subscribed = false;
      continue;
    }
    handleMessage(msg->get_topic(), msg->to_string());
  }

  client_.stop_consuming();
  disconnect();
}

void DisplaySubscriber::disconnect() {
  if (!client_.is_connected())
    return;
  try {
    client_.disconnect()->wait_for(kDisconnectTimeout);
  } catch (const mqtt::exception& e) {
    logger_->warn(kTag, std::string("disconnect: ") + e.what());
  }
}

void DisplaySubscriber::sleepUnlessStopped(std::chrono::milliseconds delay,
                                           const std::atomic<bool>& stop) {
  const auto until = std::chrono::steady_clock::now() + delay;
  while (!stop && std::chrono::steady_clock::now() < until) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        until - std::chrono::steady_clock::now());
    std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds{ 50 }));
  }
}
