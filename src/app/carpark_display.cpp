/* @file carpark_display.cpp
 * @brief remote status display: broker topic → output sink
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <unistd.h>

// Carpark headers
#include "core/Backends.hpp"
#include "core/ConfigLoader.hpp"
#include "core/DisplaySubscriber.hpp"
#include "core/Logger.hpp"
#include "core/StatusFormat.hpp"
#include "io/MqttOptions.hpp"
#include "io/OutputSink.hpp"

namespace {
  volatile std::sig_atomic_t g_exit = 0;

  void onSignal(int) { g_exit = 1; }

  void installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
  }
} // namespace

int main(int argc, char* argv[]) {
  using namespace carpark;

  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <config.json>\n";
    return 2;
  }

  core::CarparkConfig cfg;
  std::shared_ptr<io::OutputSink> sink;
  try {
    cfg = core::ConfigLoader(argv[1]).loadConfig();
    sink = core::makeOutputRegistry().create(cfg.output.backend, cfg);
  } catch (const core::ConfigurationError& e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::out_of_range& e) {
    std::cerr << "[carpark_display] " << e.what() << "\n";
    return 1;
  }

  installSignalHandlers();
  auto logger = std::make_shared<core::Logger>();

  io::MqttOptions mqtt;
  mqtt.host = cfg.broker.host;
  mqtt.port = cfg.broker.port;
  // a second session under the sensor's id would kick the sensor off the broker
  mqtt.clientId = cfg.broker.clientId + "_display_" + std::to_string(::getpid());
  mqtt.keepAliveSeconds = cfg.broker.keepAliveSeconds;
  mqtt.connectTimeout = cfg.fanout.publishTimeout;

  const std::string topic =
      cfg.broker.topic.empty() ? core::defaultTopic(cfg.location) : cfg.broker.topic;

  std::unique_ptr<core::DisplaySubscriber> display;
  try {
    display = std::make_unique<core::DisplaySubscriber>(mqtt, topic, sink,
                                                        cfg.fanout.renderPolicy(), logger);
  } catch (const std::exception& e) { // bad broker URI
    std::cerr << "[carpark_display] " << e.what() << "\n";
    return 1;
  }

  std::atomic<bool> stop{ false };
  std::atomic<bool> done{ false };
  std::thread signalWatch([&] {
    while (!done && !g_exit)
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    stop = true;
  });

  logger->setMirrorLevel(core::LogLevel::Info);
  display->run(stop);

  done = true;
  signalWatch.join();
  return 0;
}
