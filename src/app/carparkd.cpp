/* @file carparkd.cpp
 * @brief occupancy service: input devices → Coordinator → display + broker
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

// Carpark headers
#include "core/SystemController.hpp"

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
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <config.json>\n";
    return 2;
  }

  installSignalHandlers();
  carpark::core::SystemController controller;

  try {
    controller.initialize(argv[1]);
  } catch (const std::exception& e) { // every startup failure is fatal
    std::cerr << e.what() << "\n";
    return 1;
  }

  // the handler only sets a flag; this thread turns it into a stop request
  std::atomic<bool> done{ false };
  std::thread signalWatch([&] {
    while (!done && !g_exit)
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    controller.requestStop();
  });

  int rc = 0;
  try {
    controller.run();
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    rc = 1;
  }

  done = true;
  signalWatch.join();
  return rc;
}
