#pragma once

/** @file  SystemController.hpp
 *  @brief Process lifecycle of carparkd: wires config, devices, broker and Coordinator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/Config.hpp"

namespace carpark {
  namespace io {
    class InputSource;
    class OutputSink;
    class Publisher;
    class ThermalZoneSensor;
  } // namespace io

  namespace core {

    class Coordinator;
    class ErrorMonitor;
    class Logger;
    class TelemetryStore;

    /**
 * @class SystemController
 * @brief Boot → Init → Running → Stopping → Finished, or Error on a fatal startup fault.
 *
 *  * `initialize()` throws ConfigurationError for a bad config (including an unknown
 *    backend name) and std::runtime_error for device or broker failures.
 *  * `run()` blocks the calling thread until `requestStop()`; it is safe to call
 *    `requestStop()` from another thread.
 */
    class SystemController {

    public:
      enum class State { Boot, Init, Running, Stopping, Finished, Error };

      SystemController();
      ~SystemController(); ///< shutdown()

      // ---- public API ----------------------------------------------------------
      void initialize(const std::string& configPath); ///< load + validate, then initialize(cfg)
      void initialize(const CarparkConfig& cfg);      ///< log run, store, sink, publisher, input
      void run();                                     ///< start everything, block until stopped
      void requestStop();
      void shutdown(); ///< idempotent
      void handleError(const std::string& reason);

      State state() const { return state_; }
      const CarparkConfig& config() const { return cfg_; }
      std::shared_ptr<ErrorMonitor> errorMonitor() const { return errorMonitor_; }

      SystemController(const SystemController&) = delete;
      SystemController& operator=(const SystemController&) = delete;

    private:
      void transitionTo(State next);
      void samplerLoop();
      void onRejected(const std::string& message);

      CarparkConfig cfg_;
      std::atomic<State> state_{ State::Boot };

      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<TelemetryStore> telemetry_;
      std::unique_ptr<io::ThermalZoneSensor> sensor_;
      std::unique_ptr<io::InputSource> input_;
      std::unique_ptr<Coordinator> coordinator_;

      std::thread sampler_;
      std::mutex mtx_;
      std::condition_variable stopCv_;
      bool stopRequested_{ false };
    };

    const char* toString(SystemController::State s);

  } // namespace core
} // namespace carpark
