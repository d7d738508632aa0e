/* @file SystemController.cpp
 * @brief carparkd lifecycle FSM + telemetry sampler
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// Carpark headers
#include "core/Backends.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Coordinator.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/OccupancyStore.hpp"
#include "core/StatusFormat.hpp"
#include "core/SystemController.hpp"
#include "core/TelemetryStore.hpp"
#include "io/InputSource.hpp"
#include "io/MqttOptions.hpp"
#include "io/MqttPublisher.hpp"
#include "io/OutputSink.hpp"
#include "io/ThermalZoneSensor.hpp"

namespace carpark::core {

  namespace {
    constexpr const char* kTag = "SystemController";
  } // namespace

  const char* toString(SystemController::State s) {
    switch (s) {
    case SystemController::State::Boot:
      return "Boot";
    case SystemController::State::Init:
      return "Init";
    case SystemController::State::Running:
      return "Running";
    case SystemController::State::Stopping:
      return "Stopping";
    case SystemController::State::Finished:
      return "Finished";
    case SystemController::State::Error:
      return "Error";
    default:
      return "Unknown";
    }
  }

  SystemController::SystemController()
      : logger_(std::make_shared<Logger>()), errorMonitor_(std::make_shared<ErrorMonitor>()),
        telemetry_(std::make_shared<TelemetryStore>()) {
    auto logger = logger_;
    errorMonitor_->registerEscalation(
        [logger](const std::string& msg) { logger->error("ErrorMonitor", msg); });
  }

  SystemController::~SystemController() { shutdown(); }

  void SystemController::initialize(const std::string& configPath) {
    try {
      initialize(ConfigLoader(configPath).loadConfig());
    } catch (const ConfigurationError& e) {
      if (state_ != State::Error)
        handleError(e.what());
      throw;
    }
  }

  void SystemController::initialize(const CarparkConfig& cfg) {
    if (state_ != State::Boot)
      throw std::logic_error("[SystemController] initialize() called twice");
    transitionTo(State::Init);
    cfg_ = cfg;

    try {
      logger_->startNewRun(cfg_.logPath);
      logger_->info(kTag, "lot '" + cfg_.location + "', capacity " +
                              std::to_string(cfg_.capacity));

      std::shared_ptr<io::OutputSink> sink;
      try {
        sink = makeOutputRegistry().create(cfg_.output.backend, cfg_);
        input_ = makeInputRegistry().create(cfg_.input.backend, cfg_, logger_);
      } catch (const std::out_of_range& e) {
        throw ConfigurationError(std::string("[SystemController] ") + e.what());
      } catch (const std::invalid_argument& e) {
        throw ConfigurationError(e.what());
      }

      io::MqttOptions mqtt;
      mqtt.host = cfg_.broker.host;
      mqtt.port = cfg_.broker.port;
      mqtt.clientId = cfg_.broker.clientId;
      mqtt.keepAliveSeconds = cfg_.broker.keepAliveSeconds;
      mqtt.connectTimeout = cfg_.fanout.publishTimeout;
      auto publisher = std::make_shared<io::MqttPublisher>(mqtt, logger_);
      publisher->connect(); // the core never starts without a broker

      if (cfg_.telemetry.thermalZone)
        sensor_ = std::make_unique<io::ThermalZoneSensor>(*cfg_.telemetry.thermalZone);

      CoordinatorOptions options;
      options.topic = cfg_.broker.topic.empty() ? defaultTopic(cfg_.location) : cfg_.broker.topic;
      options.publishPolicy = cfg_.fanout.publishPolicy();
      options.renderPolicy = cfg_.fanout.renderPolicy();

      coordinator_ = std::make_unique<Coordinator>(
          std::make_unique<OccupancyStore>(cfg_.location, cfg_.capacity, cfg_.initialOccupied),
          std::move(sink), std::move(publisher), options, logger_, errorMonitor_, telemetry_);

      coordinator_->registerRejectionCallback([this](InputEvent, OccupancyError err) {
        onRejected(err == OccupancyError::AtCapacity ? "car park is full"
                                                     : "car park is already empty");
      });
      Coordinator* coordinator = coordinator_.get();
      input_->registerCallback([coordinator](InputEvent e) { coordinator->submit(e); });

      logger_->info(kTag, "publishing to " + options.topic);
    } catch (const std::exception& e) {
      handleError(e.what());
      throw;
    }
  }

  void SystemController::run() {
    if (state_ != State::Init)
      throw std::logic_error("[SystemController] run() before initialize()");

    try {
      coordinator_->start();
      input_->start();
    } catch (const std::exception& e) {
      handleError(e.what());
      shutdown();
      throw;
    }

    if (sensor_)
      sampler_ = std::thread(&SystemController::samplerLoop, this);
    transitionTo(State::Running);

    {
      std::unique_lock<std::mutex> lock(mtx_);
      stopCv_.wait(lock, [this] { return stopRequested_; });
    }
    shutdown();
  }

  void SystemController::requestStop() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      stopRequested_ = true;
    }
    stopCv_.notify_all();
  }

  void SystemController::shutdown() {
    const State from = state_;
    if (from == State::Finished || from == State::Stopping)
      return;
    if (from != State::Error)
      transitionTo(State::Stopping);

    requestStop();
    if (input_)
      input_->stop();
    if (coordinator_) {
      coordinator_->stop();
      logger_->info(kTag, "applied " + std::to_string(coordinator_->applied()) + ", rejected " +
                              std::to_string(coordinator_->rejected()));
    }
    if (sampler_.joinable())
      sampler_.join();

    coordinator_.reset(); // releases the publisher, which disconnects
    input_.reset();

    if (from != State::Error)
      transitionTo(State::Finished);
    logger_->finishRun();
  }

  void SystemController::handleError(const std::string& reason) {
    logger_->error(kTag, reason);
    errorMonitor_->notifyFailure(reason);
    transitionTo(State::Error);
  }

  void SystemController::transitionTo(State next) {
    const State prev = state_.exchange(next);
    if (prev != next)
      logger_->debug(kTag, std::string(toString(prev)) + " -> " + toString(next));
  }

  void SystemController::onRejected(const std::string& message) {
    logger_->warn(kTag, "signal ignored: " + message);
  }

  void SystemController::samplerLoop() {
    bool haveReading = false;
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stopRequested_) {
      lock.unlock();
      auto celsius = sensor_->read();
      if (celsius) {
        telemetry_->set(Telemetry::Temperature, *celsius);
      } else {
        telemetry_->clear(Telemetry::Temperature);
        if (haveReading)
          logger_->warn(kTag, "temperature unavailable from " + sensor_->path());
      }
      haveReading = celsius.has_value();
      lock.lock();
      stopCv_.wait_for(lock, cfg_.telemetry.interval, [this] { return stopRequested_; });
    }
  }

} // namespace carpark::core
