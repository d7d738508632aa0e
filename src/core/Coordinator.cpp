/* @file Coordinator.cpp
 * @brief single-consumer event loop + two isolated fan-out workers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// Carpark headers
#include "core/Coordinator.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/StatusFormat.hpp"
#include "core/TelemetryStore.hpp"
#include "io/OutputSink.hpp"
#include "io/Publisher.hpp"

namespace carpark::core {

  namespace {
    constexpr const char* kTag = "Coordinator";
  } // namespace

  const char* toString(Coordinator::State s) {
    switch (s) {
    case Coordinator::State::Idle:
      return "Idle";
    case Coordinator::State::Applying:
      return "Applying";
    case Coordinator::State::FanningOut:
      return "FanningOut";
    default:
      return "Unknown";
    }
  }

  Coordinator::Coordinator(std::unique_ptr<OccupancyStore> store,
                           std::shared_ptr<io::OutputSink> sink,
                           std::shared_ptr<io::Publisher> publisher, CoordinatorOptions options,
                           std::shared_ptr<Logger> logger,
                           std::shared_ptr<ErrorMonitor> errorMonitor,
                           std::shared_ptr<const TelemetryStore> telemetry)
      : store_(std::move(store)), sink_(std::move(sink)), publisher_(std::move(publisher)),
        options_(std::move(options)), logger_(std::move(logger)),
        errorMonitor_(std::move(errorMonitor)), telemetry_(std::move(telemetry)) {
    if (!store_ || !sink_ || !publisher_)
      throw std::invalid_argument("[Coordinator] store, sink and publisher are required");
    if (options_.topic.empty())
      throw std::invalid_argument("[Coordinator] empty publish topic");

    // each worker captures only its own collaborator; the store stays here
    auto renderTarget = sink_;
    renderWorker_ = std::make_unique<FanoutWorker>(
        "OutputSink",
        [renderTarget](const StatusSnapshot& snap, std::chrono::milliseconds timeout) {
          return renderTarget->render(formatStatus(snap), timeout);
        },
        options_.renderPolicy, logger_, errorMonitor_);

    auto publishTarget = publisher_;
    auto topic = options_.topic;
    publishWorker_ = std::make_unique<FanoutWorker>(
        "Publisher",
        [publishTarget, topic](const StatusSnapshot& snap, std::chrono::milliseconds timeout) {
          return publishTarget->publish(topic, toPayload(snap), timeout);
        },
        options_.publishPolicy, logger_, errorMonitor_);
  }

  Coordinator::~Coordinator() { stop(); }

  void Coordinator::start() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (running_ || stopping_)
      return;
    running_ = true;
    renderWorker_->start();
    publishWorker_->start();
    loop_ = std::thread(&Coordinator::eventLoop, this);
    logger_->info(kTag, store_->location() + ": started, " + std::to_string(store_->available()) +
                            "/" + std::to_string(store_->capacity()) + " bays available");
  }

  bool Coordinator::submit(InputEvent event) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (!accepting_)
        return false;
      events_.push_back(event);
    }
    eventCv_.notify_one();
    return true;
  }

  void Coordinator::waitIdle() {
    {
      std::unique_lock<std::mutex> lock(mtx_);
      idleCv_.wait(lock, [this] {
        return (events_.empty() && state_ == State::Idle) || !running_;
      });
    }
    renderWorker_->waitIdle();
    publishWorker_->waitIdle();
  }

  void Coordinator::stop() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (stopping_)
        return;
      accepting_ = false;
      stopping_ = true;
    }
    eventCv_.notify_all();
    if (loop_.joinable())
      loop_.join();

    renderWorker_->stop();
    publishWorker_->stop();
    {
      std::lock_guard<std::mutex> lock(mtx_);
      running_ = false;
    }
    idleCv_.notify_all();
    logger_->info(kTag, store_->location() + ": stopped after " + std::to_string(applied()) +
                            " applied / " + std::to_string(rejected()) + " rejected event(s)");
  }

  Coordinator::State Coordinator::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
  }

  std::uint64_t Coordinator::applied() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return applied_;
  }

  std::uint64_t Coordinator::rejected() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return rejected_;
  }

  void Coordinator::eventLoop() {
    for (;;) {
      InputEvent event;
      {
        std::unique_lock<std::mutex> lock(mtx_);
        eventCv_.wait(lock, [this] { return !events_.empty() || stopping_; });
        if (events_.empty())
          break; // stopping and drained
        event = events_.front();
        events_.pop_front();
        state_ = State::Applying;
      }

      handle(event);

      {
        std::lock_guard<std::mutex> lock(mtx_);
        state_ = State::Idle;
        if (events_.empty())
          idleCv_.notify_all();
      }
    }
  }

  void Coordinator::handle(InputEvent event) {
    // state_ is already Applying (set while dequeuing)
    Transition result = store_->apply(event);

    if (!result) {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++rejected_;
      }
      logger_->warn(kTag, std::string(toString(event)) + " rejected: " + toString(result.error));
      if (onRejected_)
        onRejected_(event, result.error);
      return;
    }

    transitionTo(State::FanningOut);
    {
      std::lock_guard<std::mutex> lock(mtx_);
      ++applied_;
    }
    const StatusSnapshot snap = decorate(*result.snapshot);
    logger_->info(kTag, std::string(toString(event)) + " applied, " +
                            std::to_string(snap.available()) + " bays available");

    // each worker queues its own copy
    renderWorker_->post(snap);
    publishWorker_->post(snap);
  }

  StatusSnapshot Coordinator::decorate(const StatusSnapshot& snap) const {
    if (!telemetry_)
      return snap;
    return snap.withTemperature(telemetry_->get(Telemetry::Temperature));
  }

  void Coordinator::transitionTo(State next) {
    std::lock_guard<std::mutex> lock(mtx_);
    state_ = next;
  }

} // namespace carpark::core
