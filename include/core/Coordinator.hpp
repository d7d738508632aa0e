#pragma once
/** @file  Coordinator.hpp
 *  @brief Serialises input events against the OccupancyStore and fans snapshots out.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/FanoutWorker.hpp"
#include "core/InputEvent.hpp"
#include "core/OccupancyStore.hpp"
#include "core/RetryPolicy.hpp"

namespace carpark {
  namespace io {
    class OutputSink;
    class Publisher;
  } // namespace io

  namespace core {

    class ErrorMonitor;
    class Logger;
    class TelemetryStore;

    struct CoordinatorOptions {
      std::string topic;            ///< fixed per lot
      RetryPolicy renderPolicy{ 3, std::chrono::milliseconds{ 200 },
                                std::chrono::milliseconds{ 5000 },
                                std::chrono::milliseconds{ 500 } };
      RetryPolicy publishPolicy{}; ///< 3 attempts, 200 ms base, 3 s per attempt
    };

    /**
 * @class Coordinator
 * @brief The lot's event loop: Idle → Applying → FanningOut → Idle.
 *
 *  * `submit()` is safe from any thread; events are applied one at a time, in arrival order.
 *  * Only the Applying step touches the store. Render and publish run on their own
 *    FanoutWorker threads over private snapshot copies, so a slow or dead target
 *    never stalls input or the other target.
 *  * A rejected transition emits nothing; it is reported through the rejection callback.
 *  * Fan-out failures never roll back the store.
 */
    class Coordinator {

    public:
      enum class State { Idle, Applying, FanningOut };

      using RejectionCallback = std::function<void(InputEvent, OccupancyError)>;

      Coordinator(std::unique_ptr<OccupancyStore> store, std::shared_ptr<io::OutputSink> sink,
                  std::shared_ptr<io::Publisher> publisher, CoordinatorOptions options,
                  std::shared_ptr<Logger> logger, std::shared_ptr<ErrorMonitor> errorMonitor,
                  std::shared_ptr<const TelemetryStore> telemetry = nullptr);
      ~Coordinator(); ///< stop()

      // ---- public API ----------------------------------------------------------
      /// Register before start(); invoked on the event-loop thread.
      void registerRejectionCallback(RejectionCallback cb) { onRejected_ = std::move(cb); }

      void start(); ///< launch the event loop and both fan-out workers

      /// Queue an event; false once stop() has begun.
      bool submit(InputEvent event);

      /// Blocks until every submitted event is applied and every snapshot delivered or failed.
      void waitIdle();

      /// Stop accepting input, apply queued events, deliver their snapshots, join.
      void stop();

      const OccupancyStore& store() const { return *store_; }
      const std::string& topic() const { return options_.topic; }
      State state() const;

      std::uint64_t applied() const;
      std::uint64_t rejected() const;

      const FanoutWorker& renderWorker() const { return *renderWorker_; }
      const FanoutWorker& publishWorker() const { return *publishWorker_; }

      Coordinator(const Coordinator&) = delete;
      Coordinator& operator=(const Coordinator&) = delete;

    private:
      void eventLoop();
      void handle(InputEvent event);
      StatusSnapshot decorate(const StatusSnapshot& snap) const;
      void transitionTo(State next);

      std::unique_ptr<OccupancyStore> store_;
      std::shared_ptr<io::OutputSink> sink_;
      std::shared_ptr<io::Publisher> publisher_;
      const CoordinatorOptions options_;
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<const TelemetryStore> telemetry_;
      RejectionCallback onRejected_{};

      std::unique_ptr<FanoutWorker> renderWorker_;
      std::unique_ptr<FanoutWorker> publishWorker_;

      std::deque<InputEvent> events_;
      State state_{ State::Idle };
      bool accepting_{ true };
      bool running_{ false };
      bool stopping_{ false };
      std::uint64_t applied_{ 0 };
      std::uint64_t rejected_{ 0 };
      mutable std::mutex mtx_;
      std::condition_variable eventCv_;
      std::condition_variable idleCv_;
      std::thread loop_;
    };

    const char* toString(Coordinator::State s);

  } // namespace core
} // namespace carpark
