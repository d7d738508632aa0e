#pragma once
/** @file  FanoutWorker.hpp
 *  @brief One delivery target (display or message bus) with its own thread, queue and retries.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/RetryPolicy.hpp"
#include "core/StatusSnapshot.hpp"

namespace carpark::core {

  class ErrorMonitor;
  class Logger;

  /**
   * @class FanoutWorker
   * @brief Delivers snapshots to a single target, best effort.
   *
   *  * Per snapshot: Idle → Sending → {Acked, Retrying → Sending, Failed}.
   *  * Failed drops the snapshot for this target and reports to the ErrorMonitor.
   *  * The queue is unbounded: every posted snapshot gets its full attempt budget.
   *  * stop() cuts backoff sleeps short but still works through the queue,
   *    so shutdown takes at most pending × attempts × timeout.
   *  * Nothing here touches the OccupancyStore.
   */
  class FanoutWorker {
  public:
    /// Returns true on acknowledged delivery. May throw; a throw is a failed attempt.
    using Deliver = std::function<bool(const StatusSnapshot&, std::chrono::milliseconds timeout)>;

    enum class State { Idle, Sending, Retrying, Acked, Failed };

    FanoutWorker(std::string name, Deliver deliver, RetryPolicy policy,
                 std::shared_ptr<Logger> logger, std::shared_ptr<ErrorMonitor> errorMonitor);
    ~FanoutWorker(); ///< stop()

    void start();

    /// Queue a copy for delivery; false once stop() has begun.
    bool post(StatusSnapshot snapshot);

    /// Blocks until the queue is empty and no attempt is in flight.
    void waitIdle();

    /// Deliver everything still queued without backoff waits, then join.
    void stop();

    const std::string& name() const { return name_; }
    State state() const { return state_; }

    std::uint64_t delivered() const { return delivered_; }
    std::uint64_t failed() const { return failed_; }
    std::size_t pending() const;
    std::uint64_t attempts() const { return attempts_; }

    FanoutWorker(const FanoutWorker&) = delete;
    FanoutWorker& operator=(const FanoutWorker&) = delete;

  private:
    void workerLoop();
    void deliverWithRetry(const StatusSnapshot& snapshot);
    bool attempt(const StatusSnapshot& snapshot, int number);
    void sleepUnlessStopping(std::chrono::milliseconds delay);
    void transitionTo(State next);

    const std::string name_;
    Deliver deliver_;
    const RetryPolicy policy_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;

    std::deque<StatusSnapshot> queue_;
    bool busy_{ false };
    bool stopping_{ false }; ///< no new posts, no more backoff waits
    bool stopped_{ false };  ///< worker joined
    mutable std::mutex mtx_;
    std::condition_variable wakeCv_; ///< new work or stop
    std::condition_variable idleCv_; ///< queue drained
    std::thread worker_;

    std::atomic<State> state_{ State::Idle };
    std::atomic<std::uint64_t> delivered_{ 0 };
    std::atomic<std::uint64_t> failed_{ 0 };
    std::atomic<std::uint64_t> attempts_{ 0 };
  };

  const char* toString(FanoutWorker::State s);

} // namespace carpark::core
