/* @file FanoutWorker.cpp
 * @brief per-target delivery thread: bounded retry + exponential backoff
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <stdexcept>
#include <utility>

// Carpark headers
#include "core/ErrorMonitor.hpp"
#include "core/FanoutWorker.hpp"
#include "core/Logger.hpp"

namespace carpark::core {

  const char* toString(FanoutWorker::State s) {
    switch (s) {
    case FanoutWorker::State::Idle:
      return "Idle";
    case FanoutWorker::State::Sending:
      return "Sending";
    case FanoutWorker::State::Retrying:
      return "Retrying";
    case FanoutWorker::State::Acked:
      return "Acked";
    case FanoutWorker::State::Failed:
      return "Failed";
    default:
      return "Unknown";
    }
  }

  FanoutWorker::FanoutWorker(std::string name, Deliver deliver, RetryPolicy policy,
                             std::shared_ptr<Logger> logger,
                             std::shared_ptr<ErrorMonitor> errorMonitor)
      : name_(std::move(name)), deliver_(std::move(deliver)), policy_(policy),
        logger_(std::move(logger)), errorMonitor_(std::move(errorMonitor)) {
    if (!deliver_)
      throw std::invalid_argument("[FanoutWorker] " + name_ + ": no delivery function");
    if (!logger_ || !errorMonitor_)
      throw std::invalid_argument("[FanoutWorker] " + name_ + ": logger and error monitor required");
    if (policy_.attempts < 1)
      throw std::invalid_argument("[FanoutWorker] " + name_ + ": attempts must be >= 1");
  }

  FanoutWorker::~FanoutWorker() { stop(); }

  void FanoutWorker::start() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (worker_.joinable() || stopping_)
      return;
    worker_ = std::thread(&FanoutWorker::workerLoop, this);
  }

  bool FanoutWorker::post(StatusSnapshot snapshot) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (stopping_)
        return false;
      queue_.push_back(std::move(snapshot));
    }
    wakeCv_.notify_one();
    return true;
  }

  std::size_t FanoutWorker::pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

  void FanoutWorker::waitIdle() {
    std::unique_lock<std::mutex> lock(mtx_);
    idleCv_.wait(lock, [this] { return (queue_.empty() && !busy_) || stopped_; });
  }

  void FanoutWorker::stop() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (stopping_)
        return;
      stopping_ = true;
    }
    wakeCv_.notify_all();
    if (worker_.joinable())
      worker_.join();

    std::size_t abandoned = 0;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      abandoned = queue_.size(); // non-zero only if start() never ran
      queue_.clear();
      stopped_ = true;
    }
    idleCv_.notify_all();
    if (abandoned > 0)
      logger_->warn(name_, "stopped before start, " + std::to_string(abandoned) +
                               " snapshot(s) never delivered");
  }

  void FanoutWorker::workerLoop() {
    for (;;) {
      StatusSnapshot snapshot;
      {
        std::unique_lock<std::mutex> lock(mtx_);
        wakeCv_.wait(lock, [this] { return !queue_.empty() || stopping_; });
        if (queue_.empty())
          return; // stopping and drained
        snapshot = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
      }

      deliverWithRetry(snapshot);

      {
        std::lock_guard<std::mutex> lock(mtx_);
        busy_ = false;
        if (queue_.empty())
          idleCv_.notify_all();
      }
    }
  }

  void FanoutWorker::deliverWithRetry(const StatusSnapshot& snapshot) {
    int made = 0;
    while (made < policy_.attempts) {
      ++made;
      transitionTo(State::Sending);
      if (attempt(snapshot, made)) {
        transitionTo(State::Acked);
        ++delivered_;
        logger_->debug(name_, "delivered after " + std::to_string(made) + " attempt(s)");
        transitionTo(State::Idle);
        return;
      }
      if (made == policy_.attempts)
        break;

      transitionTo(State::Retrying);
      const auto delay = policy_.backoff(made);
      logger_->warn(name_, "attempt " + std::to_string(made) + "/" +
                               std::to_string(policy_.attempts) + " failed, retrying in " +
                               std::to_string(delay.count()) + " ms");
      sleepUnlessStopping(delay);
    }

    transitionTo(State::Failed);
    ++failed_;
    const std::string msg =
        "[" + name_ + "] delivery failed after " + std::to_string(made) + " attempt(s)";
    logger_->error(name_, msg);
    errorMonitor_->notifyFailure(msg);
    transitionTo(State::Idle);
  }

  bool FanoutWorker::attempt(const StatusSnapshot& snapshot, int number) {
    ++attempts_;
    const auto started = std::chrono::steady_clock::now();
    bool ok = false;
    try {
      ok = deliver_(snapshot, policy_.timeout);
    } catch (const std::exception& e) {
      logger_->warn(name_, "attempt " + std::to_string(number) + " threw: " + e.what());
      return false;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (ok && elapsed > policy_.timeout) {
      logger_->warn(name_, "attempt " + std::to_string(number) + " overran its " +
                               std::to_string(policy_.timeout.count()) + " ms bound");
      return false;
    }
    return ok;
  }

  // shutdown skips the wait, not the attempt
  void FanoutWorker::sleepUnlessStopping(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mtx_);
    wakeCv_.wait_for(lock, delay, [this] { return stopping_; });
  }

  void FanoutWorker::transitionTo(State next) { state_ = next; }

} // namespace carpark::core
