#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace carpark::core {

  /**
 * @class ErrorMonitor
 * @brief Other threads call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so a dead broker doesn’t spam the operator.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor();
    virtual ~ErrorMonitor();

    /// Register a lambda that escalates a fault (log, buzzer, …).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Every notification, duplicates included.
    std::size_t failureCount() const;

    /// Distinct messages seen so far.
    std::vector<std::string> uniqueFailures() const;

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    std::size_t count_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace carpark::core
