/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Carpark headers
#include "core/ErrorMonitor.hpp"

namespace carpark {
  namespace core {
    ErrorMonitor::ErrorMonitor() = default;
    ErrorMonitor::~ErrorMonitor() = default;

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    std::size_t ErrorMonitor::failureCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return count_;
    }

    std::vector<std::string> ErrorMonitor::uniqueFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_;
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      std::function<void(const std::string&)> escalate;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++count_;
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        escalate = escalation_;
      }
      // called outside the lock so the callback may log or notify again
      if (escalate)
        escalate(message);
    }
  } // namespace core
} // namespace carpark
