#pragma once
/** @file  OccupancyStore.hpp
 *  @brief Authoritative occupancy count for one lot; the only mutator of that state.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "core/InputEvent.hpp"
#include "core/StatusSnapshot.hpp"

namespace carpark::core {

  /** Boundary violations reported by enter()/exit(). Never thrown. */
  enum class OccupancyError { None, AtCapacity, AlreadyEmpty };

  inline const char* toString(OccupancyError e) {
    switch (e) {
    case OccupancyError::None:
      return "None";
    case OccupancyError::AtCapacity:
      return "AtCapacity";
    case OccupancyError::AlreadyEmpty:
      return "AlreadyEmpty";
    default:
      return "Unknown";
    }
  }

  /**
   * @struct Transition
   * @brief Outcome of a single enter()/exit(): a snapshot on success, an error otherwise.
   */
  struct Transition {
    std::optional<StatusSnapshot> snapshot{};
    OccupancyError error{ OccupancyError::None };

    explicit operator bool() const { return snapshot.has_value(); }
  };

  /**
   * @class OccupancyStore
   * @brief Mutex-protected `0 <= occupied <= capacity` counter.
   *
   *  * Rejections leave the count untouched; nothing is ever clamped.
   *  * Pure state: no logging, no I/O, no callbacks.
   */
  class OccupancyStore {
  public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /// @throws std::invalid_argument if capacity <= 0 or initialOccupied is out of range.
    OccupancyStore(std::string location, int capacity, int initialOccupied = 0,
                   Clock clock = {});

    Transition enter();
    Transition exit();
    Transition apply(InputEvent event);

    int occupied() const;
    int available() const;
    int capacity() const { return capacity_; }
    const std::string& location() const { return location_; }

    StatusSnapshot snapshot() const;

    // ─── non-copyable, non-movable (guards its own mutex) ───────────────────────
    OccupancyStore(const OccupancyStore&) = delete;
    OccupancyStore& operator=(const OccupancyStore&) = delete;

  private:
    StatusSnapshot snapshotLocked() const;

    const std::string location_;
    const int capacity_;
    int occupied_{ 0 };
    Clock clock_;
    mutable std::mutex mtx_;
  };

} // namespace carpark::core
