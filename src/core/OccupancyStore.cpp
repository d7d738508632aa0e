/* @file OccupancyStore.cpp
 * @brief bounded enter/exit counter
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// Carpark headers
#include "core/OccupancyStore.hpp"

using namespace carpark::core;

OccupancyStore::OccupancyStore(std::string location, int capacity, int initialOccupied,
                               Clock clock)
    : location_(std::move(location)), capacity_(capacity), occupied_(initialOccupied),
      clock_(std::move(clock)) {
  if (capacity_ <= 0)
    throw std::invalid_argument("[OccupancyStore] capacity must be positive");
  if (initialOccupied < 0 || initialOccupied > capacity_)
    throw std::invalid_argument("[OccupancyStore] initial occupancy outside [0, capacity]");
  if (!clock_)
    clock_ = [] { return std::chrono::system_clock::now(); };
}

Transition OccupancyStore::enter() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (occupied_ == capacity_)
    return Transition{ std::nullopt, OccupancyError::AtCapacity };
  ++occupied_;
  return Transition{ snapshotLocked(), OccupancyError::None };
}

Transition OccupancyStore::exit() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (occupied_ == 0)
    return Transition{ std::nullopt, OccupancyError::AlreadyEmpty };
  --occupied_;
  return Transition{ snapshotLocked(), OccupancyError::None };
}

Transition OccupancyStore::apply(InputEvent event) {
  return event == InputEvent::Enter ? enter() : exit();
}

int OccupancyStore::occupied() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return occupied_;
}

int OccupancyStore::available() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return capacity_ - occupied_;
}

StatusSnapshot OccupancyStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return snapshotLocked();
}

StatusSnapshot OccupancyStore::snapshotLocked() const {
  StatusSnapshot snap;
  snap.location = location_;
  snap.capacity = capacity_;
  snap.occupied = occupied_;
  snap.timestamp = clock_();
  return snap;
}
