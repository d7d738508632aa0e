#include "core/TelemetryStore.hpp"

using namespace carpark::core;

void TelemetryStore::set(Telemetry t, double value) {
  std::lock_guard<std::mutex> lock(mtx_);
  values_[t] = value;
}

void TelemetryStore::clear(Telemetry t) {
  std::lock_guard<std::mutex> lock(mtx_);
  values_.erase(t);
}

std::optional<double> TelemetryStore::get(Telemetry t) const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (auto it = values_.find(t); it != values_.end())
    return it->second;
  return std::nullopt;
}
