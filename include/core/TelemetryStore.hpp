#pragma once
/** @file  TelemetryStore.hpp
 *  @brief Thread-safe latest-value cache for ancillary lot telemetry.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <optional>
#include <unordered_map>

namespace carpark {
  namespace core {

    /**
 * @enum Telemetry
 * @brief Strong-typed keys for every reading a snapshot can carry.
 */
    enum class Telemetry {
      Temperature, ///< °C
    };

    /** @class TelemetryStore
 *  @brief Lock-protected map of <Telemetry → double>.
 *
 *  * Written by the sampler thread, read by the Coordinator when it builds a snapshot.
 *  * A key that was never written (or was cleared) reads as std::nullopt.
 */
    class TelemetryStore {

    public:
      TelemetryStore() = default;
      ~TelemetryStore() = default;

      /// Atomically writes \p value under key \p t.
      void set(Telemetry t, double value);

      /// Forget the reading, e.g. after a sensor error.
      void clear(Telemetry t);

      /// Thread-safe getter; std::nullopt if key missing.
      std::optional<double> get(Telemetry t) const;

    private:
      mutable std::mutex mtx_;
      std::unordered_map<Telemetry, double> values_;
    };

  } // namespace core
} // namespace carpark
