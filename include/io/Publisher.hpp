#pragma once
/** @file  Publisher.hpp
 *  @brief Message-bus delivery capability.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

namespace carpark {
  namespace io {

    /**
 * @class Publisher
 * @brief Delivers a payload to a topic and waits (bounded) for the broker's acknowledgement.
 *
 *  * Owns its connection; callers never see the transport.
 *  * Called from a single fan-out worker thread.
 */
    class Publisher {
    public:
      virtual ~Publisher() = default;

      /** @returns true once the broker acknowledged within \p timeout. */
      virtual bool publish(const std::string& topic, const std::string& payload,
                           std::chrono::milliseconds timeout) = 0;
    };

  } // namespace io
} // namespace carpark
