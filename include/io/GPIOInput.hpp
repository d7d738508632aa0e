#pragma once
/** @file  GPIOInput.hpp
 *  @brief Edge-event input for a single GPIO line (Linux GPIO character device).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

namespace carpark {
  namespace io {

    /**
 * @class GPIOInput
 * @brief Owns one requested GPIO line and reads its kernel-timestamped edges.
 *
 *  * Non-blocking: the owner polls `fd()` and calls `readEdge()` when it is readable.
 *  * Active-low inversion is done by the kernel, so Rising always means "pressed".
 *  * No copy, move-enabled (sole owner of the line handle).
 */
    class GPIOInput {
    public:
      enum class Edge { Rising, Falling };

      struct EdgeEvent {
        Edge edge;
        std::chrono::milliseconds at; ///< kernel timestamp
      };

      GPIOInput() = default;
      virtual ~GPIOInput(); ///< auto-release line

      /** @returns false if the GPIO chip/line cannot be opened. */
      bool open(const std::string& chip, ///< e.g. "/dev/gpiochip0"
                unsigned int line,       ///< pin number
                bool activeLow = false);

      /** Next queued edge, std::nullopt if none is pending or the read failed. */
      virtual std::optional<EdgeEvent> readEdge();

      int fd() const { return fd_; }
      bool isOpen() const { return fd_ >= 0; }
      void close();

      // ─── non-copyable, move-enabled ───────────────────────────────────────────
      GPIOInput(const GPIOInput&) = delete;
      GPIOInput& operator=(const GPIOInput&) = delete;
      GPIOInput(GPIOInput&& other) noexcept;
      GPIOInput& operator=(GPIOInput&& other) noexcept;

    protected:
      int fd_{ -1 }; ///< line event FD (-1 = closed)
    };

  } // namespace io
} // namespace carpark
