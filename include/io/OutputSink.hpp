#pragma once
/** @file  OutputSink.hpp
 *  @brief Local status display capability (console, accessible console, text file, …).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <string>

namespace carpark {
  namespace io {

    /**
 * @class OutputSink
 * @brief Renders one formatted status line.
 *
 *  * Called from a single fan-out worker thread.
 *  * Must give up after roughly \p timeout; a slow display is a failed render.
 */
    class OutputSink {
    public:
      virtual ~OutputSink() = default;

      /** @returns false if the text could not be rendered (device gone, EIO, timeout). */
      virtual bool render(const std::string& text, std::chrono::milliseconds timeout) = 0;
    };

  } // namespace io
} // namespace carpark
