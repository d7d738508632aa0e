#pragma once
/** @file  ConsoleSink.hpp
 *  @brief Status line on a terminal, plain or screen-reader friendly.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "io/OutputSink.hpp"

namespace carpark {
  namespace io {

    /**
 * @class ConsoleSink
 * @brief Writes each status as one line to a descriptor (stdout by default).
 *
 *  * `Style::Accessible` turns the status into a spoken-style sentence.
 *  * Writes are bounded by the render timeout (poll on POLLOUT).
 *  * Does not own the descriptor.
 */
    class ConsoleSink : public OutputSink {
    public:
      enum class Style { Plain, Accessible };

      explicit ConsoleSink(Style style = Style::Plain, int fd = 1);

      bool render(const std::string& text, std::chrono::milliseconds timeout) override;

    private:
      int fd_;
      Style style_;
    };

    /**
 * "Lot | Available bays: 4 | Temperature: 21.5°C | At: 10:32:05"
 *   → "Lot. Available bays: 4. Temperature: 21.5 degrees. At: 10:32:05."
 */
    std::string toAccessibleSentence(const std::string& status);

  } // namespace io
} // namespace carpark
