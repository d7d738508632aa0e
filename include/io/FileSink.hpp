#pragma once
/** @file  FileSink.hpp
 *  @brief Keeps a text file holding the latest status (for kiosks, web servers, …).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "io/OutputSink.hpp"

namespace carpark {
  namespace io {

    /**
 * @class FileSink
 * @brief Replaces \p path atomically on every render (write `<path>.tmp`, then rename).
 *
 *  Readers never observe a half-written status.
 */
    class FileSink : public OutputSink {
    public:
      explicit FileSink(std::string path);

      bool render(const std::string& text, std::chrono::milliseconds timeout) override;

      const std::string& path() const { return path_; }

    private:
      std::string path_;
    };

  } // namespace io
} // namespace carpark
