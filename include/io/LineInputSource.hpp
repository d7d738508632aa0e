#pragma once
/** @file  LineInputSource.hpp
 *  @brief Console / serial-keypad input: one intent per text line.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "io/InputSource.hpp"
#include "io/LineChannel.hpp"

namespace carpark {
  namespace core {
    class Logger;
  } // namespace core

  namespace io {

    /**
 * Map one line to an intent (case-insensitive, surrounding blanks ignored):
 * `+`, `e`, `enter`, `in` → Enter; `-`, `x`, `exit`, `out` → Exit.
 */
    std::optional<core::InputEvent> parseInputLine(std::string_view line);

    /**
 * @class LineInputSource
 * @brief Watches a LineChannel on its own thread and emits one event per recognised line.
 *
 *  * Unrecognised lines are logged and ignored.
 *  * End of input (Ctrl-D, unplugged keypad) ends the watcher; it is logged, not fatal.
 */
    class LineInputSource : public InputSource {
    public:
      /// Backend "console": reads the process's stdin.
      static std::unique_ptr<LineInputSource> console(std::shared_ptr<core::Logger> logger);

      /// Backend "serial": reads a tty at \p baud.
      static std::unique_ptr<LineInputSource> serial(std::string device, int baud,
                                                     std::shared_ptr<core::Logger> logger);

      /// Reads an already-open descriptor (not closed on destruction).
      LineInputSource(int fd, std::string name, std::shared_ptr<core::Logger> logger);
      LineInputSource(std::string device, speed_t baud, std::string name,
                      std::shared_ptr<core::Logger> logger);
      ~LineInputSource() override; ///< stop()

      void start() override;
      void stop() override;

    private:
      void watchLoop();

      static constexpr std::chrono::milliseconds kPollInterval{ 100 };

      LineChannel channel_;
      int fd_{ -1 };       ///< adopted fd, or -1 when opening device_
      std::string device_; ///< tty path
      speed_t baud_{ B0 };
      std::string name_;
      std::shared_ptr<core::Logger> logger_;
      std::atomic<bool> running_{ false };
      std::thread watcher_;
    };

  } // namespace io
} // namespace carpark
