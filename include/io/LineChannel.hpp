#pragma once
/** @file  LineChannel.hpp
 *  @brief Non-blocking line I/O over a tty or an inherited descriptor (stdin).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <optional>
#include <string>

// Linux header
#include <termios.h> // for speed_t types e.g., B115200

namespace carpark {
  namespace io {

    /**
 * @class LineChannel
 * @brief RAII wrapper around a single /dev/tty* (or adopted) file descriptor.
 *
 *  * Frames input as lines ending in `\n` (a trailing `\r` is stripped); writes `\r\n`.
 *  * *Non-copyable*, but move-constructible.
 */

    class LineChannel {

    public:
      //---ctr / dtr--------------------------------------------
      LineChannel() = default;
      virtual ~LineChannel(); // close the fd at destruction (unless borrowed)

      //---public API-------------------------------------------
      /// Open a serial device raw, 8N1, no flow control.
      virtual bool open(const std::string& dev, speed_t baud);

      /// Use an already-open fd (e.g. STDIN_FILENO); closed on destruction only if \p owned.
      bool adopt(int fd, bool owned = false);

      virtual bool writeLine(const std::string& line); // returns false on EIO

      /// std::nullopt on timeout, disconnect, or error; see `isOpen()` to tell them apart.
      virtual std::optional<std::string> readLine(std::chrono::milliseconds timeout);

      bool isOpen() const { return fd_ >= 0; }
      void close();

      //---non-copyable-----------------------------------------
      LineChannel(const LineChannel&) = delete;
      LineChannel& operator=(const LineChannel&) = delete;

      //---mv and mv assign-------------------------------------
      LineChannel(LineChannel&& other) noexcept;
      LineChannel& operator=(LineChannel&& other) noexcept;

    private:
      std::optional<std::string> takeLine();

      int fd_{ -1 };            ///< POSIX fd (-1==closed)
      bool owned_{ true };      ///< close fd_ in close()
      std::string rx_buffer_{}; ///< buffer to store readLine content
    };

    /// Map a numeric baud rate (9600, 115200, …) to its termios constant; B0 if unsupported.
    speed_t toSpeed(int baud);

  } // namespace io
} // namespace carpark
