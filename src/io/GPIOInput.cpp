/* @file GPIOInput.cpp
 * @brief GPIO uAPI line-event request (GPIO_GET_LINEEVENT_IOCTL)
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <fcntl.h>
#include <linux/gpio.h>
#include <sys/ioctl.h>
#include <unistd.h>

// Carpark headers
#include "io/GPIOInput.hpp"

using namespace carpark::io;

GPIOInput::~GPIOInput() { close(); }

GPIOInput::GPIOInput(GPIOInput&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

GPIOInput& GPIOInput::operator=(GPIOInput&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

bool GPIOInput::open(const std::string& chip, unsigned int line, bool activeLow) {
  close();

  int chipFd = ::open(chip.c_str(), O_RDONLY | O_CLOEXEC);
  if (chipFd < 0) {
    std::cerr << "[GPIOInput] open " << chip << ": " << strerror(errno) << "\n";
    return false;
  }

  gpioevent_request req{};
  req.lineoffset = line;
  req.handleflags = GPIOHANDLE_REQUEST_INPUT | (activeLow ? GPIOHANDLE_REQUEST_ACTIVE_LOW : 0u);
  req.eventflags = GPIOEVENT_REQUEST_BOTH_EDGES;
  std::strncpy(req.consumer_label, "carpark", sizeof(req.consumer_label) - 1);

  const int rc = ::ioctl(chipFd, GPIO_GET_LINEEVENT_IOCTL, &req);
  const int err = errno;
  ::close(chipFd); // the line fd outlives the chip fd

  if (rc < 0) {
    std::cerr << "[GPIOInput] request line " << line << " on " << chip << ": " << strerror(err)
              << "\n";
    return false;
  }

  // non-blocking so a spurious wakeup never parks the watcher thread
  const int flags = ::fcntl(req.fd, F_GETFL);
  if (flags < 0 || ::fcntl(req.fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    std::cerr << "[GPIOInput] fcntl: " << strerror(errno) << "\n";
    ::close(req.fd);
    return false;
  }

  fd_ = req.fd;
  return true;
}

std::optional<GPIOInput::EdgeEvent> GPIOInput::readEdge() {
  if (fd_ < 0)
    return std::nullopt;

  gpioevent_data data{};
  for (;;) {
    ssize_t n = ::read(fd_, &data, sizeof(data));
    if (n == static_cast<ssize_t>(sizeof(data)))
      break;
    if (n == -1 && errno == EINTR)
      continue;
    if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK))
      return std::nullopt;
    std::cerr << "[GPIOInput] read: " << (n < 0 ? strerror(errno) : "short read") << "\n";
    return std::nullopt;
  }

  const Edge edge = data.id == GPIOEVENT_EVENT_RISING_EDGE ? Edge::Rising : Edge::Falling;
  const auto at = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::nanoseconds{ data.timestamp });
  return EdgeEvent{ edge, at };
}

void GPIOInput::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
}
