/* @file ConsoleSink.cpp
 * @brief bounded, EINTR-safe line writer for terminals
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstddef>

// Linux headers
#include <poll.h>
#include <unistd.h>

// Carpark headers
#include "io/ConsoleSink.hpp"

using namespace carpark::io;

namespace {
  void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    for (auto pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size()))
      s.replace(pos, from.size(), to);
  }
} // namespace

std::string carpark::io::toAccessibleSentence(const std::string& status) {
  std::string out = status;
  replaceAll(out, " | ", ". ");
  replaceAll(out, "°C", " degrees");
  replaceAll(out, ": --", ": not available");
  if (!out.empty() && out.back() != '.')
    out += '.';
  return out;
}

ConsoleSink::ConsoleSink(Style style, int fd) : fd_(fd), style_(style) {}

bool ConsoleSink::render(const std::string& text, std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return false;

  const std::string out = (style_ == Style::Accessible ? toAccessibleSentence(text) : text) + "\n";
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  std::size_t total = 0;
  while (total < out.size()) {
    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (ms_left.count() <= 0)
      return false; // terminal not draining

    pollfd pfd{ fd_, POLLOUT, 0 };
    int rc = ::poll(&pfd, 1, static_cast<int>(ms_left.count()));
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      return false;
    }
    if (rc == 0)
      return false;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
      return false;

    ssize_t written = ::write(fd_, out.data() + total, out.size() - total);
    if (written > 0)
      total += static_cast<std::size_t>(written);
    else if (written == -1 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK))
      continue;
    else
      return false;
  }
  return true;
}
