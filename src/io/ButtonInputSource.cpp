/* @file ButtonInputSource.cpp
 * @brief enter / exit buttons multiplexed with poll(2)
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cerrno>
#include <cstring> // for strerror
#include <stdexcept>
#include <utility>

// Linux headers
#include <poll.h>

// Carpark headers
#include "core/Logger.hpp"
#include "io/ButtonInputSource.hpp"

using namespace carpark::io;
using carpark::core::InputEvent;

namespace {
  constexpr const char* kTag = "ButtonInput";
}

ButtonInputSource::ButtonInputSource(std::string chip, unsigned int enterLine,
                                     unsigned int exitLine, bool activeLow,
                                     std::shared_ptr<core::Logger> logger)
    : chip_(std::move(chip)), enterLine_(enterLine), exitLine_(exitLine), activeLow_(activeLow),
      logger_(std::move(logger)) {}

ButtonInputSource::~ButtonInputSource() { stop(); }

void ButtonInputSource::start() {
  if (running_)
    return;

  if (!enterInput_.open(chip_, enterLine_, activeLow_) ||
      !exitInput_.open(chip_, exitLine_, activeLow_)) {
    enterInput_.close();
    exitInput_.close();
    throw std::runtime_error(std::string("[") + kTag + "] cannot request lines " +
                             std::to_string(enterLine_) + "/" + std::to_string(exitLine_) +
                             " on " + chip_);
  }

  running_ = true;
  watcher_ = std::thread(&ButtonInputSource::watchLoop, this);
  logger_->info(kTag, "watching " + chip_ + " lines " + std::to_string(enterLine_) + " (enter), " +
                          std::to_string(exitLine_) + " (exit)");
}

void ButtonInputSource::stop() {
  running_ = false;
  if (watcher_.joinable())
    watcher_.join();
  enterInput_.close();
  exitInput_.close();
}

void ButtonInputSource::watchLoop() {
  while (running_) {
    pollfd fds[2] = { { enterInput_.fd(), POLLIN, 0 }, { exitInput_.fd(), POLLIN, 0 } };
    int rc = ::poll(fds, 2, kPollMs);
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      logger_->error(kTag, std::string("poll: ") + strerror(errno));
      return;
    }
    if (rc == 0)
      continue;

    if (fds[0].revents & POLLIN)
      drain(enterInput_, enterButton_, InputEvent::Enter);
    if (fds[1].revents & POLLIN)
      drain(exitInput_, exitButton_, InputEvent::Exit);

    if ((fds[0].revents | fds[1].revents) & (POLLERR | POLLNVAL)) {
      logger_->error(kTag, "GPIO line lost, no further events from this source");
      return;
    }
  }
}

void ButtonInputSource::drain(GPIOInput& line, ButtonGPIO& button, InputEvent intent) {
  while (auto edge = line.readEdge()) {
    if (button.onEdge(edge->edge, edge->at))
      emit(intent);
  }
}
