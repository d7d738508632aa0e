/* @file LineInputSource.cpp
 * @brief line-oriented intent parsing on a watcher thread
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <stdexcept>
#include <utility>

// Linux headers
#include <unistd.h> // STDIN_FILENO

// Carpark headers
#include "core/Logger.hpp"
#include "io/LineInputSource.hpp"

using namespace carpark::io;
using carpark::core::InputEvent;

std::optional<InputEvent> carpark::io::parseInputLine(std::string_view line) {
  std::string word;
  for (char c : line) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      word += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (word == "+" || word == "e" || word == "enter" || word == "in")
    return InputEvent::Enter;
  if (word == "-" || word == "x" || word == "exit" || word == "out")
    return InputEvent::Exit;
  return std::nullopt;
}

std::unique_ptr<LineInputSource> LineInputSource::console(std::shared_ptr<core::Logger> logger) {
  return std::make_unique<LineInputSource>(STDIN_FILENO, "ConsoleInput", std::move(logger));
}

std::unique_ptr<LineInputSource> LineInputSource::serial(std::string device, int baud,
                                                         std::shared_ptr<core::Logger> logger) {
  const speed_t speed = toSpeed(baud);
  if (speed == B0)
    throw std::invalid_argument("[SerialInput] unsupported baud rate " + std::to_string(baud));
  return std::make_unique<LineInputSource>(std::move(device), speed, "SerialInput",
                                           std::move(logger));
}

LineInputSource::LineInputSource(int fd, std::string name, std::shared_ptr<core::Logger> logger)
    : fd_(fd), name_(std::move(name)), logger_(std::move(logger)) {}

LineInputSource::LineInputSource(std::string device, speed_t baud, std::string name,
                                 std::shared_ptr<core::Logger> logger)
    : device_(std::move(device)), baud_(baud), name_(std::move(name)), logger_(std::move(logger)) {}

LineInputSource::~LineInputSource() { stop(); }

void LineInputSource::start() {
  if (running_)
    return;

  const bool opened = fd_ >= 0 ? channel_.adopt(fd_, /*owned=*/false) : channel_.open(device_, baud_);
  if (!opened)
    throw std::runtime_error("[" + name_ + "] cannot open " +
                             (fd_ >= 0 ? "fd " + std::to_string(fd_) : device_));

  running_ = true;
  watcher_ = std::thread(&LineInputSource::watchLoop, this);
  logger_->info(name_, "watching for enter/exit lines");
}

void LineInputSource::stop() {
  running_ = false;
  if (watcher_.joinable())
    watcher_.join();
  channel_.close();
}

void LineInputSource::watchLoop() {
  while (running_) {
    auto line = channel_.readLine(kPollInterval);
    if (!line) {
      if (!channel_.isOpen()) {
        logger_->warn(name_, "input closed, no further events from this source");
        return;
      }
      continue; // timeout
    }
    if (line->empty())
      continue;

    if (auto event = parseInputLine(*line))
      emit(*event);
    else
      logger_->info(name_, "ignored input line: " + *line);
  }
}
