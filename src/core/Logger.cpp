/* @file Logger.cpp
 * @brief ring-buffered CSV logger, drained by one worker thread
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <utility>

// Carpark headers
#include "core/Logger.hpp"
#include "core/TimeFormat.hpp"
#include "io/FileLogger.hpp"

namespace carpark::core {

  const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
    default:
      return "UNKNOWN";
    }
  }

  Logger::Logger(std::size_t depth)
      : csvFile_(std::make_unique<io::FileLogger>()), buffer_(depth) {}

  Logger::~Logger() { finishRun(); }

  void Logger::startNewRun(const std::string& csvPath) {
    std::lock_guard<std::mutex> lock(runMtx_);
    if (running_)
      return;

    if (!csvFile_->open(csvPath))
      throw std::runtime_error("[Logger] cannot open log file: " + csvPath);

    buffer_.reopen();
    running_ = true;
    worker_ = std::thread(&Logger::workerLoop, this);
  }

  void Logger::log(LogEvent event) {
    mirror(event);
    if (!running_)
      return;
    if (buffer_.push(std::move(event)) == RingBuffer<LogEvent>::PushResult::Overwrote)
      ++overflowed_;
  }

  void Logger::finishRun() {
    std::lock_guard<std::mutex> lock(runMtx_);
    if (!running_)
      return;

    running_ = false;
    buffer_.close();
    if (worker_.joinable())
      worker_.join();
    csvFile_->close();
  }

  void Logger::debug(std::string component, std::string message) {
    log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Debug, std::move(component),
                  std::move(message) });
  }

  void Logger::info(std::string component, std::string message) {
    log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Info, std::move(component),
                  std::move(message) });
  }

  void Logger::warn(std::string component, std::string message) {
    log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Warn, std::move(component),
                  std::move(message) });
  }

  void Logger::error(std::string component, std::string message) {
    log(LogEvent{ std::chrono::system_clock::now(), LogLevel::Error, std::move(component),
                  std::move(message) });
  }

  std::string Logger::toCsv(const LogEvent& event) {
    // RFC 4180: quote the free-text column, double embedded quotes
    std::string quoted = "\"";
    for (char c : event.message) {
      if (c == '"')
        quoted += '"';
      quoted += (c == '\n' || c == '\r') ? ' ' : c;
    }
    quoted += '"';

    return toIso8601(event.when, /*millis=*/true) + ',' + toString(event.level) + ',' +
           event.component + ',' + quoted + '\n';
  }

  void Logger::workerLoop() {
    // rows keep coming after close() until the buffer is drained
    for (;;) {
      if (auto event = buffer_.popFor(std::chrono::milliseconds{ 500 })) {
        csvFile_->write(toCsv(*event));
        continue;
      }
      csvFile_->flush(); // idle or closed
      if (!running_ && buffer_.size() == 0)
        return;
    }
  }

  void Logger::mirror(const LogEvent& event) {
    if (static_cast<int>(event.level) < static_cast<int>(mirrorLevel_.load()))
      return;
    std::lock_guard<std::mutex> lock(stderrMtx_);
    std::cerr << '[' << event.component << "] " << toString(event.level) << ": "
              << event.message << '\n';
  }

} // namespace carpark::core
