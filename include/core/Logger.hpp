#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/RingBuffer.hpp"

namespace carpark {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    enum class LogLevel { Debug, Info, Warn, Error };

    const char* toString(LogLevel level);

    /** One CSV row: timestamp,level,component,message */
    struct LogEvent {
      std::chrono::system_clock::time_point when{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string component;
      std::string message;
    };

    /**
 * @class Logger
 * @brief Producers enqueue LogEvents without blocking; a worker thread drains them to CSV.
 *
 *  * Events at or above the mirror level are also printed to stderr as
 *    `[component] message`, whether or not a run is active.
 *  * Without an active run the CSV row is dropped.
 *  * Overflow evicts the oldest queued row and is counted in `overflowed()`.
 */
    class Logger {

    public:
      static constexpr std::size_t kDefaultDepth = 1024;

      explicit Logger(std::size_t depth = kDefaultDepth);
      virtual ~Logger(); ///< finishRun()

      // --- public API ---
      /// open \p csvPath (append) + launch worker thread; throws std::runtime_error on open failure
      void startNewRun(const std::string& csvPath);
      virtual void log(LogEvent event); ///< enqueue event (non-blocking)
      void finishRun();                 ///< flush + join worker thread

      void debug(std::string component, std::string message);
      void info(std::string component, std::string message);
      void warn(std::string component, std::string message);
      void error(std::string component, std::string message);

      void setMirrorLevel(LogLevel level) { mirrorLevel_ = level; }
      bool running() const { return running_; }
      std::size_t overflowed() const { return overflowed_; }

      /// CSV rendering of one event, including the trailing newline.
      static std::string toCsv(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void mirror(const LogEvent& event);

      std::unique_ptr<io::FileLogger> csvFile_;
      RingBuffer<LogEvent> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> mirrorLevel_{ LogLevel::Warn };
      std::atomic<std::size_t> overflowed_{ 0 };
      std::mutex stderrMtx_;
      std::mutex runMtx_; ///< serialises startNewRun / finishRun
    };

  } // namespace core
} // namespace carpark
