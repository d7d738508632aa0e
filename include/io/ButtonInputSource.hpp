#pragma once
/** @file  ButtonInputSource.hpp
 *  @brief Two physical push buttons (one per intent) on a GPIO chip.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "io/ButtonGPIO.hpp"
#include "io/GPIOInput.hpp"
#include "io/InputSource.hpp"

namespace carpark {
  namespace core {
    class Logger;
  } // namespace core

  namespace io {

    /**
 * @class ButtonInputSource
 * @brief Polls both button lines on one thread; any debounced press emits its intent.
 *
 *  Long presses count as a single press.
 */
    class ButtonInputSource : public InputSource {
    public:
      ButtonInputSource(std::string chip, unsigned int enterLine, unsigned int exitLine,
                        bool activeLow, std::shared_ptr<core::Logger> logger);
      ~ButtonInputSource() override; ///< stop()

      void start() override;
      void stop() override;

    private:
      void watchLoop();
      void drain(GPIOInput& line, ButtonGPIO& button, core::InputEvent intent);

      static constexpr int kPollMs = 100;

      std::string chip_;
      unsigned int enterLine_;
      unsigned int exitLine_;
      bool activeLow_;
      std::shared_ptr<core::Logger> logger_;

      GPIOInput enterInput_;
      GPIOInput exitInput_;
      ButtonGPIO enterButton_;
      ButtonGPIO exitButton_;

      std::atomic<bool> running_{ false };
      std::thread watcher_;
    };

  } // namespace io
} // namespace carpark
