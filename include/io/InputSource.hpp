#pragma once
/** @file  InputSource.hpp
 *  @brief Abstract producer of Enter / Exit intents (console, serial keypad, GPIO buttons).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>

#include "core/InputEvent.hpp"

namespace carpark {
  namespace io {

    /**
 * @class InputSource
 * @brief Owns one input device and the thread that watches it.
 *
 *  * Emits `InputEvent` callbacks from its own thread, in device order.
 *  * Duplicate presses are passed through; de-duplication is a device concern.
 *  * Register the callback before `start()`.
 */
    class InputSource {
    public:
      using Callback = std::function<void(core::InputEvent)>;

      InputSource() = default;
      virtual ~InputSource() = default;

      void registerCallback(Callback cb) { cb_ = std::move(cb); }

      /** Open the device and launch the watcher thread; throws std::runtime_error on failure. */
      virtual void start() = 0;

      /** Stop watching and join; idempotent. */
      virtual void stop() = 0;

      InputSource(const InputSource&) = delete;
      InputSource& operator=(const InputSource&) = delete;

    protected:
      /** Derived classes call this for every recognised intent. */
      void emit(core::InputEvent e) {
        if (cb_)
          cb_(e);
      }

      Callback cb_{};
    };

  } // namespace io
} // namespace carpark
