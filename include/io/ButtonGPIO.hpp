#pragma once
/** @file ButtonGPIO.hpp
 *brief Debounced push-button press classifier with short/long-press detection
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/GPIOInput.hpp" // Edge type

#include <chrono>
#include <optional>

namespace carpark {
  namespace io {

    /**
	 * @class ButtonGPIO
	 * @brief Turns the Rising/Falling edges of one button line into press events.
	 *
	 *  * Holds shorter than the debounce window are contact bounce and are ignored.
	 *  * Emits `ShortPress` for a hold ≥ debounce but < long threshold.
	 *  * Emits `LongPress`  for a hold ≥ long threshold.
	 *  * Pure state machine: fed by the owner, no I/O of its own.
	 */

    class ButtonGPIO {

    public:
      enum class Event { ShortPress, LongPress };

      explicit ButtonGPIO(std::chrono::milliseconds debounce = std::chrono::milliseconds{ 50 },
                          std::chrono::milliseconds longPressThresh = std::chrono::seconds{ 1 })
          : debounce_{ debounce }, longThreshold_{ longPressThresh } {}

      /** Feed one edge; returns a press once the button is released. */
      std::optional<Event> onEdge(GPIOInput::Edge edge, std::chrono::milliseconds at);

    private:
      std::chrono::milliseconds debounce_{ 50 };
      std::chrono::milliseconds longThreshold_{ 1000 };
      bool pressed_{ false };
      std::chrono::milliseconds pressTick_{ 0 };
    };

  } // namespace io
} // namespace carpark
