#pragma once
/** @file  InputEvent.hpp
 *  @brief Manual occupancy-change intents emitted by input devices.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>

namespace carpark::core {

  /** One vehicle entering or leaving. Carries no payload. */
  enum class InputEvent : std::uint8_t { Enter, Exit };

  inline const char* toString(InputEvent e) {
    switch (e) {
    case InputEvent::Enter:
      return "Enter";
    case InputEvent::Exit:
      return "Exit";
    default:
      return "Unknown";
    }
  }

} // namespace carpark::core
