#include "io/ButtonGPIO.hpp"

using namespace carpark::io;

std::optional<ButtonGPIO::Event> ButtonGPIO::onEdge(GPIOInput::Edge edge,
                                                    std::chrono::milliseconds at) {
  if (edge == GPIOInput::Edge::Rising) {
    // a second Rising without a Falling restarts the hold
    pressed_ = true;
    pressTick_ = at;
    return std::nullopt;
  }

  if (!pressed_)
    return std::nullopt; // release without a press (started held, or lost edge)
  pressed_ = false;

  const auto held = at - pressTick_;
  if (held < debounce_)
    return std::nullopt;
  return held >= longThreshold_ ? Event::LongPress : Event::ShortPress;
}
