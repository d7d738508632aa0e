#pragma once
/** @file  FakeInputSource.hpp
 *  @brief InputSource driven by the test: `press()` emits on the caller's thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "io/InputSource.hpp"

namespace carpark {
  namespace test {

    class FakeInputSource : public carpark::io::InputSource {
    public:
      bool started = false;

      void start() override { started = true; }
      void stop() override { started = false; }

      void press(carpark::core::InputEvent e) { emit(e); }
    };

  } // namespace test
} // namespace carpark
