#pragma once
/** @file  Backends.hpp
 *  @brief The built-in input and output backends, keyed by their config names.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>

#include "core/BackendRegistry.hpp"
#include "core/Config.hpp"
#include "io/InputSource.hpp"
#include "io/OutputSink.hpp"

namespace carpark::core {

  class Logger;

  using InputRegistry = BackendRegistry<io::InputSource, const CarparkConfig&, std::shared_ptr<Logger>>;
  using OutputRegistry = BackendRegistry<io::OutputSink, const CarparkConfig&>;

  /// "console", "serial", "gpio"
  InputRegistry makeInputRegistry();

  /// "console", "accessible", "file"
  OutputRegistry makeOutputRegistry();

} // namespace carpark::core
