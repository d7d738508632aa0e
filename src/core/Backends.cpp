/* @file Backends.cpp
 * @brief registers the shipped devices under their config names
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// Carpark headers
#include "core/Backends.hpp"
#include "core/Logger.hpp"
#include "io/ButtonInputSource.hpp"
#include "io/ConsoleSink.hpp"
#include "io/FileSink.hpp"
#include "io/LineInputSource.hpp"

namespace carpark::core {

  InputRegistry makeInputRegistry() {
    InputRegistry reg;
    reg.registerBackend("console", [](const CarparkConfig&, std::shared_ptr<Logger> logger) {
      return std::unique_ptr<io::InputSource>(io::LineInputSource::console(std::move(logger)));
    });
    reg.registerBackend("serial", [](const CarparkConfig& cfg, std::shared_ptr<Logger> logger) {
      return std::unique_ptr<io::InputSource>(
          io::LineInputSource::serial(cfg.input.device, cfg.input.baud, std::move(logger)));
    });
    reg.registerBackend("gpio", [](const CarparkConfig& cfg, std::shared_ptr<Logger> logger) {
      return std::unique_ptr<io::InputSource>(std::make_unique<io::ButtonInputSource>(
          cfg.input.device, cfg.input.enterLine, cfg.input.exitLine, cfg.input.activeLow,
          std::move(logger)));
    });
    return reg;
  }

  OutputRegistry makeOutputRegistry() {
    OutputRegistry reg;
    reg.registerBackend("console", [](const CarparkConfig&) {
      return std::unique_ptr<io::OutputSink>(
          std::make_unique<io::ConsoleSink>(io::ConsoleSink::Style::Plain));
    });
    reg.registerBackend("accessible", [](const CarparkConfig&) {
      return std::unique_ptr<io::OutputSink>(
          std::make_unique<io::ConsoleSink>(io::ConsoleSink::Style::Accessible));
    });
    reg.registerBackend("file", [](const CarparkConfig& cfg) {
      return std::unique_ptr<io::OutputSink>(std::make_unique<io::FileSink>(cfg.output.path));
    });
    return reg;
  }

} // namespace carpark::core
