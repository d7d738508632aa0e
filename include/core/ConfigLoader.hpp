#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from SD-card or host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/Config.hpp"

namespace carpark::core {

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to the caller.
 *
 *  * Every call to `load()` re-reads the file.
 *  * Schema validation lives in `parseConfig()`.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Path to the carpark JSON config.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `ConfigurationError`.
    nlohmann::json load() const;

    /// load() + parseConfig()
    CarparkConfig loadConfig() const;

  private:
    std::string path_;
  };

  /// Validate \p j and fill defaults; throws `ConfigurationError` naming the offending key.
  CarparkConfig parseConfig(const nlohmann::json& j);

} // namespace carpark::core
