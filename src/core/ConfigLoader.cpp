/* @file ConfigLoader.cpp
 * @brief JSON config file → validated CarparkConfig
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <fstream>
#include <limits>
#include <utility>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Carpark headers
#include "core/ConfigLoader.hpp"
#include "core/StatusFormat.hpp"

namespace carpark::core {

  using nlohmann::json;

  namespace {

    std::string keyPath(const std::string& section, const char* key) {
      return section.empty() ? std::string(key) : section + "." + key;
    }

    const json* find(const json& obj, const char* key) {
      auto it = obj.find(key);
      return it == obj.end() ? nullptr : &*it;
    }

    const json& section(const json& root, const char* key, const json& empty) {
      const json* sub = find(root, key);
      if (!sub)
        return empty;
      if (!sub->is_object())
        throw ConfigurationError(std::string("[ConfigLoader] '") + key + "' must be an object");
      return *sub;
    }

    std::string getString(const json& obj, const std::string& sec, const char* key,
                          std::optional<std::string> fallback) {
      const json* v = find(obj, key);
      if (!v) {
        if (!fallback)
          throw ConfigurationError("[ConfigLoader] missing required key '" + keyPath(sec, key) + "'");
        return *fallback;
      }
      if (!v->is_string())
        throw ConfigurationError("[ConfigLoader] '" + keyPath(sec, key) + "' must be a string");
      return v->get<std::string>();
    }

    std::int64_t getInt(const json& obj, const std::string& sec, const char* key,
                        std::optional<std::int64_t> fallback, std::int64_t min,
                        std::int64_t max = std::numeric_limits<std::int32_t>::max()) {
      const json* v = find(obj, key);
      if (!v) {
        if (!fallback)
          throw ConfigurationError("[ConfigLoader] missing required key '" + keyPath(sec, key) + "'");
        return *fallback;
      }
      if (!v->is_number_integer())
        throw ConfigurationError("[ConfigLoader] '" + keyPath(sec, key) + "' must be an integer");
      const auto value = v->get<std::int64_t>();
      if (value < min || value > max)
        throw ConfigurationError("[ConfigLoader] '" + keyPath(sec, key) + "' out of range [" +
                                 std::to_string(min) + ", " + std::to_string(max) + "]");
      return value;
    }

    bool getBool(const json& obj, const std::string& sec, const char* key, bool fallback) {
      const json* v = find(obj, key);
      if (!v)
        return fallback;
      if (!v->is_boolean())
        throw ConfigurationError("[ConfigLoader] '" + keyPath(sec, key) + "' must be a boolean");
      return v->get<bool>();
    }

    std::chrono::milliseconds getMillis(const json& obj, const std::string& sec, const char* key,
                                        std::chrono::milliseconds fallback, std::int64_t min) {
      return std::chrono::milliseconds{ getInt(obj, sec, key, fallback.count(), min) };
    }

  } // namespace

  ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

  json ConfigLoader::load() const {
    std::ifstream in(path_);
    if (!in)
      throw ConfigurationError("[ConfigLoader] cannot open config file: " + path_);

    json j = json::parse(in, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (j.is_discarded())
      throw ConfigurationError("[ConfigLoader] malformed JSON in " + path_);
    return j;
  }

  CarparkConfig ConfigLoader::loadConfig() const { return parseConfig(load()); }

  CarparkConfig parseConfig(const json& j) {
    if (!j.is_object())
      throw ConfigurationError("[ConfigLoader] top level must be an object");

    const json empty = json::object();
    CarparkConfig cfg;

    cfg.location = getString(j, "", "location", std::nullopt);
    if (cfg.location.empty())
      throw ConfigurationError("[ConfigLoader] 'location' must not be empty");
    cfg.capacity = static_cast<int>(getInt(j, "", "capacity", std::nullopt, 1));
    cfg.initialOccupied =
        static_cast<int>(getInt(j, "", "initial_occupied", 0, 0, cfg.capacity));

    // ---- broker ----
    const json& broker = section(j, "broker", empty);
    cfg.broker.host = getString(broker, "broker", "host", cfg.broker.host);
    cfg.broker.port = static_cast<std::uint16_t>(getInt(broker, "broker", "port", 1883, 1, 65535));
    cfg.broker.clientId = getString(broker, "broker", "client_id", cfg.broker.clientId);
    cfg.broker.keepAliveSeconds =
        static_cast<std::uint16_t>(getInt(broker, "broker", "keep_alive_s", 300, 0, 65535));
    cfg.broker.topic = getString(broker, "broker", "topic", defaultTopic(cfg.location));
    if (cfg.broker.host.empty() || cfg.broker.clientId.empty() || cfg.broker.topic.empty())
      throw ConfigurationError("[ConfigLoader] 'broker' host, client_id and topic must not be empty");
    if (cfg.broker.topic.find_first_of("+#") != std::string::npos)
      throw ConfigurationError("[ConfigLoader] 'broker.topic' must not contain wildcards");

    // ---- fanout ----
    const json& fanout = section(j, "fanout", empty);
    cfg.fanout.attempts = static_cast<int>(getInt(fanout, "fanout", "attempts", 3, 1, 100));
    cfg.fanout.baseDelay = getMillis(fanout, "fanout", "base_delay_ms", cfg.fanout.baseDelay, 0);
    cfg.fanout.maxDelay = getMillis(fanout, "fanout", "max_delay_ms", cfg.fanout.maxDelay, 0);
    cfg.fanout.publishTimeout =
        getMillis(fanout, "fanout", "publish_timeout_ms", cfg.fanout.publishTimeout, 1);
    cfg.fanout.renderTimeout =
        getMillis(fanout, "fanout", "render_timeout_ms", cfg.fanout.renderTimeout, 1);
    if (cfg.fanout.maxDelay < cfg.fanout.baseDelay)
      throw ConfigurationError("[ConfigLoader] 'fanout.max_delay_ms' is below 'base_delay_ms'");

    // ---- input ----
    const json& input = section(j, "input", empty);
    cfg.input.backend = getString(input, "input", "backend", cfg.input.backend);
    cfg.input.device = getString(input, "input", "device", "");
    cfg.input.baud = static_cast<int>(getInt(input, "input", "baud", 115200, 1));
    cfg.input.enterLine = static_cast<unsigned int>(getInt(input, "input", "enter_line", 0, 0));
    cfg.input.exitLine = static_cast<unsigned int>(getInt(input, "input", "exit_line", 1, 0));
    cfg.input.activeLow = getBool(input, "input", "active_low", true);
    if ((cfg.input.backend == "serial" || cfg.input.backend == "gpio") && cfg.input.device.empty())
      throw ConfigurationError("[ConfigLoader] 'input.device' is required for the " +
                               cfg.input.backend + " backend");
    if (cfg.input.backend == "gpio" && cfg.input.enterLine == cfg.input.exitLine)
      throw ConfigurationError("[ConfigLoader] 'input.enter_line' and 'exit_line' must differ");

    // ---- output ----
    const json& output = section(j, "output", empty);
    cfg.output.backend = getString(output, "output", "backend", cfg.output.backend);
    cfg.output.path = getString(output, "output", "path", "");
    if (cfg.output.backend == "file" && cfg.output.path.empty())
      throw ConfigurationError("[ConfigLoader] 'output.path' is required for the file backend");

    // ---- telemetry ----
    const json& telemetry = section(j, "telemetry", empty);
    if (find(telemetry, "thermal_zone"))
      cfg.telemetry.thermalZone = getString(telemetry, "telemetry", "thermal_zone", std::nullopt);
    cfg.telemetry.interval =
        getMillis(telemetry, "telemetry", "interval_ms", cfg.telemetry.interval, 100);

    // ---- log ----
    const json& log = section(j, "log", empty);
    cfg.logPath = getString(log, "log", "path", cfg.logPath);

    return cfg;
  }

} // namespace carpark::core
