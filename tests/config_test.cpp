// Carpark headers
#include "core/Backends.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"
#include "io/FileSink.hpp"

// 3rd-party headers
#include <nlohmann/json.hpp>

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace carpark::test {

  using carpark::core::CarparkConfig;
  using carpark::core::ConfigurationError;
  using carpark::core::parseConfig;
  using nlohmann::json;
  using namespace std::chrono_literals;

  namespace {
    json minimal() { return json{ { "location", "Moondalup" }, { "capacity", 192 } }; }

    std::string tempPath(const std::string& stem) {
      return "/tmp/carpark_" + stem + "_" + std::to_string(::getpid());
    }
  } // namespace

  TEST(ParseConfigTest, MinimalConfigGetsDefaults) {
    const CarparkConfig cfg = parseConfig(minimal());

    EXPECT_EQ(cfg.location, "Moondalup");
    EXPECT_EQ(cfg.capacity, 192);
    EXPECT_EQ(cfg.initialOccupied, 0);
    EXPECT_EQ(cfg.broker.host, "localhost");
    EXPECT_EQ(cfg.broker.port, 1883);
    EXPECT_EQ(cfg.broker.clientId, "car_park_sensor");
    EXPECT_EQ(cfg.broker.keepAliveSeconds, 300);
    EXPECT_EQ(cfg.broker.topic, "carpark/Moondalup");
    EXPECT_EQ(cfg.fanout.attempts, 3);
    EXPECT_EQ(cfg.fanout.baseDelay, 200ms);
    EXPECT_EQ(cfg.fanout.maxDelay, 5000ms);
    EXPECT_EQ(cfg.fanout.publishTimeout, 3000ms);
    EXPECT_EQ(cfg.fanout.renderTimeout, 500ms);
    EXPECT_EQ(cfg.input.backend, "console");
    EXPECT_EQ(cfg.output.backend, "console");
    EXPECT_FALSE(cfg.telemetry.thermalZone);
    EXPECT_EQ(cfg.telemetry.interval, 10000ms);
    EXPECT_EQ(cfg.logPath, "carpark.csv");

    const auto publish = cfg.fanout.publishPolicy();
    EXPECT_EQ(publish.timeout, 3000ms);
    EXPECT_EQ(cfg.fanout.renderPolicy().timeout, 500ms);
  }

  TEST(ParseConfigTest, ReadsEverySection) {
    json j = minimal();
    j["initial_occupied"] = 10;
    j["broker"] = { { "host", "broker.local" }, { "port", 8883 }, { "client_id", "lot7" },
                    { "keep_alive_s", 60 }, { "topic", "lots/7" } };
    j["fanout"] = { { "attempts", 5 }, { "base_delay_ms", 50 }, { "max_delay_ms", 800 },
                    { "publish_timeout_ms", 1000 }, { "render_timeout_ms", 250 } };
    j["input"] = { { "backend", "gpio" }, { "device", "/dev/gpiochip0" }, { "enter_line", 17 },
                   { "exit_line", 27 }, { "active_low", false } };
    j["output"] = { { "backend", "file" }, { "path", "/run/carpark/status.txt" } };
    j["telemetry"] = { { "thermal_zone", "/sys/class/thermal/thermal_zone0/temp" },
                       { "interval_ms", 2000 } };
    j["log"] = { { "path", "/var/log/carpark.csv" } };

    const CarparkConfig cfg = parseConfig(j);
    EXPECT_EQ(cfg.initialOccupied, 10);
    EXPECT_EQ(cfg.broker.host, "broker.local");
    EXPECT_EQ(cfg.broker.port, 8883);
    EXPECT_EQ(cfg.broker.clientId, "lot7");
    EXPECT_EQ(cfg.broker.keepAliveSeconds, 60);
    EXPECT_EQ(cfg.broker.topic, "lots/7");
    EXPECT_EQ(cfg.fanout.attempts, 5);
    EXPECT_EQ(cfg.fanout.publishPolicy().backoff(2), 100ms);
    EXPECT_EQ(cfg.input.backend, "gpio");
    EXPECT_EQ(cfg.input.enterLine, 17u);
    EXPECT_EQ(cfg.input.exitLine, 27u);
    EXPECT_FALSE(cfg.input.activeLow);
    EXPECT_EQ(cfg.output.path, "/run/carpark/status.txt");
    ASSERT_TRUE(cfg.telemetry.thermalZone);
    EXPECT_EQ(*cfg.telemetry.thermalZone, "/sys/class/thermal/thermal_zone0/temp");
    EXPECT_EQ(cfg.telemetry.interval, 2000ms);
    EXPECT_EQ(cfg.logPath, "/var/log/carpark.csv");
  }

  TEST(ParseConfigTest, ViolationsNameTheOffendingKey) {
    auto expectError = [](const json& j, const std::string& fragment) {
      try {
        parseConfig(j);
        ADD_FAILURE() << "accepted: " << j.dump();
      } catch (const ConfigurationError& e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr(fragment)) << j.dump();
      }
    };

    expectError(json::array(), "top level");
    expectError(json{ { "capacity", 5 } }, "location");
    expectError(json{ { "location", "" }, { "capacity", 5 } }, "location");
    expectError(json{ { "location", "L" } }, "capacity");
    expectError(json{ { "location", "L" }, { "capacity", 0 } }, "capacity");
    expectError(json{ { "location", "L" }, { "capacity", "ten" } }, "capacity");

    json j = minimal();
    j["initial_occupied"] = 193;
    expectError(j, "initial_occupied");

    j = minimal();
    j["broker"] = { { "port", 70000 } };
    expectError(j, "broker.port");

    j = minimal();
    j["broker"] = { { "topic", "carpark/#" } };
    expectError(j, "wildcards");

    j = minimal();
    j["broker"] = "localhost";
    expectError(j, "'broker' must be an object");

    j = minimal();
    j["fanout"] = { { "attempts", 0 } };
    expectError(j, "fanout.attempts");

    j = minimal();
    j["fanout"] = { { "base_delay_ms", 1000 }, { "max_delay_ms", 10 } };
    expectError(j, "max_delay_ms");

    j = minimal();
    j["input"] = { { "backend", "serial" } };
    expectError(j, "input.device");

    j = minimal();
    j["input"] = { { "backend", "gpio" }, { "device", "/dev/gpiochip0" }, { "enter_line", 3 },
                   { "exit_line", 3 } };
    expectError(j, "must differ");

    j = minimal();
    j["input"] = { { "active_low", "yes" } };
    expectError(j, "input.active_low");

    j = minimal();
    j["output"] = { { "backend", "file" } };
    expectError(j, "output.path");
  }

  TEST(ConfigLoaderTest, ReadsFileWithComments) {
    const std::string path = tempPath("config.json");
    {
      std::ofstream out(path);
      out << "{\n  // lot name\n  \"location\": \"Moondalup\",\n  \"capacity\": 3\n}\n";
    }
    const CarparkConfig cfg = core::ConfigLoader(path).loadConfig();
    EXPECT_EQ(cfg.location, "Moondalup");
    EXPECT_EQ(cfg.capacity, 3);
    std::remove(path.c_str());
  }

  TEST(ConfigLoaderTest, MissingOrMalformedFileIsConfigurationError) {
    EXPECT_THROW(core::ConfigLoader("/nonexistent/carpark.json").load(), ConfigurationError);

    const std::string path = tempPath("broken.json");
    {
      std::ofstream out(path);
      out << "{ \"location\": ";
    }
    EXPECT_THROW(core::ConfigLoader(path).load(), ConfigurationError);
    std::remove(path.c_str());
  }

  TEST(BackendsTest, RegistriesKnowTheShippedBackends) {
    EXPECT_EQ(core::makeInputRegistry().names(),
              (std::vector<std::string>{ "console", "gpio", "serial" }));
    EXPECT_EQ(core::makeOutputRegistry().names(),
              (std::vector<std::string>{ "accessible", "console", "file" }));
  }

  TEST(BackendsTest, CreatesOutputsByNameAndRejectsUnknown) {
    json j = minimal();
    j["output"] = { { "backend", "file" }, { "path", "/tmp/carpark_status.txt" } };
    const CarparkConfig cfg = parseConfig(j);

    auto registry = core::makeOutputRegistry();
    auto sink = registry.create("file", cfg);
    auto* file = dynamic_cast<io::FileSink*>(sink.get());
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->path(), "/tmp/carpark_status.txt");

    EXPECT_NE(registry.create("accessible", cfg), nullptr);
    EXPECT_THROW(registry.create("led-matrix", cfg), std::out_of_range);

    auto logger = std::make_shared<core::Logger>();
    EXPECT_THROW(core::makeInputRegistry().create("joystick", cfg, logger), std::out_of_range);
  }

} // namespace carpark::test
