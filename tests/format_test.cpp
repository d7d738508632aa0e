// Carpark headers
#include "core/StatusFormat.hpp"
#include "core/TimeFormat.hpp"
#include "io/ConsoleSink.hpp"

// 3rd-party headers
#include <nlohmann/json.hpp>

// GTest headers
#include <gtest/gtest.h>

namespace carpark::test {

  using carpark::core::StatusSnapshot;
  using namespace std::chrono_literals;

  namespace {
    // 2023-11-14T22:13:20Z
    const auto kWhen = std::chrono::system_clock::time_point{ 1'700'000'000s };

    StatusSnapshot moondalup(std::optional<double> temperature = std::nullopt) {
      StatusSnapshot s;
      s.location = "Moondalup";
      s.capacity = 192;
      s.occupied = 150;
      s.temperature = temperature;
      s.timestamp = kWhen;
      return s;
    }
  } // namespace

  TEST(TimeFormatTest, RendersUtc) {
    EXPECT_EQ(core::toIso8601(kWhen), "2023-11-14T22:13:20Z");
    EXPECT_EQ(core::toIso8601(kWhen + 45ms, true), "2023-11-14T22:13:20.045Z");
    EXPECT_EQ(core::toClockTime(kWhen), "22:13:20");
  }

  TEST(TimeFormatTest, ParsesOwnOutputAndRejectsJunk) {
    EXPECT_EQ(core::fromIso8601("2023-11-14T22:13:20Z"), kWhen);
    EXPECT_EQ(core::fromIso8601("2023-11-14T22:13:20.999Z"), kWhen);
    EXPECT_FALSE(core::fromIso8601(""));
    EXPECT_FALSE(core::fromIso8601("2023-11-14 22:13:20"));
    EXPECT_FALSE(core::fromIso8601("2023-11-14T22:13:20"));
    EXPECT_FALSE(core::fromIso8601("2023-13-14T22:13:20Z"));
    EXPECT_FALSE(core::fromIso8601("2023-11-14T25:13:20Z"));
    EXPECT_FALSE(core::fromIso8601("2023-11-14T22:13:20Zjunk"));
  }

  TEST(StatusFormatTest, FieldsInDisplayOrder) {
    auto fields = core::statusFields(moondalup(21.54));
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields[0], (core::StatusField{ "Available bays", "42" }));
    EXPECT_EQ(fields[1], (core::StatusField{ "Temperature", "21.5°C" }));
    EXPECT_EQ(fields[2], (core::StatusField{ "At", "22:13:20" }));
  }

  TEST(StatusFormatTest, FormatsWithAndWithoutTemperature) {
    EXPECT_EQ(core::formatStatus(moondalup(21.5)),
              "Moondalup | Available bays: 42 | Temperature: 21.5°C | At: 22:13:20");
    EXPECT_EQ(core::formatStatus(moondalup()),
              "Moondalup | Available bays: 42 | Temperature: -- | At: 22:13:20");
  }

  TEST(StatusFormatTest, PayloadCarriesStructuredFieldsAndStatusLine) {
    const auto snap = moondalup(-3.25);
    const auto j = nlohmann::json::parse(core::toPayload(snap));

    EXPECT_EQ(j.at("location"), "Moondalup");
    EXPECT_EQ(j.at("capacity"), 192);
    EXPECT_EQ(j.at("occupied"), 150);
    EXPECT_EQ(j.at("available"), 42);
    EXPECT_DOUBLE_EQ(j.at("temperature").get<double>(), -3.25);
    EXPECT_EQ(j.at("timestamp"), "2023-11-14T22:13:20Z");
    EXPECT_EQ(j.at("status"), core::formatStatus(snap));

    EXPECT_TRUE(nlohmann::json::parse(core::toPayload(moondalup())).at("temperature").is_null());
  }

  TEST(StatusFormatTest, PayloadParsesBack) {
    auto back = core::fromPayload(core::toPayload(moondalup(18.0)));
    ASSERT_TRUE(back);
    EXPECT_EQ(*back, moondalup(18.0));

    back = core::fromPayload(core::toPayload(moondalup()));
    ASSERT_TRUE(back);
    EXPECT_FALSE(back->temperature);
  }

  TEST(StatusFormatTest, MalformedPayloadsAreRejected) {
    const char* bad[] = {
      "",
      "not json",
      "[1,2,3]",
      R"({"capacity":10,"available":3,"timestamp":"2023-11-14T22:13:20Z"})",
      R"({"location":"L","capacity":"10","available":3,"timestamp":"2023-11-14T22:13:20Z"})",
      R"({"location":"L","capacity":10,"available":11,"timestamp":"2023-11-14T22:13:20Z"})",
      R"({"location":"L","capacity":10,"available":-1,"timestamp":"2023-11-14T22:13:20Z"})",
      R"({"location":"L","capacity":0,"available":0,"timestamp":"2023-11-14T22:13:20Z"})",
      R"({"location":"L","capacity":10,"available":3,"timestamp":"yesterday"})",
      R"({"location":"L","capacity":10,"available":3,"timestamp":"2023-11-14T22:13:20Z","temperature":"warm"})",
      // would narrow to capacity 10 / available 3 as int
      R"({"location":"L","capacity":4294967306,"available":3,"timestamp":"2023-11-14T22:13:20Z"})",
      R"({"location":"L","capacity":10,"available":4294967299,"timestamp":"2023-11-14T22:13:20Z"})",
    };
    for (const char* payload : bad)
      EXPECT_FALSE(core::fromPayload(payload)) << payload;
  }

  TEST(StatusFormatTest, DefaultTopicReplacesWhitespace) {
    EXPECT_EQ(core::defaultTopic("Moondalup"), "carpark/Moondalup");
    EXPECT_EQ(core::defaultTopic("Joondalup Station\tWest"), "carpark/Joondalup_Station_West");
  }

  TEST(StatusFormatTest, DefaultTopicNeverContainsWildcards) {
    EXPECT_EQ(core::defaultTopic("Level 2+3"), "carpark/Level_2_3");
    EXPECT_EQ(core::defaultTopic("Bay #4"), "carpark/Bay__4");
    EXPECT_EQ(core::defaultTopic("Lot+#").find_first_of("+#"), std::string::npos);
  }

  TEST(AccessibleSentenceTest, RewritesSeparatorsAndUnits) {
    EXPECT_EQ(io::toAccessibleSentence(core::formatStatus(moondalup(21.5))),
              "Moondalup. Available bays: 42. Temperature: 21.5 degrees. At: 22:13:20.");
    EXPECT_EQ(io::toAccessibleSentence(core::formatStatus(moondalup())),
              "Moondalup. Available bays: 42. Temperature: not available. At: 22:13:20.");
  }

} // namespace carpark::test
