/* @file StatusFormat.cpp
 * @brief status text + nlohmann::json payload codec
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Carpark headers
#include "core/StatusFormat.hpp"
#include "core/TimeFormat.hpp"

namespace carpark::core {

  namespace {
    constexpr const char* kMissing = "--";
    constexpr const char* kSeparator = " | ";

    std::string formatTemperature(const std::optional<double>& celsius) {
      if (!celsius)
        return kMissing;
      std::ostringstream os;
      os << std::fixed << std::setprecision(1) << *celsius << "°C";
      return os.str();
    }
  } // namespace

  std::vector<StatusField> statusFields(const StatusSnapshot& snap) {
    return {
      { "Available bays", std::to_string(snap.available()) },
      { "Temperature", formatTemperature(snap.temperature) },
      { "At", toClockTime(snap.timestamp) },
    };
  }

  std::string formatStatus(const StatusSnapshot& snap) {
    std::string out = snap.location;
    for (const auto& [label, value] : statusFields(snap))
      out += kSeparator + label + ": " + value;
    return out;
  }

  std::string toPayload(const StatusSnapshot& snap) {
    nlohmann::json j;
    j["location"] = snap.location;
    j["capacity"] = snap.capacity;
    j["occupied"] = snap.occupied;
    j["available"] = snap.available();
    j["temperature"] = snap.temperature ? nlohmann::json(*snap.temperature) : nlohmann::json(nullptr);
    j["timestamp"] = toIso8601(snap.timestamp);
    j["status"] = formatStatus(snap);
    return j.dump();
  }

  std::optional<StatusSnapshot> fromPayload(const std::string& payload) {
    const auto j = nlohmann::json::parse(payload, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
      return std::nullopt;

    const auto location = j.find("location");
    const auto capacity = j.find("capacity");
    const auto available = j.find("available");
    const auto timestamp = j.find("timestamp");
    if (location == j.end() || !location->is_string() || capacity == j.end() ||
        !capacity->is_number_integer() || available == j.end() ||
        !available->is_number_integer() || timestamp == j.end() || !timestamp->is_string())
      return std::nullopt;

    // range-check at full width before narrowing
    const auto cap = capacity->get<std::int64_t>();
    const auto avail = available->get<std::int64_t>();
    if (cap <= 0 || cap > std::numeric_limits<int>::max() || avail < 0 || avail > cap)
      return std::nullopt;

    auto when = fromIso8601(timestamp->get<std::string>());
    if (!when)
      return std::nullopt;

    StatusSnapshot snap;
    snap.location = location->get<std::string>();
    snap.capacity = static_cast<int>(cap);
    snap.occupied = static_cast<int>(cap - avail);
    snap.timestamp = *when;

    if (auto temp = j.find("temperature"); temp != j.end() && !temp->is_null()) {
      if (!temp->is_number())
        return std::nullopt;
      snap.temperature = temp->get<double>();
    }
    return snap;
  }

  std::string defaultTopic(const std::string& location) {
    std::string topic = "carpark/";
    for (char c : location) {
      // '+' and '#' are subscription wildcards and may not appear in a published topic
      const bool reserved = c == '+' || c == '#' || std::isspace(static_cast<unsigned char>(c));
      topic += reserved ? '_' : c;
    }
    return topic;
  }

} // namespace carpark::core
