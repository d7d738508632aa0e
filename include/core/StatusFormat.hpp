#pragma once
/** @file  StatusFormat.hpp
 *  @brief Pure snapshot → text / JSON conversions shared by every sink and the publisher.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/StatusSnapshot.hpp"

namespace carpark::core {

  using StatusField = std::pair<std::string, std::string>; ///< label, value

  /// Ordered display fields: "Available bays", "Temperature", "At".
  std::vector<StatusField> statusFields(const StatusSnapshot& snap);

  /// "Moondalup | Available bays: 42 | Temperature: 21.5°C | At: 10:32:05"
  std::string formatStatus(const StatusSnapshot& snap);

  /**
   * JSON broadcast payload. Carries the structured fields plus `status`,
   * which is exactly formatStatus(snap), so display and broadcast agree.
   */
  std::string toPayload(const StatusSnapshot& snap);

  /// Parse a payload produced by toPayload(); std::nullopt on any malformed input.
  std::optional<StatusSnapshot> fromPayload(const std::string& payload);

  /// "carpark/<location>" with whitespace and the wildcards '+' and '#' replaced by '_'.
  std::string defaultTopic(const std::string& location);

} // namespace carpark::core
