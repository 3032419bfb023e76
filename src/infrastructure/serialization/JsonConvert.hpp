/**
 * @file JsonConvert.hpp
 * @brief nlohmann::json conversions for domain types.
 *
 * The functions live in netsentry::core so nlohmann's ADL lookup finds them;
 * `nlohmann::json j = job;` and `j.get<core::ScanJob>()` both work once this
 * header is included. Time points are rendered as ISO 8601 UTC strings with
 * millisecond precision.
 */

#pragma once

#include "core/types/DeviceRecord.hpp"
#include "core/types/DeviceStatus.hpp"
#include "core/types/ScanJob.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace netsentry::core {

/**
 * @brief Formats a time point as "YYYY-MM-DDTHH:MM:SS.mmmZ".
 */
std::string formatTimestamp(std::chrono::system_clock::time_point time);

/**
 * @brief Parses a timestamp written by formatTimestamp().
 * @param text Timestamp text; the fractional part and the "Z" are optional.
 * @return The time point, or std::nullopt for malformed text.
 */
std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text);

/**
 * @brief Milliseconds since the Unix epoch.
 */
int64_t toEpochMillis(std::chrono::system_clock::time_point time);

/**
 * @brief Inverse of toEpochMillis().
 */
std::chrono::system_clock::time_point fromEpochMillis(int64_t millis);

void to_json(nlohmann::json& j, const DiscoveredDevice& device);
void from_json(const nlohmann::json& j, DiscoveredDevice& device);

/**
 * @brief Serializes every ScanJob field (the persisted payload).
 */
void to_json(nlohmann::json& j, const ScanJob& job);

/**
 * @brief Restores a ScanJob.
 * @throws nlohmann::json::exception on missing mandatory fields.
 * @throws std::invalid_argument on unknown scan type or status.
 */
void from_json(const nlohmann::json& j, ScanJob& job);

void to_json(nlohmann::json& j, const InterfaceInfo& iface);
void to_json(nlohmann::json& j, const DeviceHealth& health);
void to_json(nlohmann::json& j, const DeviceInfo& info);
void to_json(nlohmann::json& j, const DeviceStatus& status);
void to_json(nlohmann::json& j, const PingCheck& check);

/**
 * @brief Serializes the credential block in device-file layout.
 *
 * Secrets are written as given; call Credentials::maskedCopy() first when
 * the output leaves the process.
 */
void to_json(nlohmann::json& j, const Credentials& credentials);

/**
 * @brief Serializes a device in device-file layout.
 */
void to_json(nlohmann::json& j, const DeviceRecord& device);

} // namespace netsentry::core
