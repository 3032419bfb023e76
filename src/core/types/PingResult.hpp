/**
 * @file PingResult.hpp
 * @brief Result of a single reachability probe.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace netsentry::core {

/**
 * @brief Result of a single ICMP echo (or TCP fallback) probe.
 */
struct PingResult {
    std::string address;     ///< Address that was probed
    std::chrono::system_clock::time_point timestamp; ///< When the probe was sent
    std::chrono::microseconds latency{0}; ///< Round-trip time in microseconds
    bool success{false};     ///< Whether a reply was received
    std::optional<int> ttl;  ///< Time-to-live from the reply (ICMP only)
    std::string errorMessage; ///< Error message if the probe failed

    /**
     * @brief Converts the latency to milliseconds.
     * @return Latency as a floating-point number of milliseconds.
     */
    [[nodiscard]] double latencyMs() const {
        return static_cast<double>(latency.count()) / 1000.0;
    }

    bool operator==(const PingResult& other) const = default;
};

} // namespace netsentry::core
