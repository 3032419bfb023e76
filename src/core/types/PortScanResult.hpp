/**
 * @file PortScanResult.hpp
 * @brief TCP port probe types.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief Possible states of a probed port.
 */
enum class PortState : int {
    Open = 1,     ///< Port accepted the connection
    Closed = 2,   ///< Connection was refused or failed
    Filtered = 3  ///< No answer before the timeout
};

/**
 * @brief Result of probing a single (host, port) pair.
 */
struct PortProbeResult {
    std::string address;              ///< Address that was probed
    uint16_t port{0};                 ///< Port number
    PortState state{PortState::Closed}; ///< Observed state

    [[nodiscard]] bool isOpen() const { return state == PortState::Open; }

    bool operator==(const PortProbeResult& other) const = default;
};

/**
 * @brief A batch of TCP connect probes.
 */
struct PortScanRequest {
    std::vector<std::string> targets;        ///< Hosts to probe
    std::vector<uint16_t> ports;             ///< Ports to probe on every host
    std::chrono::milliseconds timeout{2000}; ///< Connect timeout per probe
    int maxConcurrency{50};                  ///< Maximum probes in flight
};

/**
 * @brief Converts a port state to a string.
 * @param state The port state to convert.
 * @return "open", "closed" or "filtered".
 */
inline std::string portStateToString(PortState state) {
    switch (state) {
    case PortState::Open:
        return "open";
    case PortState::Closed:
        return "closed";
    case PortState::Filtered:
        return "filtered";
    }
    return "closed";
}

} // namespace netsentry::core
