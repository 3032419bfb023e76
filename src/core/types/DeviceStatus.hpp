/**
 * @file DeviceStatus.hpp
 * @brief Polled device state: facts, interfaces, health and composite status.
 *
 * All structures here are produced fresh by a protocol monitor on every poll.
 * Optional fields mean "not available from this protocol", never zero.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief Operational or administrative state of an interface.
 */
enum class InterfaceStatus : int {
    Up = 0,
    Down = 1,
    AdminDown = 2,
    Testing = 3,
    Unknown = 4
};

/**
 * @brief One network interface as reported by a device.
 */
struct InterfaceInfo {
    std::string name;                                 ///< Interface name (ifDescr or API name)
    std::string description;                          ///< Free-form description
    InterfaceStatus status{InterfaceStatus::Unknown}; ///< Operational status
    InterfaceStatus adminStatus{InterfaceStatus::Unknown}; ///< Administrative status
    std::optional<int64_t> speedMbps;                 ///< Link speed in Mbit/s
    std::optional<int64_t> mtu;                       ///< Maximum transmission unit
    std::optional<std::string> macAddress;            ///< MAC address (aa:bb:cc:dd:ee:ff)
    std::set<std::string> ipAddresses;                ///< Assigned IP addresses
    std::optional<uint64_t> inOctets;                 ///< Received octets counter
    std::optional<uint64_t> outOctets;                ///< Transmitted octets counter
    std::optional<uint64_t> inErrors;                 ///< Receive error counter
    std::optional<uint64_t> outErrors;                ///< Transmit error counter
    std::optional<int64_t> lastChangeSeconds;         ///< Last state change, seconds since boot

    bool operator==(const InterfaceInfo& other) const = default;
};

/**
 * @brief Resource utilization of a device.
 */
struct DeviceHealth {
    std::optional<double> cpuPercent;             ///< CPU utilization (0-100)
    std::optional<double> memoryPercent;          ///< Memory utilization (0-100)
    std::optional<int64_t> memoryTotalMb;         ///< Total memory in MB
    std::optional<int64_t> memoryUsedMb;          ///< Used memory in MB
    std::optional<double> temperatureCelsius;     ///< Chassis temperature
    std::optional<int64_t> uptimeSeconds;         ///< Time since boot
    std::optional<std::vector<double>> loadAverage; ///< 1/5/15 minute load averages
    std::optional<std::map<std::string, double>> diskUsagePercent; ///< Mount point -> usage

    bool operator==(const DeviceHealth& other) const = default;
};

/**
 * @brief Identity facts of a device.
 */
struct DeviceInfo {
    std::string description{"Unknown"}; ///< System description
    std::string name{"Unknown"};        ///< System name
    std::optional<int64_t> uptimeSeconds; ///< Time since boot
    std::string location{"Unknown"};    ///< Physical location
    std::string contact{"Unknown"};     ///< Administrative contact
    std::string objectId;               ///< Vendor object identifier, if known

    bool operator==(const DeviceInfo& other) const = default;
};

/**
 * @brief Composite status of a device.
 *
 * If @c reachable is false, @c health and @c interfaces are absent and
 * @c errorMessage is set. A reachable device whose health or interface
 * query failed keeps @c reachable true, lacks the failed section and carries
 * a description of the failure in @c errorMessage.
 */
struct DeviceStatus {
    std::string deviceId;                             ///< Device the status belongs to
    bool reachable{false};                            ///< Whether the device answered
    std::optional<double> responseTimeMs;             ///< Round-trip time of the probe
    std::chrono::system_clock::time_point lastSeen;   ///< When the status was collected
    std::optional<std::string> errorMessage;          ///< Set iff unreachable or degraded
    std::optional<DeviceHealth> health;               ///< Health metrics, if collected
    std::optional<std::vector<InterfaceInfo>> interfaces; ///< Interfaces, if collected
    std::optional<int64_t> uptimeSeconds;             ///< Uptime from the health query

    /**
     * @brief Builds an unreachable status.
     * @param deviceId Device identifier.
     * @param message Reason; an empty message is replaced by "Device unreachable".
     * @return Status with reachable=false and the error set.
     */
    static DeviceStatus unreachable(const std::string& deviceId, const std::string& message);

    bool operator==(const DeviceStatus& other) const = default;
};

/**
 * @brief Result of an out-of-band reachability check.
 */
struct PingCheck {
    bool success{false};                  ///< Whether the device answered
    std::optional<double> responseTimeMs; ///< Round-trip time
    std::string output;                   ///< Human-readable diagnostic text
};

/**
 * @brief Converts an interface status to its wire string.
 * @param status The status.
 * @return "up", "down", "admin_down", "testing" or "unknown".
 */
std::string interfaceStatusToString(InterfaceStatus status);

/**
 * @brief Parses an interface status string.
 *
 * Accepts the synonyms used by device APIs (active/enabled/true/1 for up,
 * inactive/disabled/false/0 for down, shutdown/admin-down for admin_down).
 *
 * @param str Status text, case-insensitive.
 * @return The matching status, or InterfaceStatus::Unknown.
 */
InterfaceStatus interfaceStatusFromString(const std::string& str);

/**
 * @brief Maps an IF-MIB ifOperStatus/ifAdminStatus code.
 * @param code 1 up, 2 down, 3 testing.
 * @return The matching status, or InterfaceStatus::Unknown for other codes.
 */
InterfaceStatus interfaceStatusFromSnmp(int64_t code);

} // namespace netsentry::core
