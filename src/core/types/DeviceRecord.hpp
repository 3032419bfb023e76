/**
 * @file DeviceRecord.hpp
 * @brief Managed device definition, credentials and protocol selection.
 *
 * A DeviceRecord is produced by the device registry (configuration file or
 * promotion from a discovery scan) and read by the monitoring layer.
 */

#pragma once

#include "core/types/SnmpTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief Broad category of a network device.
 */
enum class DeviceType : int {
    Router = 0,
    Switch = 1,
    Firewall = 2,
    AccessPoint = 3,
    Server = 4,
    Generic = 5,
    Unknown = 6
};

/**
 * @brief Management protocols a device can be monitored with.
 */
enum class MonitorProtocol : int {
    Snmp = 0, ///< SNMP GET/WALK polling
    Rest = 1, ///< HTTP management API
    Ssh = 2   ///< SSH fact probing
};

/**
 * @brief Secrets and access parameters for a device.
 *
 * Never log these fields directly; use maskedCopy() or maskSecret().
 */
struct Credentials {
    std::string snmpCommunity{"public"};       ///< SNMP community string
    SnmpVersion snmpVersion{SnmpVersion::V2c}; ///< SNMP protocol version
    std::string username;                      ///< SSH / HTTP basic auth user
    std::string password;                      ///< SSH / HTTP basic auth password
    std::string sshKey;                        ///< Path to an SSH private key
    std::string apiToken;                      ///< Bearer token for REST APIs
    std::string apiKey;                        ///< X-API-Key value for REST APIs

    /**
     * @brief Returns a copy with every secret masked.
     * @return Credentials safe to echo back to a caller.
     */
    [[nodiscard]] Credentials maskedCopy() const;

    bool operator==(const Credentials& other) const = default;
};

/**
 * @brief A device under management.
 */
struct DeviceRecord {
    std::string id;                               ///< Unique, stable identifier
    std::string name;                             ///< Human-readable name
    std::string host;                             ///< IP address or hostname
    DeviceType deviceType{DeviceType::Generic};   ///< Device category
    Credentials credentials;                      ///< Access credentials
    std::vector<MonitorProtocol> enabledProtocols{MonitorProtocol::Snmp}; ///< Enabled protocols
    int timeoutSeconds{10};                       ///< Per-operation timeout
    int retryCount{3};                            ///< Attempts per monitor call (>= 1)
    uint16_t restPort{80};                        ///< HTTP port of the management API
    std::string description;                      ///< Free-form description

    /**
     * @brief Validates the record.
     * @return True if id and host are set and retryCount/timeoutSeconds are positive.
     */
    [[nodiscard]] bool isValid() const;

    /**
     * @brief Checks whether a protocol is enabled for the device.
     * @param protocol Protocol to check.
     * @return True if enabled.
     */
    [[nodiscard]] bool hasProtocol(MonitorProtocol protocol) const;

    /**
     * @brief Picks the protocol used to monitor the device.
     *
     * Priority is SNMP, then REST, then SSH. A record without any enabled
     * protocol is monitored over SNMP.
     *
     * @return The preferred protocol.
     */
    [[nodiscard]] MonitorProtocol preferredProtocol() const;

    bool operator==(const DeviceRecord& other) const = default;
};

/**
 * @brief Masks a secret, keeping two leading and two trailing characters.
 * @param secret The secret to mask.
 * @return Masked text; secrets of four characters or fewer become "****".
 */
std::string maskSecret(const std::string& secret);

/**
 * @brief Converts a device type to its configuration string.
 * @param type The device type.
 * @return Lower-case name (e.g., "router", "access_point").
 */
std::string deviceTypeToString(DeviceType type);

/**
 * @brief Parses a device type string.
 * @param str Lower-case name.
 * @return The matching type, or DeviceType::Generic for unrecognized input.
 */
DeviceType deviceTypeFromString(const std::string& str);

/**
 * @brief Converts a protocol to its configuration string.
 * @param protocol The protocol.
 * @return "snmp", "rest" or "ssh".
 */
std::string protocolToString(MonitorProtocol protocol);

/**
 * @brief Parses a protocol string.
 * @param str "snmp", "rest" or "ssh" (case-insensitive).
 * @return The protocol, or std::nullopt if the name is not a monitor protocol.
 */
std::optional<MonitorProtocol> protocolFromString(const std::string& str);

} // namespace netsentry::core
