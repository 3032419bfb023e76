/**
 * @file SnmpTypes.hpp
 * @brief SNMP targets, variable bindings and well-known OIDs.
 *
 * This file defines the types exchanged between the SNMP client and the
 * SNMP protocol monitor: the agent to query, the decoded values it returned,
 * and the OID constants used for system, interface and health polling.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief Supported community-based SNMP protocol versions.
 */
enum class SnmpVersion : int {
    V1 = 1, ///< SNMP version 1
    V2c = 2 ///< SNMP version 2c
};

/**
 * @brief SNMP data types as defined in RFC 2578.
 */
enum class SnmpDataType : int {
    Integer = 0,          ///< 32-bit signed integer
    OctetString = 1,      ///< Arbitrary binary or text data
    ObjectIdentifier = 2, ///< Object identifier (OID)
    IpAddress = 3,        ///< 32-bit IPv4 address
    Counter32 = 4,        ///< 32-bit counter (wraps at max)
    Gauge32 = 5,          ///< 32-bit gauge (can increase or decrease)
    TimeTicks = 6,        ///< Hundredths of a second
    Counter64 = 7,        ///< 64-bit counter
    Null = 8,             ///< Null value
    NoSuchObject = 9,     ///< OID does not exist
    NoSuchInstance = 10,  ///< Instance does not exist
    EndOfMibView = 11,    ///< End of MIB tree reached
    Unknown = 99          ///< Unknown data type
};

/**
 * @brief SNMP variable binding (OID + value pair).
 *
 * Numeric values are kept both as text in @c value and in the typed field
 * matching their wire type, so callers never have to re-parse strings.
 */
struct SnmpVarBind {
    std::string oid;                          ///< Object identifier
    SnmpDataType type{SnmpDataType::Unknown}; ///< Data type of the value
    std::string value;                        ///< String representation of the value
    std::optional<int64_t> intValue;          ///< INTEGER values
    std::optional<uint64_t> counterValue;     ///< Counter32/Gauge32/TimeTicks/Counter64 values

    /**
     * @brief Returns the value as a number regardless of its integer wire type.
     * @return Numeric value, or std::nullopt for non-numeric types.
     */
    [[nodiscard]] std::optional<int64_t> numericValue() const {
        if (intValue) {
            return intValue;
        }
        if (counterValue) {
            return static_cast<int64_t>(*counterValue);
        }
        return std::nullopt;
    }

    /**
     * @brief Checks whether the agent reported the OID as missing.
     * @return True for NoSuchObject, NoSuchInstance and EndOfMibView.
     */
    [[nodiscard]] bool isException() const {
        return type == SnmpDataType::NoSuchObject || type == SnmpDataType::NoSuchInstance ||
               type == SnmpDataType::EndOfMibView;
    }

    bool operator==(const SnmpVarBind& other) const = default;
};

/**
 * @brief Result of an SNMP GET or GET-NEXT request.
 */
struct SnmpResult {
    std::chrono::system_clock::time_point timestamp; ///< When the query was performed
    std::vector<SnmpVarBind> varbinds;               ///< Variable bindings in the response
    std::chrono::microseconds responseTime{0};       ///< Time taken for the query
    bool success{false};                             ///< Whether the query succeeded
    std::string errorMessage;                        ///< Error message if query failed
    int errorStatus{0};                              ///< SNMP error status (0 = noError)

    /**
     * @brief Converts response time to milliseconds.
     * @return Response time as a floating-point number of milliseconds.
     */
    [[nodiscard]] double responseTimeMs() const {
        return static_cast<double>(responseTime.count()) / 1000.0;
    }

    /**
     * @brief Gets a specific variable binding by OID.
     * @param oid The OID to search for.
     * @return The variable binding if found and not an exception value, std::nullopt otherwise.
     */
    [[nodiscard]] std::optional<SnmpVarBind> getVarBind(const std::string& oid) const {
        for (const auto& vb : varbinds) {
            if (vb.oid == oid && !vb.isException()) {
                return vb;
            }
        }
        return std::nullopt;
    }
};

/**
 * @brief Addressing and transport settings for one SNMP agent.
 */
struct SnmpTarget {
    std::string address;                   ///< Hostname or IP address of the agent
    std::string community{"public"};       ///< Community string
    SnmpVersion version{SnmpVersion::V2c}; ///< Protocol version
    uint16_t port{161};                    ///< UDP port
    int timeoutMs{5000};                   ///< Per-request timeout in milliseconds
    int retries{1};                        ///< Transport-level attempts per request
};

/**
 * @brief Common SNMP OID constants.
 *
 * Scalars carry their ".0" instance suffix; table columns do not.
 */
namespace SnmpOids {
    /** @name System MIB (SNMPv2-MIB)
     *  @{ */
    constexpr const char* SYS_DESCR = "1.3.6.1.2.1.1.1.0";     ///< System description
    constexpr const char* SYS_OBJECT_ID = "1.3.6.1.2.1.1.2.0"; ///< System object ID
    constexpr const char* SYS_UPTIME = "1.3.6.1.2.1.1.3.0";    ///< System uptime (TimeTicks)
    constexpr const char* SYS_CONTACT = "1.3.6.1.2.1.1.4.0";   ///< System contact
    constexpr const char* SYS_NAME = "1.3.6.1.2.1.1.5.0";      ///< System name
    constexpr const char* SYS_LOCATION = "1.3.6.1.2.1.1.6.0";  ///< System location
    /** @} */

    /** @name Interface table (IF-MIB ifEntry columns)
     *  @{ */
    constexpr const char* IF_INDEX = "1.3.6.1.2.1.2.2.1.1";
    constexpr const char* IF_DESCR = "1.3.6.1.2.1.2.2.1.2";
    constexpr const char* IF_TYPE = "1.3.6.1.2.1.2.2.1.3";
    constexpr const char* IF_MTU = "1.3.6.1.2.1.2.2.1.4";
    constexpr const char* IF_SPEED = "1.3.6.1.2.1.2.2.1.5";
    constexpr const char* IF_PHYS_ADDRESS = "1.3.6.1.2.1.2.2.1.6";
    constexpr const char* IF_ADMIN_STATUS = "1.3.6.1.2.1.2.2.1.7";
    constexpr const char* IF_OPER_STATUS = "1.3.6.1.2.1.2.2.1.8";
    constexpr const char* IF_LAST_CHANGE = "1.3.6.1.2.1.2.2.1.9";
    constexpr const char* IF_IN_OCTETS = "1.3.6.1.2.1.2.2.1.10";
    constexpr const char* IF_IN_ERRORS = "1.3.6.1.2.1.2.2.1.14";
    constexpr const char* IF_OUT_OCTETS = "1.3.6.1.2.1.2.2.1.16";
    constexpr const char* IF_OUT_ERRORS = "1.3.6.1.2.1.2.2.1.20";
    /** @} */

    /** @name IP address table (ipAddrTable)
     *  @{ */
    constexpr const char* IP_AD_ENT_IF_INDEX = "1.3.6.1.2.1.4.20.1.2"; ///< Address -> ifIndex
    /** @} */

    /** @name Host Resources MIB (HOST-RESOURCES-MIB)
     *  @{ */
    constexpr const char* HR_MEMORY_SIZE = "1.3.6.1.2.1.25.2.2.0";         ///< Physical memory (KB)
    constexpr const char* HR_STORAGE_TYPE = "1.3.6.1.2.1.25.2.3.1.2";      ///< Storage type column
    constexpr const char* HR_STORAGE_ALLOC_UNITS = "1.3.6.1.2.1.25.2.3.1.4";
    constexpr const char* HR_STORAGE_SIZE = "1.3.6.1.2.1.25.2.3.1.5";
    constexpr const char* HR_STORAGE_USED = "1.3.6.1.2.1.25.2.3.1.6";
    constexpr const char* HR_STORAGE_RAM = "1.3.6.1.2.1.25.2.1.2";         ///< hrStorageRam type OID
    constexpr const char* HR_PROCESSOR_LOAD = "1.3.6.1.2.1.25.3.3.1.2";    ///< Per-CPU load
    /** @} */

    /** @name Cisco enterprise MIBs
     *  @{ */
    constexpr const char* CISCO_CPU_5MIN = "1.3.6.1.4.1.9.9.109.1.1.1.1.8";  ///< cpmCPUTotal5minRev
    constexpr const char* CISCO_MEM_POOL_USED = "1.3.6.1.4.1.9.9.48.1.1.1.5";
    constexpr const char* CISCO_MEM_POOL_FREE = "1.3.6.1.4.1.9.9.48.1.1.1.6";
    constexpr const char* CISCO_TEMPERATURE = "1.3.6.1.4.1.9.9.13.1.3.1.3";  ///< ciscoEnvMonTemperatureStatusValue
    /** @} */
}

/**
 * @brief Converts an SNMP version to its configuration string.
 * @param version The SNMP version to convert.
 * @return "1" or "2c".
 */
inline std::string snmpVersionToString(SnmpVersion version) {
    switch (version) {
        case SnmpVersion::V1: return "1";
        case SnmpVersion::V2c: return "2c";
    }
    return "2c";
}

/**
 * @brief Parses an SNMP version string.
 * @param str The string to parse (e.g., "1", "v1", "2c", "v2c").
 * @return The corresponding SnmpVersion (defaults to V2c).
 */
inline SnmpVersion snmpVersionFromString(const std::string& str) {
    if (str == "v1" || str == "1") return SnmpVersion::V1;
    return SnmpVersion::V2c;
}

} // namespace netsentry::core
