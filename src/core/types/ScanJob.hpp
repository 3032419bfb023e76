/**
 * @file ScanJob.hpp
 * @brief Discovery scan jobs, their state machine and discovered devices.
 *
 * A ScanJob is created when a discovery scan is requested, mutated only by
 * the background task that runs it, and becomes immutable once it reaches
 * Completed or Failed.
 */

#pragma once

#include "core/types/DeviceRecord.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief Depth of a discovery scan.
 */
enum class ScanType : int {
    Ping = 0, ///< Liveness only
    Port = 1, ///< Liveness and TCP ports
    Full = 2  ///< Liveness, ports, hostnames and SNMP enrichment
};

/**
 * @brief Lifecycle state of a scan job.
 *
 * Transitions are Pending -> Running -> {Completed, Failed}.
 */
enum class ScanStatus : int {
    Pending = 0,
    Running = 1,
    Completed = 2,
    Failed = 3
};

/**
 * @brief A host found by a discovery scan.
 */
struct DiscoveredDevice {
    std::string ip;                              ///< IPv4 address
    std::optional<std::string> hostname;         ///< Reverse-DNS or scanner-reported name
    std::optional<double> responseTimeMs;        ///< Liveness round-trip time
    std::set<uint16_t> openPorts;                ///< Open TCP ports
    std::vector<std::string> suggestedProtocols; ///< e.g. "snmp", "ssh", "rest", "ping"
    std::optional<std::string> systemDescription; ///< SNMP sysDescr, if it answered
    DeviceType deviceType{DeviceType::Unknown};  ///< Classifier guess
    std::optional<std::string> snmpCommunity;    ///< Community that answered
    double confidenceScore{0.0};                 ///< Classification confidence in [0, 1]

    /**
     * @brief Returns a copy with the SNMP community masked.
     */
    [[nodiscard]] DiscoveredDevice maskedCopy() const;

    bool operator==(const DiscoveredDevice& other) const = default;
};

/**
 * @brief Caller-tunable parameters of a scan.
 */
struct ScanOptions {
    std::vector<uint16_t> ports{22, 23, 80, 161, 443, 8080, 8443, 9000}; ///< Ports to probe
    std::vector<std::string> snmpCommunities{"public", "private"}; ///< Tried in order
    int timeoutSeconds{5};     ///< Per-probe timeout
    int maxConcurrent{50};     ///< Maximum probes in flight
    bool useExternalTool{true}; ///< Try the nmap fast path first
};

/**
 * @brief One discovery run over a network range.
 */
struct ScanJob {
    std::string scanId;                                   ///< Unique identifier
    std::string network;                                  ///< CIDR that was scanned
    ScanType scanType{ScanType::Ping};                    ///< Requested depth
    ScanStatus status{ScanStatus::Pending};               ///< Current state
    std::chrono::system_clock::time_point startedAt;      ///< When the job was created
    std::optional<std::chrono::system_clock::time_point> completedAt; ///< Set once terminal
    int totalHosts{0};                                    ///< Addresses to be scanned
    int scannedHosts{0};                                  ///< Addresses scanned so far
    std::vector<DiscoveredDevice> discoveredDevices;      ///< Results, ordered by address
    std::optional<std::string> errorMessage;              ///< Set iff Failed

    /**
     * @brief Checks whether the job reached a terminal state.
     * @return True for Completed and Failed.
     */
    [[nodiscard]] bool isTerminal() const {
        return status == ScanStatus::Completed || status == ScanStatus::Failed;
    }

    /**
     * @brief Returns a copy whose discovered devices carry masked communities.
     * @return Job safe to echo back to a caller.
     */
    [[nodiscard]] ScanJob maskedCopy() const;

    bool operator==(const ScanJob& other) const = default;
};

/**
 * @brief A host that answered a liveness probe.
 */
struct LiveHost {
    std::string address;                 ///< IPv4 address
    double responseTimeMs{0.0};          ///< Round-trip time (non-negative)
    std::optional<std::string> hostname; ///< Name reported by the scanner

    bool operator==(const LiveHost& other) const = default;
};

/**
 * @brief Output of a host discovery pass, identical for every strategy.
 */
struct NetworkScanResult {
    std::vector<LiveHost> aliveHosts;                               ///< Hosts that answered
    std::map<std::string, std::map<uint16_t, bool>> portResults;   ///< Host -> port -> open
    int totalHosts{0};                                              ///< Addresses covered
    std::string strategy;                                           ///< Strategy that produced it

    /**
     * @brief Lists the open ports recorded for a host.
     * @param address Host address.
     * @return Open ports in ascending order.
     */
    [[nodiscard]] std::set<uint16_t> openPorts(const std::string& address) const;
};

/**
 * @brief Converts a scan type to its wire string.
 * @return "ping", "port" or "full".
 */
std::string scanTypeToString(ScanType type);

/**
 * @brief Parses a scan type string.
 * @param str "ping", "port" or "full".
 * @return The scan type, or std::nullopt for unknown input.
 */
std::optional<ScanType> scanTypeFromString(const std::string& str);

/**
 * @brief Converts a scan status to its wire string.
 * @return "pending", "running", "completed" or "failed".
 */
std::string scanStatusToString(ScanStatus status);

/**
 * @brief Parses a scan status string.
 * @param str Status text.
 * @return The status, or std::nullopt for unknown input.
 */
std::optional<ScanStatus> scanStatusFromString(const std::string& str);

} // namespace netsentry::core
