/**
 * @file INetworkScanner.hpp
 * @brief Interfaces for host discovery over an IPv4 range.
 *
 * Discovery has two interchangeable strategies with identical output: an
 * external scanning tool (fast path) and the built-in ping sweep plus port
 * scan (slow path). The network scanner picks one at call time.
 */

#pragma once

#include "core/types/ScanJob.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief Parameters of one host discovery pass.
 */
struct DiscoveryRequest {
    std::string network;                     ///< CIDR to scan (already validated)
    bool scanPorts{false};                   ///< Also probe TCP ports on live hosts
    std::vector<uint16_t> ports;             ///< Ports to probe
    std::chrono::milliseconds timeout{5000}; ///< Per-probe timeout
    int maxConcurrent{50};                   ///< Maximum probes in flight
    size_t maxHosts{1000};                   ///< Safety ceiling on enumerated addresses
    std::function<void(int scanned, int total)> onProgress; ///< Optional progress hook
};

/**
 * @brief SNMP answer obtained while enriching a discovered host.
 */
struct SnmpProbeResult {
    std::string community;         ///< Community that answered
    std::string systemDescription; ///< sysDescr value
};

/**
 * @brief Per-host data gathered after liveness and port discovery.
 */
struct HostEnrichment {
    std::optional<std::string> hostname;   ///< Reverse-DNS name
    std::optional<SnmpProbeResult> snmp;   ///< SNMP answer, if any community worked
};

/**
 * @brief A way of discovering live hosts and their open ports.
 */
class IHostDiscoveryStrategy {
public:
    virtual ~IHostDiscoveryStrategy() = default;

    /**
     * @brief Returns the strategy name for logging.
     */
    virtual std::string name() const = 0;

    /**
     * @brief Checks whether the strategy can run on this machine.
     * @return True if usable.
     */
    virtual bool isAvailable() = 0;

    /**
     * @brief Discovers hosts in a network.
     * @param request Discovery parameters.
     * @return The scan result, or std::nullopt if the strategy failed and the
     *         caller should fall back to another one.
     */
    virtual std::optional<NetworkScanResult> discover(const DiscoveryRequest& request) = 0;
};

/**
 * @brief Interface of the network scanner used by the scan lifecycle manager.
 */
class INetworkScanner {
public:
    virtual ~INetworkScanner() = default;

    /**
     * @brief Discovers live hosts (and optionally their ports) in a network.
     * @param request Discovery parameters.
     * @param allowExternalTool Try the external tool before the built-in path.
     * @return Discovery result. Per-host failures never fail the whole pass.
     */
    virtual NetworkScanResult discoverHosts(const DiscoveryRequest& request,
                                            bool allowExternalTool) = 0;

    /**
     * @brief Resolves hostnames and probes SNMP for a set of hosts.
     *
     * Hosts are processed concurrently and independently. SNMP communities
     * are tried in order and the first that answers wins.
     *
     * @param addresses Hosts to enrich.
     * @param communities SNMP communities to try; empty skips the SNMP probe.
     * @param timeout Per-probe timeout.
     * @param maxConcurrent Maximum hosts processed at once.
     * @return Enrichment per address.
     */
    virtual std::map<std::string, HostEnrichment> enrichHosts(
        const std::vector<std::string>& addresses, const std::vector<std::string>& communities,
        std::chrono::milliseconds timeout, int maxConcurrent) = 0;
};

} // namespace netsentry::core
