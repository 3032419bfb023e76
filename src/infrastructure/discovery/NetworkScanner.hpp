#pragma once

#include "core/services/INetworkScanner.hpp"
#include "core/services/ISnmpClient.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace netsentry::infra {

/**
 * @brief Discovers hosts with an external strategy and a built-in fallback.
 *
 * discoverHosts() tries the external strategy first when allowed and
 * available, and falls back to the built-in strategy when it declines.
 * enrichHosts() resolves hostnames and probes SNMP sysDescr per host.
 */
class NetworkScanner : public core::INetworkScanner {
public:
    /// Reverse lookup of an address; std::nullopt when no name is known.
    using HostnameResolver = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Constructs the scanner.
     * @param external Fast-path strategy (may be null).
     * @param builtin Fallback strategy (required).
     * @param snmpClient Client used for SNMP enrichment.
     * @param resolver Hostname resolver; defaults to reverseLookup().
     * @throws std::invalid_argument if builtin is null.
     */
    NetworkScanner(std::unique_ptr<core::IHostDiscoveryStrategy> external,
                   std::unique_ptr<core::IHostDiscoveryStrategy> builtin,
                   core::ISnmpClient& snmpClient, HostnameResolver resolver = reverseLookup);

    core::NetworkScanResult discoverHosts(const core::DiscoveryRequest& request,
                                          bool allowExternalTool) override;

    std::map<std::string, core::HostEnrichment> enrichHosts(
        const std::vector<std::string>& addresses, const std::vector<std::string>& communities,
        std::chrono::milliseconds timeout, int maxConcurrent) override;

    /**
     * @brief Resolves an IPv4 address to a hostname with getnameinfo().
     * @param address Dotted-quad address.
     * @return The name, or std::nullopt when there is no PTR record.
     */
    static std::optional<std::string> reverseLookup(const std::string& address);

private:
    std::unique_ptr<core::IHostDiscoveryStrategy> external_;
    std::unique_ptr<core::IHostDiscoveryStrategy> builtin_;
    core::ISnmpClient& snmpClient_;
    HostnameResolver resolver_;
};

} // namespace netsentry::infra
