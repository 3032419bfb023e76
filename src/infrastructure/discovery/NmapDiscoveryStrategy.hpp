#pragma once

#include "core/services/INetworkScanner.hpp"
#include "infrastructure/network/ProcessRunner.hpp"

#include <string>

namespace netsentry::infra {

/**
 * @brief Host discovery by a single nmap invocation with XML output.
 *
 * Port scans run "nmap -T4 -p <ports> --open -oX - <network>", ping scans
 * "nmap -sn -oX - <network>". The wall-clock limit is the per-probe timeout
 * times 100 (port scans) or 50 (ping scans). A missing binary, a non-zero
 * exit, a timeout or unparsable output all yield std::nullopt.
 */
class NmapDiscoveryStrategy : public core::IHostDiscoveryStrategy {
public:
    /**
     * @brief Constructs the strategy.
     * @param runner Process launcher.
     * @param nmapPath nmap executable name or path.
     */
    NmapDiscoveryStrategy(ProcessRunner& runner, std::string nmapPath = "nmap");

    std::string name() const override { return "nmap"; }
    bool isAvailable() override;
    std::optional<core::NetworkScanResult> discover(const core::DiscoveryRequest& request) override;

    /**
     * @brief Builds the nmap argument list for a request.
     * @param request Discovery parameters.
     * @return Arguments, excluding the executable.
     */
    static std::vector<std::string> buildArguments(const core::DiscoveryRequest& request);

private:
    ProcessRunner& runner_;
    std::string nmapPath_;
};

} // namespace netsentry::infra
