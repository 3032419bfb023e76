#include "infrastructure/discovery/NmapDiscoveryStrategy.hpp"

#include "core/types/CidrRange.hpp"
#include "infrastructure/network/NmapXmlParser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace netsentry::infra {

NmapDiscoveryStrategy::NmapDiscoveryStrategy(ProcessRunner& runner, std::string nmapPath)
    : runner_(runner), nmapPath_(std::move(nmapPath)) {}

bool NmapDiscoveryStrategy::isAvailable() {
    return runner_.findExecutable(nmapPath_).has_value();
}

std::vector<std::string> NmapDiscoveryStrategy::buildArguments(
    const core::DiscoveryRequest& request) {
    if (!request.scanPorts || request.ports.empty()) {
        return {"-sn", "-oX", "-", request.network};
    }

    std::string portList;
    for (size_t i = 0; i < request.ports.size(); ++i) {
        if (i > 0) {
            portList += ",";
        }
        portList += std::to_string(request.ports[i]);
    }
    return {"-T4", "-p", portList, "--open", "-oX", "-", request.network};
}

std::optional<core::NetworkScanResult> NmapDiscoveryStrategy::discover(
    const core::DiscoveryRequest& request) {
    auto range = core::CidrRange::parse(request.network);
    const int total = static_cast<int>(std::min<uint64_t>(range.hostCount(), request.maxHosts));
    const bool portScan = request.scanPorts && !request.ports.empty();

    auto timeoutSeconds = std::max<int64_t>(
        1, std::chrono::duration_cast<std::chrono::seconds>(request.timeout).count());
    auto wallClock = std::chrono::seconds(timeoutSeconds * (portScan ? 100 : 50));

    spdlog::info("Running nmap {} scan of {} (limit {}s)", portScan ? "port" : "ping",
                 request.network, wallClock.count());

    auto process = runner_.run(nmapPath_, buildArguments(request), wallClock);
    if (!process.succeeded()) {
        spdlog::warn("nmap scan of {} failed: {}", request.network,
                     process.errorMessage.empty()
                         ? "exit code " + std::to_string(process.exitCode)
                         : process.errorMessage);
        return std::nullopt;
    }

    auto parsed = NmapXmlParser::parse(process.output);
    if (!parsed) {
        return std::nullopt;
    }

    // Hosts outside the requested range are dropped; requested ports nmap
    // did not list are recorded as not open.
    core::NetworkScanResult result;
    result.strategy = name();
    result.totalHosts = total;
    for (auto& host : parsed->aliveHosts) {
        if (!range.contains(host.address)) {
            continue;
        }
        if (portScan) {
            auto& ports = result.portResults[host.address];
            ports = parsed->portResults[host.address];
            for (uint16_t port : request.ports) {
                ports.try_emplace(port, false);
            }
        }
        result.aliveHosts.push_back(std::move(host));
    }

    if (request.onProgress) {
        request.onProgress(total, total);
    }

    spdlog::info("nmap found {} live hosts in {}", result.aliveHosts.size(), request.network);
    return result;
}

} // namespace netsentry::infra
