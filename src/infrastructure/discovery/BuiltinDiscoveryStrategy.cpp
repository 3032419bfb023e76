#include "infrastructure/discovery/BuiltinDiscoveryStrategy.hpp"

#include "core/types/CidrRange.hpp"
#include "core/util/Concurrency.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace netsentry::infra {

BuiltinDiscoveryStrategy::BuiltinDiscoveryStrategy(core::IPingService& pingService,
                                                   core::IPortScanner& portScanner)
    : pingService_(pingService), portScanner_(portScanner) {}

std::optional<core::NetworkScanResult> BuiltinDiscoveryStrategy::discover(
    const core::DiscoveryRequest& request) {
    auto range = core::CidrRange::parse(request.network);
    auto hosts = range.hosts(request.maxHosts);
    if (range.hostCount() > hosts.size()) {
        spdlog::warn("Network {} has {} hosts; sweeping only the first {}", request.network,
                     range.hostCount(), hosts.size());
    }

    core::NetworkScanResult result;
    result.strategy = name();
    result.totalHosts = static_cast<int>(hosts.size());

    spdlog::info("Ping sweep of {} ({} addresses, {} concurrent)", request.network, hosts.size(),
                 request.maxConcurrent);

    std::mutex mutex;
    int scanned = 0;
    core::forEachBounded(hosts, request.maxConcurrent, [&](const std::string& address) {
        auto ping = pingService_.pingAsync(address, request.timeout).get();

        std::lock_guard lock(mutex);
        if (ping.success) {
            result.aliveHosts.push_back({address, std::max(0.0, ping.latencyMs()), std::nullopt});
        }
        ++scanned;
        if (request.onProgress) {
            request.onProgress(scanned, result.totalHosts);
        }
    });

    std::sort(result.aliveHosts.begin(), result.aliveHosts.end(),
              [](const core::LiveHost& a, const core::LiveHost& b) {
                  uint32_t left = 0;
                  uint32_t right = 0;
                  core::parseIpv4(a.address, left);
                  core::parseIpv4(b.address, right);
                  return left < right;
              });

    spdlog::info("Ping sweep complete: {} of {} hosts alive", result.aliveHosts.size(),
                 hosts.size());

    if (request.scanPorts && !request.ports.empty() && !result.aliveHosts.empty()) {
        core::PortScanRequest portRequest;
        for (const auto& host : result.aliveHosts) {
            portRequest.targets.push_back(host.address);
            result.portResults[host.address];
        }
        portRequest.ports = request.ports;
        portRequest.timeout = request.timeout;
        portRequest.maxConcurrency = request.maxConcurrent;

        for (const auto& probe : portScanner_.scan(portRequest)) {
            result.portResults[probe.address][probe.port] = probe.isOpen();
        }
    }

    return result;
}

} // namespace netsentry::infra
