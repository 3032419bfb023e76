#pragma once

#include "core/services/INetworkScanner.hpp"
#include "core/services/IPingService.hpp"
#include "core/services/IPortScanner.hpp"

namespace netsentry::infra {

/**
 * @brief Host discovery by ICMP sweep followed by a TCP connect scan.
 *
 * Every usable address of the network (up to DiscoveryRequest::maxHosts) is
 * pinged with at most maxConcurrent probes in flight. When ports are
 * requested, the live hosts are then port scanned with the same bound.
 */
class BuiltinDiscoveryStrategy : public core::IHostDiscoveryStrategy {
public:
    BuiltinDiscoveryStrategy(core::IPingService& pingService, core::IPortScanner& portScanner);

    std::string name() const override { return "builtin"; }
    bool isAvailable() override { return true; }
    std::optional<core::NetworkScanResult> discover(const core::DiscoveryRequest& request) override;

private:
    core::IPingService& pingService_;
    core::IPortScanner& portScanner_;
};

} // namespace netsentry::infra
