#include "infrastructure/discovery/NetworkScanner.hpp"

#include "core/types/DeviceRecord.hpp"
#include "core/util/Concurrency.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <stdexcept>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace netsentry::infra {

NetworkScanner::NetworkScanner(std::unique_ptr<core::IHostDiscoveryStrategy> external,
                               std::unique_ptr<core::IHostDiscoveryStrategy> builtin,
                               core::ISnmpClient& snmpClient, HostnameResolver resolver)
    : external_(std::move(external)), builtin_(std::move(builtin)), snmpClient_(snmpClient),
      resolver_(std::move(resolver)) {
    if (!builtin_) {
        throw std::invalid_argument("NetworkScanner requires a built-in discovery strategy");
    }
}

core::NetworkScanResult NetworkScanner::discoverHosts(const core::DiscoveryRequest& request,
                                                      bool allowExternalTool) {
    if (allowExternalTool && external_) {
        if (external_->isAvailable()) {
            auto result = external_->discover(request);
            if (result) {
                return std::move(*result);
            }
            spdlog::warn("{} discovery of {} failed; falling back to {}", external_->name(),
                         request.network, builtin_->name());
        } else {
            spdlog::info("{} is not available; using {} discovery", external_->name(),
                         builtin_->name());
        }
    }

    auto result = builtin_->discover(request);
    if (!result) {
        throw std::runtime_error("Host discovery of " + request.network + " failed");
    }
    return std::move(*result);
}

std::map<std::string, core::HostEnrichment> NetworkScanner::enrichHosts(
    const std::vector<std::string>& addresses, const std::vector<std::string>& communities,
    std::chrono::milliseconds timeout, int maxConcurrent) {
    std::map<std::string, core::HostEnrichment> enrichment;
    std::mutex mutex;

    core::forEachBounded(addresses, maxConcurrent, [&](const std::string& address) {
        core::HostEnrichment entry;
        if (resolver_) {
            entry.hostname = resolver_(address);
        }

        for (const auto& community : communities) {
            core::SnmpTarget target;
            target.address = address;
            target.community = community;
            target.timeoutMs = static_cast<int>(timeout.count());
            target.retries = 1;

            auto response = snmpClient_.get(target, {core::SnmpOids::SYS_DESCR});
            if (!response.success) {
                continue;
            }
            if (auto descr = response.getVarBind(core::SnmpOids::SYS_DESCR)) {
                entry.snmp = core::SnmpProbeResult{community, descr->value};
                spdlog::debug("SNMP answered on {} (community {})", address,
                              core::maskSecret(community));
                break;
            }
        }

        std::lock_guard lock(mutex);
        enrichment[address] = std::move(entry);
    });

    return enrichment;
}

std::optional<std::string> NetworkScanner::reverseLookup(const std::string& address) {
    struct sockaddr_in addr {};
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        return std::nullopt;
    }

    char host[NI_MAXHOST];
    int rc = getnameinfo(reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr), host,
                         sizeof(host), nullptr, 0, NI_NAMEREQD);
    if (rc != 0 || host[0] == '\0') {
        return std::nullopt;
    }
    return std::string(host);
}

} // namespace netsentry::infra
