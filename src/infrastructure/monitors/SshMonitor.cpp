#include "infrastructure/monitors/SshMonitor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace netsentry::infra {

SshMonitor::SshMonitor(core::DeviceRecord device, core::IPortScanner& portScanner)
    : device_(std::move(device)), portScanner_(portScanner) {}

bool SshMonitor::testConnection() {
    const auto& creds = device_.credentials;
    if (creds.username.empty() || (creds.password.empty() && creds.sshKey.empty())) {
        spdlog::debug("Device {} has no SSH credentials", device_.id);
        return false;
    }

    auto state = portScanner_.probe(device_.host, SSH_PORT,
                                    std::chrono::seconds(std::max(1, device_.timeoutSeconds)));
    return state == core::PortState::Open;
}

core::DeviceInfo SshMonitor::getDeviceInfo() {
    core::DeviceInfo info;
    info.name = device_.host;
    if (!device_.description.empty()) {
        info.description = device_.description;
    }
    return info;
}

} // namespace netsentry::infra
