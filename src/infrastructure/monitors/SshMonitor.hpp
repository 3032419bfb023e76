#pragma once

#include "core/services/IPortScanner.hpp"
#include "core/services/IProtocolMonitor.hpp"

namespace netsentry::infra {

/**
 * @brief Minimal SSH monitor.
 *
 * Only checks that the device is SSH-reachable with usable credentials;
 * no session is opened, so interfaces and health are always empty.
 */
class SshMonitor : public core::IProtocolMonitor {
public:
    static constexpr uint16_t SSH_PORT = 22;

    SshMonitor(core::DeviceRecord device, core::IPortScanner& portScanner);

    const core::DeviceRecord& device() const override { return device_; }
    core::MonitorProtocol protocol() const override { return core::MonitorProtocol::Ssh; }

    /**
     * @brief Checks credentials and that TCP port 22 accepts connections.
     * @return True if a username plus a password or key is configured and the port is open.
     */
    bool testConnection() override;

    core::DeviceInfo getDeviceInfo() override;
    std::vector<core::InterfaceInfo> getInterfaces() override { return {}; }
    core::DeviceHealth getHealthMetrics() override { return {}; }

private:
    core::DeviceRecord device_;
    core::IPortScanner& portScanner_;
};

} // namespace netsentry::infra
