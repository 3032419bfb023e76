#pragma once

#include "core/services/IHttpClient.hpp"
#include "core/services/IPortScanner.hpp"
#include "core/services/IProtocolMonitor.hpp"
#include "core/services/ISnmpClient.hpp"

namespace netsentry::infra {

/**
 * @brief Creates the protocol monitor matching a device's preferred protocol.
 */
class MonitorFactory : public core::IMonitorFactory {
public:
    MonitorFactory(core::ISnmpClient& snmpClient, core::IHttpClient& httpClient,
                   core::IPortScanner& portScanner);

    std::unique_ptr<core::IProtocolMonitor> createMonitor(const core::DeviceRecord& device) override;

private:
    core::ISnmpClient& snmpClient_;
    core::IHttpClient& httpClient_;
    core::IPortScanner& portScanner_;
};

} // namespace netsentry::infra
