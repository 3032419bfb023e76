#include "infrastructure/monitors/MonitorFactory.hpp"

#include "infrastructure/monitors/RestMonitor.hpp"
#include "infrastructure/monitors/SnmpMonitor.hpp"
#include "infrastructure/monitors/SshMonitor.hpp"

#include <spdlog/spdlog.h>

namespace netsentry::infra {

MonitorFactory::MonitorFactory(core::ISnmpClient& snmpClient, core::IHttpClient& httpClient,
                               core::IPortScanner& portScanner)
    : snmpClient_(snmpClient), httpClient_(httpClient), portScanner_(portScanner) {}

std::unique_ptr<core::IProtocolMonitor> MonitorFactory::createMonitor(
    const core::DeviceRecord& device) {
    auto protocol = device.preferredProtocol();
    spdlog::debug("Creating {} monitor for {}", core::protocolToString(protocol), device.id);

    switch (protocol) {
    case core::MonitorProtocol::Rest:
        return std::make_unique<RestMonitor>(device, httpClient_);
    case core::MonitorProtocol::Ssh:
        return std::make_unique<SshMonitor>(device, portScanner_);
    case core::MonitorProtocol::Snmp:
        break;
    }
    return std::make_unique<SnmpMonitor>(device, snmpClient_);
}

} // namespace netsentry::infra
