#pragma once

#include "core/services/IProtocolMonitor.hpp"
#include "core/services/ISnmpClient.hpp"

#include <functional>
#include <string>
#include <vector>

namespace netsentry::infra {

/**
 * @brief Protocol monitor that polls a device over SNMP v1/v2c.
 *
 * Identity comes from the system group, interfaces from ifTable joined with
 * ipAddrTable, and health from an ordered list of vendor and standard MIB
 * strategies per metric.
 */
class SnmpMonitor : public core::IProtocolMonitor {
public:
    /**
     * @brief A way of filling one health metric; returns true if it did.
     */
    using HealthStrategy = std::function<bool(core::DeviceHealth&)>;

    /**
     * @brief Strategies for one metric, tried in order until one succeeds.
     */
    struct MetricStrategies {
        std::string metric;                    ///< Metric name for logging
        std::vector<HealthStrategy> strategies; ///< Ordered strategies
    };

    /**
     * @brief Constructs a monitor for a device.
     * @param device Device to poll.
     * @param client SNMP client used for all queries.
     */
    SnmpMonitor(core::DeviceRecord device, core::ISnmpClient& client);

    const core::DeviceRecord& device() const override { return device_; }
    core::MonitorProtocol protocol() const override { return core::MonitorProtocol::Snmp; }

    /**
     * @brief GETs sysDescr.
     * @return True if the agent answered with a value.
     */
    bool testConnection() override;

    /**
     * @brief Reads the system group.
     * @throws std::runtime_error if the agent does not answer.
     */
    core::DeviceInfo getDeviceInfo() override;

    /**
     * @brief Walks ifTable and ipAddrTable and joins rows by ifIndex.
     *
     * Rows without ifDescr are dropped.
     *
     * @throws std::runtime_error if the agent does not answer.
     */
    std::vector<core::InterfaceInfo> getInterfaces() override;

    /**
     * @brief Collects CPU, memory, temperature and uptime.
     * @throws std::runtime_error if the agent does not answer sysUpTime.
     */
    core::DeviceHealth getHealthMetrics() override;

private:
    core::SnmpTarget target() const;
    std::vector<MetricStrategies> healthStrategies();

    bool ciscoCpu(core::DeviceHealth& health);
    bool hostResourcesCpu(core::DeviceHealth& health);
    bool ciscoMemory(core::DeviceHealth& health);
    bool hostResourcesStorage(core::DeviceHealth& health);
    bool hostResourcesMemorySize(core::DeviceHealth& health);
    bool ciscoTemperature(core::DeviceHealth& health);

    core::DeviceRecord device_;
    core::ISnmpClient& client_;
};

/**
 * @brief Formats raw ifPhysAddress bytes as lower-case colon-separated hex.
 * @param raw Octet string value.
 * @return e.g. "00:1a:2b:3c:4d:5e", or an empty string for no bytes.
 */
std::string formatMacAddress(const std::string& raw);

} // namespace netsentry::infra
