/**
 * @file IProtocolMonitor.hpp
 * @brief Protocol-agnostic contract for polling a managed device.
 *
 * One implementation exists per management protocol family (SNMP, REST,
 * SSH). The monitoring coordinator depends only on this interface.
 */

#pragma once

#include "core/types/DeviceRecord.hpp"
#include "core/types/DeviceStatus.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief Interface for polling one device over one management protocol.
 *
 * Capability methods may throw std::runtime_error when the device answers
 * with garbage or the transport fails mid-query; testConnection() never
 * throws for a device that is simply down.
 *
 * getInterface() and getDeviceStatus() carry the logic shared by every
 * protocol and are implemented here in terms of the capability methods.
 */
class IProtocolMonitor {
public:
    virtual ~IProtocolMonitor() = default;

    /**
     * @brief Returns the device this monitor polls.
     * @return Reference to the device record.
     */
    virtual const DeviceRecord& device() const = 0;

    /**
     * @brief Returns the protocol this monitor speaks.
     * @return The monitor protocol.
     */
    virtual MonitorProtocol protocol() const = 0;

    /**
     * @brief Performs the cheapest reachability probe the protocol allows.
     * @return True if the device answered, false if it is down or timed out.
     */
    virtual bool testConnection() = 0;

    /**
     * @brief Retrieves identity facts of the device.
     * @return Device information; unavailable fields are "Unknown".
     */
    virtual DeviceInfo getDeviceInfo() = 0;

    /**
     * @brief Retrieves all interfaces of the device.
     * @return Interfaces in the order the device reports them.
     */
    virtual std::vector<InterfaceInfo> getInterfaces() = 0;

    /**
     * @brief Retrieves health metrics of the device.
     * @return Health metrics; fields the protocol cannot provide are absent.
     */
    virtual DeviceHealth getHealthMetrics() = 0;

    /**
     * @brief Looks up a single interface by name.
     * @param name Interface name.
     * @return The interface, or std::nullopt if no interface has that name.
     */
    virtual std::optional<InterfaceInfo> getInterface(const std::string& name);

    /**
     * @brief Collects the composite status of the device.
     *
     * Times testConnection(); an unreachable device yields a status without
     * health or interfaces. For a reachable device, health and interfaces are
     * queried independently and a failure of either is recorded as degraded
     * status instead of being propagated.
     *
     * @return The device status. Never throws.
     */
    virtual DeviceStatus getDeviceStatus();
};

/**
 * @brief Creates protocol monitors for device records.
 */
class IMonitorFactory {
public:
    virtual ~IMonitorFactory() = default;

    /**
     * @brief Creates the monitor for a device's preferred protocol.
     * @param device Device to monitor.
     * @return Owning pointer to the new monitor.
     */
    virtual std::unique_ptr<IProtocolMonitor> createMonitor(const DeviceRecord& device) = 0;
};

} // namespace netsentry::core
