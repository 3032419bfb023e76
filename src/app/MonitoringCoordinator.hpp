#pragma once

#include "core/services/IDeviceRegistry.hpp"
#include "core/services/IPingService.hpp"
#include "core/services/IPortScanner.hpp"
#include "core/services/IProtocolMonitor.hpp"
#include "core/util/ResultCache.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace netsentry::app {

/**
 * @brief Tunables of the monitoring coordinator.
 */
struct CoordinatorSettings {
    std::chrono::seconds cacheTtl{300};               ///< Lifetime of cached results
    int maxConcurrentQueries{10};                     ///< Devices polled at once by bulk queries
    std::chrono::milliseconds retryBaseDelay{1000};   ///< Backoff after the first failure
};

/**
 * @brief Raised inside a retry loop when a monitor reports a device down.
 *
 * Never escapes the coordinator.
 */
class MonitorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Protocol-agnostic entry point for polling managed devices.
 *
 * Holds one protocol monitor per device, created through the monitor
 * factory from the registry's records, and a TTL cache in front of them.
 * Monitor calls are retried with exponential backoff up to the device's
 * retry count. Bulk queries fan out under a concurrency limit.
 *
 * Lookups of unknown device ids return std::nullopt.
 */
class MonitoringCoordinator {
public:
    /**
     * @brief Constructs the coordinator and builds monitors for the current devices.
     * @param registry Device source (not reloaded here).
     * @param factory Creates protocol monitors.
     * @param pingService ICMP reachability checks.
     * @param portScanner TCP fallback for reachability checks.
     * @param settings Cache and concurrency settings.
     * @param now Clock of the result cache.
     */
    MonitoringCoordinator(core::IDeviceRegistry& registry, core::IMonitorFactory& factory,
                          core::IPingService& pingService, core::IPortScanner& portScanner,
                          CoordinatorSettings settings = {},
                          core::ResultCache::TimeSource now = &core::ResultCache::Clock::now);

    MonitoringCoordinator(const MonitoringCoordinator&) = delete;
    MonitoringCoordinator& operator=(const MonitoringCoordinator&) = delete;

    /**
     * @brief Returns the status of a device, from cache when fresh.
     *
     * Unreachable devices and monitor failures yield a status with
     * reachable=false and the error text; this never throws.
     *
     * @param deviceId Device identifier.
     * @return The status, or std::nullopt for an unknown device.
     */
    std::optional<core::DeviceStatus> getDeviceStatus(const std::string& deviceId);

    /**
     * @brief Returns the interfaces of a device, from cache when fresh.
     * @param deviceId Device identifier.
     * @return Interfaces, or std::nullopt for an unknown device.
     * @throws std::runtime_error if the monitor still fails after all retries.
     */
    std::optional<std::vector<core::InterfaceInfo>> getDeviceInterfaces(const std::string& deviceId);

    /**
     * @brief Returns one interface of a device.
     * @param deviceId Device identifier.
     * @param name Interface name.
     * @return The interface, or std::nullopt if the device or interface is unknown.
     * @throws std::runtime_error if the monitor still fails after all retries.
     */
    std::optional<core::InterfaceInfo> getDeviceInterface(const std::string& deviceId,
                                                          const std::string& name);

    /**
     * @brief Returns the health metrics of a device, from cache when fresh.
     * @param deviceId Device identifier.
     * @return Health, or std::nullopt for an unknown device.
     * @throws std::runtime_error if the monitor still fails after all retries.
     */
    std::optional<core::DeviceHealth> getDeviceHealth(const std::string& deviceId);

    /**
     * @brief Polls several devices concurrently.
     * @param deviceIds Devices to poll; unknown ids are omitted from the result.
     * @return Status per device id.
     */
    std::map<std::string, core::DeviceStatus> getMultipleDeviceStatus(
        const std::vector<std::string>& deviceIds);

    /**
     * @brief Polls every monitored device.
     */
    std::map<std::string, core::DeviceStatus> getAllDeviceStatus();

    /**
     * @brief Checks reachability outside the protocol monitor.
     *
     * Sends an ICMP echo; if that fails, tries a TCP connect to ports 22,
     * 80 and 443 in turn.
     *
     * @param deviceId Device identifier.
     * @return Check result, or std::nullopt for an unknown device.
     */
    std::optional<core::PingCheck> pingDevice(const std::string& deviceId);

    /**
     * @brief Runs the monitor's connection test, bypassing the cache.
     * @param deviceId Device identifier.
     * @return Whether the device answered, or std::nullopt for an unknown device.
     */
    std::optional<bool> testDeviceConnection(const std::string& deviceId);

    /**
     * @brief Reloads the registry, rebuilds all monitors and clears the cache.
     * @throws std::runtime_error if the registry cannot be reloaded.
     */
    void reloadDevices();

    /**
     * @brief Clears cached results.
     * @param deviceId Device to clear, or std::nullopt for the whole cache.
     */
    void clearCache(const std::optional<std::string>& deviceId = std::nullopt);

    /**
     * @brief Lists monitored device ids in ascending order.
     */
    std::vector<std::string> deviceIds() const;

    /**
     * @brief Number of cache entries, expired ones included.
     */
    size_t cacheSize() const { return cache_.size(); }

private:
    using MonitorPtr = std::shared_ptr<core::IProtocolMonitor>;

    void rebuildMonitors();
    MonitorPtr findMonitor(const std::string& deviceId) const;

    template <typename Fn>
    auto retry(const core::DeviceRecord& device, Fn&& fn) -> decltype(fn());

    core::IDeviceRegistry& registry_;
    core::IMonitorFactory& factory_;
    core::IPingService& pingService_;
    core::IPortScanner& portScanner_;
    CoordinatorSettings settings_;
    core::ResultCache cache_;

    std::map<std::string, MonitorPtr> monitors_;
    mutable std::shared_mutex monitorsMutex_;
};

} // namespace netsentry::app
