#pragma once

#include "core/discovery/DeviceClassifier.hpp"
#include "core/services/IDeviceRegistry.hpp"
#include "core/services/INetworkScanner.hpp"
#include "core/services/IScanResultStore.hpp"
#include "core/types/ScanJob.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace netsentry::app {

/**
 * @brief Tunables of the scan lifecycle manager.
 */
struct ScanManagerSettings {
    std::chrono::seconds failedScanGrace{300}; ///< Failed jobs stay this long in the active table
    uint64_t maxNetworkAddresses{1024};        ///< Largest network accepted by startScan()
    size_t maxSweepHosts{1000};                ///< Ceiling on enumerated addresses
    int historyLimit{50};                      ///< Default history size
};

/**
 * @brief A discovered device that could not be registered.
 */
struct FailedDevice {
    std::string ip;    ///< Address of the device
    std::string error; ///< Why registration failed
};

/**
 * @brief Outcome of promoting a scan's devices into the registry.
 */
struct AutoAddResult {
    std::vector<std::string> added;  ///< Ids of registered devices
    std::vector<FailedDevice> failed; ///< Devices that were rejected
    int totalDiscovered{0};           ///< Devices in the scan
};

/**
 * @brief Runs discovery scans in the background and tracks their jobs.
 *
 * startScan() validates the request, persists a running job and starts a
 * worker thread, then returns the scan id. The worker drives the network
 * scanner, classifies the live hosts and finishes the job as completed or
 * failed. Completed jobs leave the active table once persisted; failed jobs
 * linger for a grace period so pollers can observe the failure.
 *
 * Every active job has its own lock; the table lock is held only while the
 * table itself changes.
 */
class ScanLifecycleManager {
public:
    /**
     * @brief Constructs the manager.
     * @param scanner Host discovery and enrichment.
     * @param store Durable job records.
     * @param registry Receives devices promoted by autoAddDevicesFromScan().
     * @param settings Limits and timings.
     */
    ScanLifecycleManager(core::INetworkScanner& scanner, core::IScanResultStore& store,
                         core::IDeviceRegistry& registry, ScanManagerSettings settings = {});

    /**
     * @brief Waits for running scans (see shutdown()).
     */
    ~ScanLifecycleManager();

    ScanLifecycleManager(const ScanLifecycleManager&) = delete;
    ScanLifecycleManager& operator=(const ScanLifecycleManager&) = delete;

    /**
     * @brief Starts a scan.
     * @param network CIDR to scan.
     * @param scanType Depth of the scan.
     * @param options Ports, communities, timeouts and concurrency.
     * @return Identifier of the new job.
     * @throws std::invalid_argument for a malformed or oversized network or bad options.
     * @throws std::runtime_error if the job cannot be persisted or the manager is shut down.
     */
    std::string startScan(const std::string& network, core::ScanType scanType,
                          const core::ScanOptions& options);

    /**
     * @brief Looks up a job, active ones first.
     * @param scanId Job identifier.
     * @return Snapshot of the job, or std::nullopt if unknown.
     */
    std::optional<core::ScanJob> getScanStatus(const std::string& scanId);

    /**
     * @brief Returns the devices found by a scan.
     * @param scanId Job identifier.
     * @return Devices (empty while running), or std::nullopt if unknown.
     */
    std::optional<std::vector<core::DiscoveredDevice>> getScanResults(const std::string& scanId);

    /**
     * @brief Lists active and persisted jobs, newest first, without duplicates.
     * @param limit Maximum entries; 0 or less uses the configured default.
     */
    std::vector<core::ScanJob> getScanHistory(int limit = 0);

    /**
     * @brief Blocks until a job reaches a terminal state.
     * @param scanId Job identifier.
     * @param timeout Maximum wait.
     * @return The job as last observed, or std::nullopt if unknown.
     */
    std::optional<core::ScanJob> waitForScan(const std::string& scanId,
                                             std::chrono::milliseconds timeout);

    /**
     * @brief Deletes a finished job.
     * @param scanId Job identifier.
     * @return True if a record was removed. Running jobs are not deleted.
     */
    bool deleteScanResult(const std::string& scanId);

    /**
     * @brief Deletes persisted jobs older than a number of days.
     * @param olderThanDays Age threshold.
     * @return Number of records removed.
     * @throws std::invalid_argument if olderThanDays is negative.
     */
    int cleanupOldResults(int olderThanDays);

    /**
     * @brief Registers every device found by a completed scan.
     *
     * Each device is added independently; rejected devices are reported in
     * AutoAddResult::failed and do not stop the others.
     *
     * @param scanId Job identifier.
     * @return Added ids and failures.
     * @throws std::invalid_argument if the scan is unknown or not completed.
     */
    AutoAddResult autoAddDevicesFromScan(const std::string& scanId);

    /**
     * @brief Stops accepting scans and joins all worker threads.
     *
     * Workers in their failure grace period are woken early.
     */
    void shutdown();

    /**
     * @brief Number of jobs in the active table.
     */
    size_t activeScanCount() const;

    /**
     * @brief Builds the registry id of a discovered device.
     *
     * "<name>-<ip>" lower-cased, spaces and dots replaced by '-', other
     * characters outside [a-z0-9-] dropped, prefixed with "device-" unless
     * it starts with a letter, then suffixed with "-<unix seconds>".
     *
     * @param device Discovered device (name is the hostname or the IP).
     * @param now Timestamp used for the suffix.
     */
    static std::string deviceIdFor(const core::DiscoveredDevice& device,
                                   std::chrono::system_clock::time_point now);

    /**
     * @brief Converts a discovered device into a registry record.
     * @param device Discovered device.
     * @param scanId Scan that found it.
     * @param now Timestamp used for the id.
     */
    static core::DeviceRecord toDeviceRecord(const core::DiscoveredDevice& device,
                                             const std::string& scanId,
                                             std::chrono::system_clock::time_point now);

private:
    struct ActiveScan {
        std::mutex mutex;
        core::ScanJob job;
    };

    void runScan(std::shared_ptr<ActiveScan> scan, core::ScanOptions options);
    void performScan(ActiveScan& scan, const core::ScanOptions& options);
    std::vector<core::DiscoveredDevice> buildDevices(
        const core::NetworkScanResult& result,
        const std::map<std::string, core::HostEnrichment>& enrichment) const;
    core::ScanJob finish(ActiveScan& scan, core::ScanStatus status,
                         std::optional<std::string> error);
    bool persist(const core::ScanJob& job);
    void evict(const std::string& scanId);
    void workerFinished();

    static std::string generateScanId();

    core::INetworkScanner& scanner_;
    core::IScanResultStore& store_;
    core::IDeviceRegistry& registry_;
    ScanManagerSettings settings_;
    core::DeviceClassifier classifier_;

    std::map<std::string, std::shared_ptr<ActiveScan>> active_;
    mutable std::mutex activeMutex_;
    std::condition_variable stateChanged_;
    bool stopping_{false};
    int runningWorkers_{0};
};

} // namespace netsentry::app
