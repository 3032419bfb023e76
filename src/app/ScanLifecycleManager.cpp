#include "app/ScanLifecycleManager.hpp"

#include "core/types/CidrRange.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <random>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace netsentry::app {

ScanLifecycleManager::ScanLifecycleManager(core::INetworkScanner& scanner,
                                           core::IScanResultStore& store,
                                           core::IDeviceRegistry& registry,
                                           ScanManagerSettings settings)
    : scanner_(scanner), store_(store), registry_(registry), settings_(settings) {}

ScanLifecycleManager::~ScanLifecycleManager() {
    shutdown();
}

std::string ScanLifecycleManager::generateScanId() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t high = rng();
    uint64_t low = rng();

    // RFC 4122 version 4, variant 1
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", high >> 32, (high >> 16) & 0xFFFF,
                       high & 0xFFFF, low >> 48, low & 0xFFFFFFFFFFFFULL);
}

std::string ScanLifecycleManager::startScan(const std::string& network, core::ScanType scanType,
                                            const core::ScanOptions& options) {
    auto range = core::CidrRange::parse(network);
    if (range.addressCount() > settings_.maxNetworkAddresses) {
        throw std::invalid_argument(fmt::format("Network {} is too large ({} addresses, max {})",
                                                range.toString(), range.addressCount(),
                                                settings_.maxNetworkAddresses));
    }
    if (options.timeoutSeconds < 1) {
        throw std::invalid_argument("Scan timeout must be at least one second");
    }
    if (options.maxConcurrent < 1) {
        throw std::invalid_argument("Scan concurrency must be at least 1");
    }
    if (scanType != core::ScanType::Ping) {
        if (options.ports.empty()) {
            throw std::invalid_argument("Port scans need at least one port");
        }
        if (std::find(options.ports.begin(), options.ports.end(), 0) != options.ports.end()) {
            throw std::invalid_argument("Port 0 cannot be scanned");
        }
    }

    {
        std::lock_guard lock(activeMutex_);
        if (stopping_) {
            throw std::runtime_error("Scan manager is shutting down");
        }
    }

    auto scan = std::make_shared<ActiveScan>();
    auto& job = scan->job;
    job.scanId = generateScanId();
    job.network = range.toString();
    job.scanType = scanType;
    job.status = core::ScanStatus::Running;
    job.startedAt = std::chrono::system_clock::now();
    job.totalHosts = static_cast<int>(
        std::min<uint64_t>(range.hostCount(), static_cast<uint64_t>(settings_.maxSweepHosts)));

    // A crash from here on leaves a running record that is read back as failed.
    store_.save(job);

    auto scanId = job.scanId;
    {
        std::lock_guard lock(activeMutex_);
        if (stopping_) {
            throw std::runtime_error("Scan manager is shutting down");
        }
        active_[scanId] = scan;
        ++runningWorkers_;
    }

    try {
        std::thread(&ScanLifecycleManager::runScan, this, scan, options).detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard lock(activeMutex_);
            active_.erase(scanId);
            --runningWorkers_;
        }
        stateChanged_.notify_all();
        throw std::runtime_error(std::string("Failed to start scan worker: ") + e.what());
    }

    spdlog::info("Started {} scan {} of {}", core::scanTypeToString(scanType), scanId,
                 job.network);
    return scanId;
}

void ScanLifecycleManager::runScan(std::shared_ptr<ActiveScan> scan, core::ScanOptions options) {
    std::string scanId;
    {
        std::lock_guard lock(scan->mutex);
        scanId = scan->job.scanId;
    }

    core::ScanJob finished;
    try {
        performScan(*scan, options);
        finished = finish(*scan, core::ScanStatus::Completed, std::nullopt);
        spdlog::info("Scan {} completed: {} device(s) found", scanId,
                     finished.discoveredDevices.size());
    } catch (const std::exception& e) {
        spdlog::error("Scan {} failed: {}", scanId, e.what());
        finished = finish(*scan, core::ScanStatus::Failed, std::string(e.what()));
    }

    bool persisted = persist(finished);
    if (!persisted || finished.status == core::ScanStatus::Failed) {
        std::unique_lock lock(activeMutex_);
        stateChanged_.wait_for(lock, settings_.failedScanGrace, [this]() { return stopping_; });
    }

    evict(scanId);
    workerFinished();
}

void ScanLifecycleManager::performScan(ActiveScan& scan, const core::ScanOptions& options) {
    core::ScanType scanType;
    core::DiscoveryRequest request;
    {
        std::lock_guard lock(scan.mutex);
        scanType = scan.job.scanType;
        request.network = scan.job.network;
    }
    request.scanPorts = scanType != core::ScanType::Ping;
    request.ports = options.ports;
    request.timeout = std::chrono::seconds(options.timeoutSeconds);
    request.maxConcurrent = options.maxConcurrent;
    request.maxHosts = settings_.maxSweepHosts;
    request.onProgress = [&scan](int scanned, int total) {
        std::lock_guard lock(scan.mutex);
        scan.job.scannedHosts = scanned;
        if (total > 0) {
            scan.job.totalHosts = total;
        }
    };

    auto result = scanner_.discoverHosts(request, options.useExternalTool);

    std::map<std::string, core::HostEnrichment> enrichment;
    if (scanType == core::ScanType::Full && !result.aliveHosts.empty()) {
        std::vector<std::string> addresses;
        addresses.reserve(result.aliveHosts.size());
        for (const auto& host : result.aliveHosts) {
            addresses.push_back(host.address);
        }
        enrichment = scanner_.enrichHosts(addresses, options.snmpCommunities, request.timeout,
                                          options.maxConcurrent);
    }

    auto devices = buildDevices(result, enrichment);

    std::lock_guard lock(scan.mutex);
    if (result.totalHosts > 0) {
        scan.job.totalHosts = result.totalHosts;
    }
    scan.job.scannedHosts = scan.job.totalHosts;
    scan.job.discoveredDevices = std::move(devices);
}

std::vector<core::DiscoveredDevice> ScanLifecycleManager::buildDevices(
    const core::NetworkScanResult& result,
    const std::map<std::string, core::HostEnrichment>& enrichment) const {
    std::vector<core::DiscoveredDevice> devices;
    devices.reserve(result.aliveHosts.size());

    for (const auto& host : result.aliveHosts) {
        core::DiscoveredDevice device;
        device.ip = host.address;
        device.hostname = host.hostname;
        device.responseTimeMs = host.responseTimeMs;
        device.openPorts = result.openPorts(host.address);

        auto it = enrichment.find(host.address);
        if (it != enrichment.end()) {
            if (it->second.hostname) {
                device.hostname = it->second.hostname;
            }
            if (it->second.snmp) {
                device.systemDescription = it->second.snmp->systemDescription;
                device.snmpCommunity = it->second.snmp->community;
            }
        }

        auto classification = classifier_.classify(device.openPorts, device.systemDescription);
        device.deviceType = classification.deviceType;
        device.suggestedProtocols = std::move(classification.suggestedProtocols);
        device.confidenceScore = classification.confidenceScore;
        devices.push_back(std::move(device));
    }

    std::sort(devices.begin(), devices.end(), [](const auto& a, const auto& b) {
        uint32_t left = 0;
        uint32_t right = 0;
        if (core::parseIpv4(a.ip, left) && core::parseIpv4(b.ip, right)) {
            return left < right;
        }
        return a.ip < b.ip;
    });
    return devices;
}

core::ScanJob ScanLifecycleManager::finish(ActiveScan& scan, core::ScanStatus status,
                                           std::optional<std::string> error) {
    core::ScanJob snapshot;
    {
        std::lock_guard lock(scan.mutex);
        if (!scan.job.isTerminal()) {
            scan.job.status = status;
            scan.job.errorMessage = std::move(error);
            scan.job.completedAt = std::chrono::system_clock::now();
        }
        snapshot = scan.job;
    }
    // Pairs with the predicate of waitForScan().
    {
        std::lock_guard lock(activeMutex_);
    }
    stateChanged_.notify_all();
    return snapshot;
}

bool ScanLifecycleManager::persist(const core::ScanJob& job) {
    try {
        store_.save(job);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to persist scan {}: {}", job.scanId, e.what());
        return false;
    }
}

void ScanLifecycleManager::evict(const std::string& scanId) {
    {
        std::lock_guard lock(activeMutex_);
        active_.erase(scanId);
    }
    stateChanged_.notify_all();
    spdlog::debug("Scan {} left the active table", scanId);
}

void ScanLifecycleManager::workerFinished() {
    std::lock_guard lock(activeMutex_);
    --runningWorkers_;
    stateChanged_.notify_all();
}

std::optional<core::ScanJob> ScanLifecycleManager::getScanStatus(const std::string& scanId) {
    std::shared_ptr<ActiveScan> scan;
    {
        std::lock_guard lock(activeMutex_);
        auto it = active_.find(scanId);
        if (it != active_.end()) {
            scan = it->second;
        }
    }
    if (scan) {
        std::lock_guard lock(scan->mutex);
        return scan->job;
    }
    return store_.findById(scanId);
}

std::optional<std::vector<core::DiscoveredDevice>> ScanLifecycleManager::getScanResults(
    const std::string& scanId) {
    auto job = getScanStatus(scanId);
    if (!job) {
        return std::nullopt;
    }
    return job->discoveredDevices;
}

std::vector<core::ScanJob> ScanLifecycleManager::getScanHistory(int limit) {
    if (limit <= 0) {
        limit = settings_.historyLimit;
    }

    std::vector<std::shared_ptr<ActiveScan>> activeScans;
    {
        std::lock_guard lock(activeMutex_);
        for (const auto& [id, scan] : active_) {
            activeScans.push_back(scan);
        }
    }

    std::map<std::string, core::ScanJob> merged;
    for (const auto& scan : activeScans) {
        std::lock_guard lock(scan->mutex);
        merged.emplace(scan->job.scanId, scan->job);
    }
    for (auto& job : store_.findAll(limit)) {
        merged.emplace(job.scanId, std::move(job));
    }

    std::vector<core::ScanJob> history;
    history.reserve(merged.size());
    for (auto& [id, job] : merged) {
        history.push_back(std::move(job));
    }
    std::sort(history.begin(), history.end(),
              [](const auto& a, const auto& b) { return a.startedAt > b.startedAt; });
    if (history.size() > static_cast<size_t>(limit)) {
        history.resize(static_cast<size_t>(limit));
    }
    return history;
}

std::optional<core::ScanJob> ScanLifecycleManager::waitForScan(const std::string& scanId,
                                                               std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    {
        std::unique_lock lock(activeMutex_);
        stateChanged_.wait_until(lock, deadline, [this, &scanId]() {
            auto it = active_.find(scanId);
            if (it == active_.end()) {
                return true;
            }
            std::lock_guard jobLock(it->second->mutex);
            return it->second->job.isTerminal();
        });
    }
    return getScanStatus(scanId);
}

bool ScanLifecycleManager::deleteScanResult(const std::string& scanId) {
    bool removedActive = false;
    {
        std::lock_guard lock(activeMutex_);
        auto it = active_.find(scanId);
        if (it != active_.end()) {
            std::lock_guard jobLock(it->second->mutex);
            if (!it->second->job.isTerminal()) {
                spdlog::warn("Scan {} is still running and cannot be deleted", scanId);
                return false;
            }
            active_.erase(it);
            removedActive = true;
        }
    }

    bool removedStored = store_.remove(scanId);
    if (removedActive || removedStored) {
        spdlog::info("Deleted scan {}", scanId);
    }
    return removedActive || removedStored;
}

int ScanLifecycleManager::cleanupOldResults(int olderThanDays) {
    if (olderThanDays < 0) {
        throw std::invalid_argument("Retention must not be negative");
    }
    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * olderThanDays);
    return store_.removeOlderThan(cutoff);
}

std::string ScanLifecycleManager::deviceIdFor(const core::DiscoveredDevice& device,
                                              std::chrono::system_clock::time_point now) {
    std::string base;
    for (char c : device.hostname.value_or(device.ip) + "-" + device.ip) {
        auto ch = static_cast<unsigned char>(c);
        if (c == ' ' || c == '.') {
            base.push_back('-');
        } else if (std::isalnum(ch) || c == '-') {
            base.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    if (base.empty() || !std::isalpha(static_cast<unsigned char>(base.front()))) {
        base = "device-" + base;
    }

    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return fmt::format("{}-{}", base, seconds);
}

core::DeviceRecord ScanLifecycleManager::toDeviceRecord(const core::DiscoveredDevice& device,
                                                        const std::string& scanId,
                                                        std::chrono::system_clock::time_point now) {
    core::DeviceRecord record;
    record.id = deviceIdFor(device, now);
    record.name = device.hostname.value_or(device.ip);
    record.host = device.ip;
    record.deviceType = device.deviceType == core::DeviceType::Unknown ? core::DeviceType::Generic
                                                                       : device.deviceType;
    record.description = "Auto-discovered from scan " + scanId;
    record.credentials.snmpCommunity = device.snmpCommunity.value_or("public");
    record.credentials.snmpVersion = core::SnmpVersion::V2c;
    record.timeoutSeconds = 10;
    record.retryCount = 3;

    record.enabledProtocols.clear();
    for (const auto& name : device.suggestedProtocols) {
        if (auto protocol = core::protocolFromString(name)) {
            record.enabledProtocols.push_back(*protocol);
        }
    }
    if (record.enabledProtocols.empty()) {
        record.enabledProtocols.push_back(core::MonitorProtocol::Snmp);
    }

    if (device.openPorts.count(80) == 0 && device.openPorts.count(8080) > 0) {
        record.restPort = 8080;
    }
    return record;
}

AutoAddResult ScanLifecycleManager::autoAddDevicesFromScan(const std::string& scanId) {
    auto job = getScanStatus(scanId);
    if (!job) {
        throw std::invalid_argument("Scan not found: " + scanId);
    }
    if (job->status != core::ScanStatus::Completed) {
        throw std::invalid_argument("Scan not completed: " + scanId);
    }

    AutoAddResult result;
    result.totalDiscovered = static_cast<int>(job->discoveredDevices.size());
    auto now = std::chrono::system_clock::now();

    for (const auto& device : job->discoveredDevices) {
        try {
            auto record = toDeviceRecord(device, scanId, now);
            registry_.addDevice(record);
            result.added.push_back(record.id);
        } catch (const std::exception& e) {
            spdlog::warn("Could not add discovered device {}: {}", device.ip, e.what());
            result.failed.push_back({device.ip, e.what()});
        }
    }

    spdlog::info("Auto-add from scan {}: {} added, {} failed", scanId, result.added.size(),
                 result.failed.size());
    return result;
}

void ScanLifecycleManager::shutdown() {
    std::unique_lock lock(activeMutex_);
    if (!stopping_) {
        stopping_ = true;
        spdlog::debug("Waiting for {} scan worker(s)", runningWorkers_);
    }
    stateChanged_.notify_all();
    stateChanged_.wait(lock, [this]() { return runningWorkers_ == 0; });
}

size_t ScanLifecycleManager::activeScanCount() const {
    std::lock_guard lock(activeMutex_);
    return active_.size();
}

} // namespace netsentry::app
