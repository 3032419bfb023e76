#include "app/MonitoringCoordinator.hpp"

#include "core/util/Concurrency.hpp"

#include <spdlog/spdlog.h>

#include <fmt/format.h>

#include <array>
#include <mutex>

namespace netsentry::app {

namespace {

constexpr std::array<uint16_t, 3> FALLBACK_PORTS{22, 80, 443};

} // namespace

MonitoringCoordinator::MonitoringCoordinator(core::IDeviceRegistry& registry,
                                             core::IMonitorFactory& factory,
                                             core::IPingService& pingService,
                                             core::IPortScanner& portScanner,
                                             CoordinatorSettings settings,
                                             core::ResultCache::TimeSource now)
    : registry_(registry),
      factory_(factory),
      pingService_(pingService),
      portScanner_(portScanner),
      settings_(settings),
      cache_(settings.cacheTtl, std::move(now)) {
    rebuildMonitors();
}

void MonitoringCoordinator::rebuildMonitors() {
    std::map<std::string, MonitorPtr> monitors;
    for (const auto& device : registry_.getAllDevices()) {
        try {
            monitors[device.id] = factory_.createMonitor(device);
        } catch (const std::exception& e) {
            spdlog::error("Failed to create monitor for {}: {}", device.id, e.what());
        }
    }

    size_t count = monitors.size();
    {
        std::unique_lock lock(monitorsMutex_);
        monitors_.swap(monitors);
    }
    cache_.clear();
    spdlog::info("Monitoring {} device(s)", count);
}

MonitoringCoordinator::MonitorPtr MonitoringCoordinator::findMonitor(
    const std::string& deviceId) const {
    std::shared_lock lock(monitorsMutex_);
    auto it = monitors_.find(deviceId);
    return it == monitors_.end() ? nullptr : it->second;
}

template <typename Fn>
auto MonitoringCoordinator::retry(const core::DeviceRecord& device, Fn&& fn) -> decltype(fn()) {
    core::RetryPolicy policy;
    policy.attempts = device.retryCount;
    policy.baseDelay = settings_.retryBaseDelay;
    return core::withRetry(std::forward<Fn>(fn), policy);
}

std::optional<core::DeviceStatus> MonitoringCoordinator::getDeviceStatus(
    const std::string& deviceId) {
    auto monitor = findMonitor(deviceId);
    if (!monitor) {
        return std::nullopt;
    }

    if (auto cached = cache_.get<core::DeviceStatus>(deviceId, core::ResultKind::Status)) {
        spdlog::debug("Status cache hit for {}", deviceId);
        return cached;
    }

    core::DeviceStatus status;
    try {
        status = retry(monitor->device(), [&monitor]() {
            auto result = monitor->getDeviceStatus();
            if (!result.reachable) {
                throw MonitorError(result.errorMessage.value_or("Device unreachable"));
            }
            return result;
        });
    } catch (const std::exception& e) {
        spdlog::warn("Device {} unreachable: {}", deviceId, e.what());
        status = core::DeviceStatus::unreachable(deviceId, e.what());
    }

    cache_.put(deviceId, core::ResultKind::Status, status);
    return status;
}

std::optional<std::vector<core::InterfaceInfo>> MonitoringCoordinator::getDeviceInterfaces(
    const std::string& deviceId) {
    auto monitor = findMonitor(deviceId);
    if (!monitor) {
        return std::nullopt;
    }

    if (auto cached =
            cache_.get<std::vector<core::InterfaceInfo>>(deviceId, core::ResultKind::Interfaces)) {
        return cached;
    }

    auto interfaces = retry(monitor->device(), [&monitor]() { return monitor->getInterfaces(); });
    cache_.put(deviceId, core::ResultKind::Interfaces, interfaces);
    return interfaces;
}

std::optional<core::InterfaceInfo> MonitoringCoordinator::getDeviceInterface(
    const std::string& deviceId, const std::string& name) {
    auto interfaces = getDeviceInterfaces(deviceId);
    if (!interfaces) {
        return std::nullopt;
    }
    for (const auto& iface : *interfaces) {
        if (iface.name == name) {
            return iface;
        }
    }
    return std::nullopt;
}

std::optional<core::DeviceHealth> MonitoringCoordinator::getDeviceHealth(
    const std::string& deviceId) {
    auto monitor = findMonitor(deviceId);
    if (!monitor) {
        return std::nullopt;
    }

    if (auto cached = cache_.get<core::DeviceHealth>(deviceId, core::ResultKind::Health)) {
        return cached;
    }

    auto health = retry(monitor->device(), [&monitor]() { return monitor->getHealthMetrics(); });
    cache_.put(deviceId, core::ResultKind::Health, health);
    return health;
}

std::map<std::string, core::DeviceStatus> MonitoringCoordinator::getMultipleDeviceStatus(
    const std::vector<std::string>& deviceIds) {
    std::map<std::string, core::DeviceStatus> results;
    std::mutex resultsMutex;

    core::forEachBounded(deviceIds, settings_.maxConcurrentQueries,
                         [&](const std::string& deviceId) {
                             auto status = getDeviceStatus(deviceId);
                             if (!status) {
                                 return;
                             }
                             std::lock_guard lock(resultsMutex);
                             results[deviceId] = std::move(*status);
                         });

    return results;
}

std::map<std::string, core::DeviceStatus> MonitoringCoordinator::getAllDeviceStatus() {
    return getMultipleDeviceStatus(deviceIds());
}

std::optional<core::PingCheck> MonitoringCoordinator::pingDevice(const std::string& deviceId) {
    auto monitor = findMonitor(deviceId);
    if (!monitor) {
        return std::nullopt;
    }

    const auto& device = monitor->device();
    auto timeout = std::chrono::milliseconds(device.timeoutSeconds * 1000);

    core::PingCheck check;
    auto reply = pingService_.pingAsync(device.host, timeout).get();
    if (reply.success) {
        check.success = true;
        check.responseTimeMs = reply.latencyMs();
        check.output = fmt::format("Reply from {}: time={:.2f} ms", device.host, reply.latencyMs());
        if (reply.ttl) {
            check.output += fmt::format(" ttl={}", *reply.ttl);
        }
        return check;
    }

    spdlog::debug("ICMP ping to {} failed ({}), trying TCP", device.host, reply.errorMessage);
    for (auto port : FALLBACK_PORTS) {
        auto start = std::chrono::steady_clock::now();
        auto state = portScanner_.probe(device.host, port, timeout);
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (state == core::PortState::Open) {
            check.success = true;
            check.responseTimeMs =
                std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
            check.output = fmt::format("TCP connect to {}:{} succeeded in {:.2f} ms (ICMP: {})",
                                       device.host, port, *check.responseTimeMs,
                                       reply.errorMessage);
            return check;
        }
    }

    check.output = fmt::format("No reply from {}: {}", device.host,
                               reply.errorMessage.empty() ? "Request timed out" : reply.errorMessage);
    return check;
}

std::optional<bool> MonitoringCoordinator::testDeviceConnection(const std::string& deviceId) {
    auto monitor = findMonitor(deviceId);
    if (!monitor) {
        return std::nullopt;
    }

    try {
        return monitor->testConnection();
    } catch (const std::exception& e) {
        spdlog::warn("Connection test for {} failed: {}", deviceId, e.what());
        return false;
    }
}

void MonitoringCoordinator::reloadDevices() {
    registry_.reload();
    rebuildMonitors();
}

void MonitoringCoordinator::clearCache(const std::optional<std::string>& deviceId) {
    if (deviceId) {
        cache_.clearDevice(*deviceId);
        spdlog::debug("Cleared cache for {}", *deviceId);
    } else {
        cache_.clear();
        spdlog::debug("Cleared result cache");
    }
}

std::vector<std::string> MonitoringCoordinator::deviceIds() const {
    std::shared_lock lock(monitorsMutex_);
    std::vector<std::string> ids;
    ids.reserve(monitors_.size());
    for (const auto& [id, monitor] : monitors_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace netsentry::app
