#include "core/services/IProtocolMonitor.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace netsentry::core {

std::optional<InterfaceInfo> IProtocolMonitor::getInterface(const std::string& name) {
    for (auto& iface : getInterfaces()) {
        if (iface.name == name) {
            return iface;
        }
    }
    return std::nullopt;
}

DeviceStatus IProtocolMonitor::getDeviceStatus() {
    const auto& deviceId = device().id;

    auto start = std::chrono::steady_clock::now();
    bool connected = false;
    std::string connectError;
    try {
        connected = testConnection();
    } catch (const std::exception& e) {
        connectError = e.what();
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    if (!connected) {
        spdlog::debug("Device {} unreachable over {}", deviceId, protocolToString(protocol()));
        return DeviceStatus::unreachable(deviceId, connectError);
    }

    DeviceStatus status;
    status.deviceId = deviceId;
    status.reachable = true;
    status.responseTimeMs =
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
    status.lastSeen = std::chrono::system_clock::now();

    std::string problems;
    try {
        auto health = getHealthMetrics();
        status.uptimeSeconds = health.uptimeSeconds;
        status.health = std::move(health);
    } catch (const std::exception& e) {
        spdlog::warn("Health query failed for {}: {}", deviceId, e.what());
        problems = std::string("health unavailable: ") + e.what();
    }

    try {
        status.interfaces = getInterfaces();
    } catch (const std::exception& e) {
        spdlog::warn("Interface query failed for {}: {}", deviceId, e.what());
        if (!problems.empty()) {
            problems += "; ";
        }
        problems += std::string("interfaces unavailable: ") + e.what();
    }

    if (!problems.empty()) {
        status.errorMessage = problems;
    }
    return status;
}

} // namespace netsentry::core
