#include "core/types/ScanJob.hpp"

namespace netsentry::core {

std::set<uint16_t> NetworkScanResult::openPorts(const std::string& address) const {
    std::set<uint16_t> open;
    auto it = portResults.find(address);
    if (it == portResults.end()) {
        return open;
    }
    for (const auto& [port, isOpen] : it->second) {
        if (isOpen) {
            open.insert(port);
        }
    }
    return open;
}

DiscoveredDevice DiscoveredDevice::maskedCopy() const {
    DiscoveredDevice masked = *this;
    if (masked.snmpCommunity) {
        masked.snmpCommunity = maskSecret(*masked.snmpCommunity);
    }
    return masked;
}

ScanJob ScanJob::maskedCopy() const {
    ScanJob masked = *this;
    for (auto& device : masked.discoveredDevices) {
        device = device.maskedCopy();
    }
    return masked;
}

std::string scanTypeToString(ScanType type) {
    switch (type) {
    case ScanType::Ping:
        return "ping";
    case ScanType::Port:
        return "port";
    case ScanType::Full:
        return "full";
    }
    return "ping";
}

std::optional<ScanType> scanTypeFromString(const std::string& str) {
    if (str == "ping")
        return ScanType::Ping;
    if (str == "port")
        return ScanType::Port;
    if (str == "full")
        return ScanType::Full;
    return std::nullopt;
}

std::string scanStatusToString(ScanStatus status) {
    switch (status) {
    case ScanStatus::Pending:
        return "pending";
    case ScanStatus::Running:
        return "running";
    case ScanStatus::Completed:
        return "completed";
    case ScanStatus::Failed:
        return "failed";
    }
    return "pending";
}

std::optional<ScanStatus> scanStatusFromString(const std::string& str) {
    if (str == "pending")
        return ScanStatus::Pending;
    if (str == "running")
        return ScanStatus::Running;
    if (str == "completed")
        return ScanStatus::Completed;
    if (str == "failed")
        return ScanStatus::Failed;
    return std::nullopt;
}

} // namespace netsentry::core
