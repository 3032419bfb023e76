#include "core/types/DeviceStatus.hpp"

#include <algorithm>
#include <cctype>

namespace netsentry::core {

DeviceStatus DeviceStatus::unreachable(const std::string& deviceId, const std::string& message) {
    DeviceStatus status;
    status.deviceId = deviceId;
    status.reachable = false;
    status.lastSeen = std::chrono::system_clock::now();
    status.errorMessage = message.empty() ? "Device unreachable" : message;
    return status;
}

std::string interfaceStatusToString(InterfaceStatus status) {
    switch (status) {
    case InterfaceStatus::Up:
        return "up";
    case InterfaceStatus::Down:
        return "down";
    case InterfaceStatus::AdminDown:
        return "admin_down";
    case InterfaceStatus::Testing:
        return "testing";
    case InterfaceStatus::Unknown:
        return "unknown";
    }
    return "unknown";
}

InterfaceStatus interfaceStatusFromString(const std::string& str) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s == "up" || s == "active" || s == "enabled" || s == "true" || s == "1")
        return InterfaceStatus::Up;
    if (s == "down" || s == "inactive" || s == "disabled" || s == "false" || s == "0")
        return InterfaceStatus::Down;
    if (s == "admin_down" || s == "admin-down" || s == "administratively down" || s == "shutdown")
        return InterfaceStatus::AdminDown;
    if (s == "testing")
        return InterfaceStatus::Testing;
    return InterfaceStatus::Unknown;
}

InterfaceStatus interfaceStatusFromSnmp(int64_t code) {
    switch (code) {
    case 1:
        return InterfaceStatus::Up;
    case 2:
        return InterfaceStatus::Down;
    case 3:
        return InterfaceStatus::Testing;
    default:
        return InterfaceStatus::Unknown;
    }
}

} // namespace netsentry::core
