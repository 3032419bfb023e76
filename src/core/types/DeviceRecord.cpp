#include "core/types/DeviceRecord.hpp"

#include <algorithm>
#include <cctype>

namespace netsentry::core {

std::string maskSecret(const std::string& secret) {
    if (secret.size() <= 4) {
        return secret.empty() ? "" : "****";
    }
    return secret.substr(0, 2) + std::string(secret.size() - 4, '*') +
           secret.substr(secret.size() - 2);
}

Credentials Credentials::maskedCopy() const {
    Credentials masked = *this;
    masked.snmpCommunity = maskSecret(snmpCommunity);
    masked.password = maskSecret(password);
    masked.apiToken = maskSecret(apiToken);
    masked.apiKey = maskSecret(apiKey);
    return masked;
}

bool DeviceRecord::isValid() const {
    return !id.empty() && !host.empty() && retryCount >= 1 && timeoutSeconds > 0;
}

bool DeviceRecord::hasProtocol(MonitorProtocol protocol) const {
    return std::find(enabledProtocols.begin(), enabledProtocols.end(), protocol) !=
           enabledProtocols.end();
}

MonitorProtocol DeviceRecord::preferredProtocol() const {
    for (auto protocol : {MonitorProtocol::Snmp, MonitorProtocol::Rest, MonitorProtocol::Ssh}) {
        if (hasProtocol(protocol)) {
            return protocol;
        }
    }
    return MonitorProtocol::Snmp;
}

std::string deviceTypeToString(DeviceType type) {
    switch (type) {
    case DeviceType::Router:
        return "router";
    case DeviceType::Switch:
        return "switch";
    case DeviceType::Firewall:
        return "firewall";
    case DeviceType::AccessPoint:
        return "access_point";
    case DeviceType::Server:
        return "server";
    case DeviceType::Generic:
        return "generic";
    case DeviceType::Unknown:
        return "unknown";
    }
    return "unknown";
}

DeviceType deviceTypeFromString(const std::string& str) {
    if (str == "router")
        return DeviceType::Router;
    if (str == "switch")
        return DeviceType::Switch;
    if (str == "firewall")
        return DeviceType::Firewall;
    if (str == "access_point")
        return DeviceType::AccessPoint;
    if (str == "server")
        return DeviceType::Server;
    if (str == "unknown")
        return DeviceType::Unknown;
    return DeviceType::Generic;
}

std::string protocolToString(MonitorProtocol protocol) {
    switch (protocol) {
    case MonitorProtocol::Snmp:
        return "snmp";
    case MonitorProtocol::Rest:
        return "rest";
    case MonitorProtocol::Ssh:
        return "ssh";
    }
    return "snmp";
}

std::optional<MonitorProtocol> protocolFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "snmp")
        return MonitorProtocol::Snmp;
    if (lower == "rest")
        return MonitorProtocol::Rest;
    if (lower == "ssh")
        return MonitorProtocol::Ssh;
    return std::nullopt;
}

} // namespace netsentry::core
