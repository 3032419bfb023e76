#include "infrastructure/serialization/JsonConvert.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace netsentry::core {

using json = nlohmann::json;

namespace {

template <typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
std::optional<T> getOptional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

} // namespace

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    auto millis = toEpochMillis(time);
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    int fraction = static_cast<int>(millis % 1000);
    if (fraction < 0) {
        fraction += 1000;
        --seconds;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0')
       << fraction << "Z";
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text) {
    std::tm utc{};
    std::istringstream ss(text);
    ss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    int64_t millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        if (digits.empty()) {
            return std::nullopt;
        }
        digits.resize(3, '0');
        millis = std::stoll(digits);
    }

    std::time_t seconds = timegm(&utc);
    return fromEpochMillis(static_cast<int64_t>(seconds) * 1000 + millis);
}

int64_t toEpochMillis(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t millis) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(millis)));
}

void to_json(json& j, const DiscoveredDevice& device) {
    j = json{{"ip", device.ip},
             {"open_ports", device.openPorts},
             {"suggested_protocols", device.suggestedProtocols},
             {"device_type", deviceTypeToString(device.deviceType)},
             {"confidence_score", device.confidenceScore}};
    putOptional(j, "hostname", device.hostname);
    putOptional(j, "response_time", device.responseTimeMs);
    putOptional(j, "system_description", device.systemDescription);
    putOptional(j, "snmp_community", device.snmpCommunity);
}

void from_json(const json& j, DiscoveredDevice& device) {
    device.ip = j.at("ip").get<std::string>();
    device.hostname = getOptional<std::string>(j, "hostname");
    device.responseTimeMs = getOptional<double>(j, "response_time");
    device.openPorts = j.value("open_ports", std::set<uint16_t>{});
    device.suggestedProtocols = j.value("suggested_protocols", std::vector<std::string>{});
    device.systemDescription = getOptional<std::string>(j, "system_description");
    auto type = j.value("device_type", std::string("unknown"));
    device.deviceType = type == "unknown" ? DeviceType::Unknown : deviceTypeFromString(type);
    device.snmpCommunity = getOptional<std::string>(j, "snmp_community");
    device.confidenceScore = j.value("confidence_score", 0.0);
}

void to_json(json& j, const ScanJob& job) {
    j = json{{"scan_id", job.scanId},
             {"network", job.network},
             {"scan_type", scanTypeToString(job.scanType)},
             {"status", scanStatusToString(job.status)},
             {"started_at", formatTimestamp(job.startedAt)},
             {"total_hosts", job.totalHosts},
             {"scanned_hosts", job.scannedHosts},
             {"devices_found", job.discoveredDevices.size()},
             {"discovered_devices", job.discoveredDevices}};
    if (job.completedAt) {
        j["completed_at"] = formatTimestamp(*job.completedAt);
    } else {
        j["completed_at"] = nullptr;
    }
    putOptional(j, "error_message", job.errorMessage);
}

void from_json(const json& j, ScanJob& job) {
    job.scanId = j.at("scan_id").get<std::string>();
    job.network = j.at("network").get<std::string>();

    auto type = scanTypeFromString(j.at("scan_type").get<std::string>());
    auto status = scanStatusFromString(j.at("status").get<std::string>());
    if (!type || !status) {
        throw std::invalid_argument("Unknown scan type or status in scan " + job.scanId);
    }
    job.scanType = *type;
    job.status = *status;

    auto started = parseTimestamp(j.at("started_at").get<std::string>());
    if (!started) {
        throw std::invalid_argument("Invalid started_at in scan " + job.scanId);
    }
    job.startedAt = *started;
    job.completedAt.reset();
    if (auto completed = getOptional<std::string>(j, "completed_at")) {
        job.completedAt = parseTimestamp(*completed);
    }

    job.totalHosts = j.value("total_hosts", 0);
    job.scannedHosts = j.value("scanned_hosts", 0);
    job.discoveredDevices = j.value("discovered_devices", std::vector<DiscoveredDevice>{});
    job.errorMessage = getOptional<std::string>(j, "error_message");
}

void to_json(json& j, const InterfaceInfo& iface) {
    j = json{{"name", iface.name},
             {"description", iface.description},
             {"status", interfaceStatusToString(iface.status)},
             {"admin_status", interfaceStatusToString(iface.adminStatus)},
             {"ip_addresses", iface.ipAddresses}};
    putOptional(j, "speed_mbps", iface.speedMbps);
    putOptional(j, "mtu", iface.mtu);
    putOptional(j, "mac_address", iface.macAddress);
    putOptional(j, "in_octets", iface.inOctets);
    putOptional(j, "out_octets", iface.outOctets);
    putOptional(j, "in_errors", iface.inErrors);
    putOptional(j, "out_errors", iface.outErrors);
    putOptional(j, "last_change_seconds", iface.lastChangeSeconds);
}

void to_json(json& j, const DeviceHealth& health) {
    j = json::object();
    putOptional(j, "cpu_percent", health.cpuPercent);
    putOptional(j, "memory_percent", health.memoryPercent);
    putOptional(j, "memory_total_mb", health.memoryTotalMb);
    putOptional(j, "memory_used_mb", health.memoryUsedMb);
    putOptional(j, "temperature_celsius", health.temperatureCelsius);
    putOptional(j, "uptime_seconds", health.uptimeSeconds);
    putOptional(j, "load_average", health.loadAverage);
    putOptional(j, "disk_usage_percent", health.diskUsagePercent);
}

void to_json(json& j, const DeviceInfo& info) {
    j = json{{"description", info.description},
             {"name", info.name},
             {"location", info.location},
             {"contact", info.contact},
             {"object_id", info.objectId}};
    putOptional(j, "uptime_seconds", info.uptimeSeconds);
}

void to_json(json& j, const DeviceStatus& status) {
    j = json{{"device_id", status.deviceId},
             {"reachable", status.reachable},
             {"last_seen", formatTimestamp(status.lastSeen)}};
    putOptional(j, "response_time_ms", status.responseTimeMs);
    putOptional(j, "error_message", status.errorMessage);
    putOptional(j, "health", status.health);
    putOptional(j, "interfaces", status.interfaces);
    putOptional(j, "uptime_seconds", status.uptimeSeconds);
}

void to_json(json& j, const PingCheck& check) {
    j = json{{"success", check.success}, {"output", check.output}};
    putOptional(j, "response_time_ms", check.responseTimeMs);
}

void to_json(json& j, const Credentials& credentials) {
    j = json{{"snmp_community", credentials.snmpCommunity},
             {"snmp_version", snmpVersionToString(credentials.snmpVersion)},
             {"username", credentials.username},
             {"password", credentials.password},
             {"ssh_key", credentials.sshKey},
             {"api_token", credentials.apiToken},
             {"api_key", credentials.apiKey}};
}

void to_json(json& j, const DeviceRecord& device) {
    std::vector<std::string> protocols;
    for (auto protocol : device.enabledProtocols) {
        protocols.push_back(protocolToString(protocol));
    }
    j = json{{"id", device.id},
             {"name", device.name},
             {"host", device.host},
             {"device_type", deviceTypeToString(device.deviceType)},
             {"description", device.description},
             {"enabled_protocols", protocols},
             {"timeout", device.timeoutSeconds},
             {"retry_count", device.retryCount},
             {"rest_port", device.restPort},
             {"credentials", device.credentials}};
}

} // namespace netsentry::core
