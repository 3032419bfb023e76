#include "infrastructure/monitors/RestMonitor.hpp"

#include "infrastructure/network/HttpClient.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace netsentry::infra {

using json = nlohmann::json;

namespace {

// Objects from APIs that wrap their payload in a "system" member.
const json& unwrapSystem(const json& j) {
    if (j.is_object() && j.contains("system") && j["system"].is_object()) {
        return j["system"];
    }
    return j;
}

std::optional<std::string> stringField(const json& j, std::initializer_list<const char*> keys) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            continue;
        }
        if (it->is_string()) {
            return it->get<std::string>();
        }
        if (it->is_number() || it->is_boolean()) {
            return it->dump();
        }
    }
    return std::nullopt;
}

std::optional<double> numberField(const json& j, std::initializer_list<const char*> keys) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end()) {
            continue;
        }
        if (it->is_number()) {
            return it->get<double>();
        }
        if (it->is_string()) {
            try {
                return std::stod(it->get<std::string>());
            } catch (const std::exception&) {
                continue;
            }
        }
    }
    return std::nullopt;
}

std::optional<int64_t> integerField(const json& j, std::initializer_list<const char*> keys) {
    if (auto n = numberField(j, keys)) {
        return static_cast<int64_t>(*n);
    }
    return std::nullopt;
}

std::optional<uint64_t> counterField(const json& j, std::initializer_list<const char*> keys) {
    auto n = numberField(j, keys);
    if (n && *n >= 0) {
        return static_cast<uint64_t>(*n);
    }
    return std::nullopt;
}

core::InterfaceStatus statusField(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end()) {
            continue;
        }
        if (it->is_boolean()) {
            return it->get<bool>() ? core::InterfaceStatus::Up : core::InterfaceStatus::Down;
        }
        if (it->is_string()) {
            return core::interfaceStatusFromString(it->get<std::string>());
        }
        if (it->is_number_integer()) {
            return core::interfaceStatusFromString(std::to_string(it->get<int64_t>()));
        }
    }
    return core::InterfaceStatus::Unknown;
}

// Interface arrays are either the document itself or under a wrapper key,
// including RESTCONF module-qualified names such as "ietf-interfaces:interface".
const json* findInterfaceArray(const json& j) {
    if (j.is_array()) {
        return &j;
    }
    if (!j.is_object()) {
        return nullptr;
    }
    for (const auto& [key, value] : j.items()) {
        bool wrapper = key == "interfaces" || key == "interface" ||
                       (key.size() > 10 && key.compare(key.size() - 10, 10, ":interface") == 0) ||
                       (key.size() > 11 && key.compare(key.size() - 11, 11, ":interfaces") == 0);
        if (!wrapper) {
            continue;
        }
        if (value.is_array()) {
            return &value;
        }
        if (const json* nested = findInterfaceArray(value)) {
            return nested;
        }
    }
    return nullptr;
}

} // namespace

RestMonitor::RestMonitor(core::DeviceRecord device, core::IHttpClient& http)
    : device_(std::move(device)), http_(http) {}

const std::vector<std::string>& RestMonitor::testEndpoints() {
    static const std::vector<std::string> paths = {"/api/v1/system/status", "/api/system/info",
                                                   "/restconf/data/system-state", "/api/status",
                                                   "/system"};
    return paths;
}

const std::vector<std::string>& RestMonitor::infoEndpoints() {
    static const std::vector<std::string> paths = {"/api/v1/system/info", "/api/system/status",
                                                   "/restconf/data/system-state/platform"};
    return paths;
}

const std::vector<std::string>& RestMonitor::interfaceEndpoints() {
    static const std::vector<std::string> paths = {"/api/v1/interfaces", "/api/interfaces",
                                                   "/restconf/data/interfaces-state/interface"};
    return paths;
}

const std::vector<std::string>& RestMonitor::healthEndpoints() {
    static const std::vector<std::string> paths = {"/api/v1/system/health",
                                                   "/api/system/resources",
                                                   "/api/monitoring/system",
                                                   "/restconf/data/system-state"};
    return paths;
}

std::map<std::string, std::string> RestMonitor::authHeaders() const {
    std::map<std::string, std::string> headers;
    const auto& creds = device_.credentials;
    if (!creds.apiToken.empty()) {
        headers["Authorization"] = "Bearer " + creds.apiToken;
    } else if (!creds.apiKey.empty()) {
        headers["X-API-Key"] = creds.apiKey;
    } else if (!creds.username.empty()) {
        headers["Authorization"] = basicAuthorization(creds.username, creds.password);
    }
    return headers;
}

core::HttpResponse RestMonitor::request(const std::string& path) {
    core::HttpRequest req;
    req.method = "GET";
    req.host = device_.host;
    req.port = device_.restPort;
    req.path = path;
    req.headers = authHeaders();
    req.timeout = std::chrono::seconds(std::max(1, device_.timeoutSeconds));
    return http_.send(req);
}

std::optional<json> RestMonitor::fetchFirst(const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        auto response = request(path);
        if (!response.success || response.statusCode != 200) {
            continue;
        }
        auto body = json::parse(response.body, nullptr, false);
        if (body.is_discarded()) {
            spdlog::debug("{}{} returned non-JSON body", device_.host, path);
            continue;
        }
        return body;
    }
    return std::nullopt;
}

bool RestMonitor::testConnection() {
    for (const auto& path : testEndpoints()) {
        auto response = request(path);
        if (!response.success) {
            continue;
        }
        if (response.statusCode == 200 || response.statusCode == 401 ||
            response.statusCode == 403) {
            return true;
        }
    }
    return false;
}

core::DeviceInfo RestMonitor::getDeviceInfo() {
    auto body = fetchFirst(infoEndpoints());
    if (!body) {
        throw std::runtime_error("No REST system info endpoint answered on " + device_.host);
    }
    const auto& sys = unwrapSystem(*body);

    core::DeviceInfo info;
    info.description =
        stringField(sys, {"description", "sys_descr", "model", "version"}).value_or("Unknown");
    info.name = stringField(sys, {"hostname", "name", "host_name"}).value_or("Unknown");
    info.location = stringField(sys, {"location"}).value_or("Unknown");
    info.contact = stringField(sys, {"contact"}).value_or("Unknown");
    info.objectId = stringField(sys, {"object_id", "serial_number", "serial"}).value_or("");
    info.uptimeSeconds = integerField(sys, {"uptime", "uptime_seconds"});
    return info;
}

std::vector<core::InterfaceInfo> RestMonitor::getInterfaces() {
    auto body = fetchFirst(interfaceEndpoints());
    if (!body) {
        throw std::runtime_error("No REST interface endpoint answered on " + device_.host);
    }

    std::vector<core::InterfaceInfo> interfaces;
    const json* items = findInterfaceArray(*body);
    if (!items) {
        return interfaces;
    }
    for (const auto& item : *items) {
        if (auto iface = parseInterface(item)) {
            interfaces.push_back(std::move(*iface));
        }
    }
    return interfaces;
}

std::optional<core::InterfaceInfo> RestMonitor::parseInterface(const json& item) {
    auto name = stringField(item, {"name", "ifname", "interface"});
    if (!name || name->empty()) {
        return std::nullopt;
    }

    core::InterfaceInfo iface;
    iface.name = *name;
    iface.description = stringField(item, {"description", "descr"}).value_or("");
    iface.status = statusField(item, {"status", "oper_status", "oper-status", "state", "link"});
    iface.adminStatus = statusField(item, {"admin_status", "admin-status", "enabled"});
    iface.speedMbps = integerField(item, {"speed_mbps", "speed"});
    iface.mtu = integerField(item, {"mtu"});
    iface.macAddress = stringField(item, {"mac_address", "mac", "phys-address"});

    for (const char* key : {"ip_addresses", "ip_address", "ip", "addresses"}) {
        auto it = item.find(key);
        if (it == item.end()) {
            continue;
        }
        if (it->is_string()) {
            iface.ipAddresses.insert(it->get<std::string>());
        } else if (it->is_array()) {
            for (const auto& address : *it) {
                if (address.is_string()) {
                    iface.ipAddresses.insert(address.get<std::string>());
                }
            }
        }
    }

    const json& stats =
        item.contains("statistics") && item["statistics"].is_object() ? item["statistics"] : item;
    iface.inOctets = counterField(stats, {"in_octets", "in-octets", "rx_bytes"});
    iface.outOctets = counterField(stats, {"out_octets", "out-octets", "tx_bytes"});
    iface.inErrors = counterField(stats, {"in_errors", "in-errors", "rx_errors"});
    iface.outErrors = counterField(stats, {"out_errors", "out-errors", "tx_errors"});
    return iface;
}

core::DeviceHealth RestMonitor::getHealthMetrics() {
    auto body = fetchFirst(healthEndpoints());
    if (!body) {
        throw std::runtime_error("No REST health endpoint answered on " + device_.host);
    }
    const auto& sys = unwrapSystem(*body);

    core::DeviceHealth health;
    health.cpuPercent = numberField(sys, {"cpu_usage", "cpu", "cpu_percent", "cpu_utilization"});
    health.memoryPercent =
        numberField(sys, {"memory_usage", "memory", "memory_percent", "memory_utilization"});
    health.memoryTotalMb = integerField(sys, {"memory_total_mb", "memory_total"});
    health.memoryUsedMb = integerField(sys, {"memory_used_mb", "memory_used"});
    health.temperatureCelsius = numberField(sys, {"temperature", "temp", "temperature_celsius"});
    health.uptimeSeconds = integerField(sys, {"uptime", "uptime_seconds"});

    if (!health.memoryPercent && health.memoryTotalMb && health.memoryUsedMb &&
        *health.memoryTotalMb > 0) {
        health.memoryPercent = static_cast<double>(*health.memoryUsedMb) /
                               static_cast<double>(*health.memoryTotalMb) * 100.0;
    }

    for (const char* key : {"load_average", "load_avg", "loadavg"}) {
        auto it = sys.find(key);
        if (it != sys.end() && it->is_array()) {
            std::vector<double> loads;
            for (const auto& v : *it) {
                if (v.is_number()) {
                    loads.push_back(v.get<double>());
                }
            }
            health.loadAverage = std::move(loads);
            break;
        }
    }

    for (const char* key : {"disk_usage", "disks"}) {
        auto it = sys.find(key);
        if (it != sys.end() && it->is_object()) {
            std::map<std::string, double> usage;
            for (const auto& [mount, value] : it->items()) {
                if (value.is_number()) {
                    usage[mount] = value.get<double>();
                }
            }
            health.diskUsagePercent = std::move(usage);
            break;
        }
    }

    return health;
}

} // namespace netsentry::infra
