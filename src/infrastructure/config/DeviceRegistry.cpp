#include "infrastructure/config/DeviceRegistry.hpp"

#include "infrastructure/serialization/JsonConvert.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace netsentry::infra {

using json = nlohmann::json;

DeviceRegistry::DeviceRegistry(std::filesystem::path path, GlobalDeviceSettings defaults,
                               EnvLookup env)
    : path_(std::move(path)), env_(std::move(env)), defaults_(defaults), globals_(defaults) {}

std::optional<std::string> DeviceRegistry::processEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::string DeviceRegistry::envPrefix(const std::string& id) {
    std::string prefix;
    prefix.reserve(id.size());
    for (char c : id) {
        prefix.push_back(c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return prefix;
}

core::DeviceRecord DeviceRegistry::parseDevice(const std::string& id, const json& j) const {
    core::DeviceRecord device;
    device.id = id;
    device.host = j.at("host").get<std::string>();
    device.name = j.value("name", id);
    device.deviceType = core::deviceTypeFromString(j.value("device_type", std::string("generic")));
    device.description = j.value("description", std::string());
    device.timeoutSeconds = j.value("timeout", globals_.defaultTimeout);
    device.retryCount = j.value("retry_count", globals_.defaultRetryCount);
    device.restPort = j.value("rest_port", static_cast<uint16_t>(80));

    device.enabledProtocols.clear();
    for (const auto& name :
         j.value("enabled_protocols", std::vector<std::string>{"snmp"})) {
        if (auto protocol = core::protocolFromString(name)) {
            device.enabledProtocols.push_back(*protocol);
        } else {
            spdlog::warn("Device {}: ignoring unknown protocol '{}'", id, name);
        }
    }
    if (device.enabledProtocols.empty()) {
        device.enabledProtocols.push_back(core::MonitorProtocol::Snmp);
    }

    if (j.contains("credentials") && j["credentials"].is_object()) {
        const auto& c = j["credentials"];
        auto& creds = device.credentials;
        if (c.contains("snmp_community") && c["snmp_community"].is_string()) {
            creds.snmpCommunity = c["snmp_community"].get<std::string>();
        }
        if (c.contains("snmp_version") && c["snmp_version"].is_string()) {
            creds.snmpVersion = core::snmpVersionFromString(c["snmp_version"].get<std::string>());
        }
        auto text = [&c](const char* key) {
            return c.contains(key) && c[key].is_string() ? c[key].get<std::string>() : std::string();
        };
        creds.username = text("username");
        creds.password = text("password");
        creds.sshKey = text("ssh_key");
        creds.apiToken = text("api_token");
        creds.apiKey = text("api_key");
    }

    if (!device.isValid()) {
        throw std::invalid_argument("Device " + id + " has an invalid timeout or retry count");
    }
    return device;
}

core::DeviceRecord DeviceRegistry::applyEnvironment(core::DeviceRecord device) const {
    auto prefix = envPrefix(device.id);
    if (auto value = env_(prefix + "_PASSWORD")) {
        device.credentials.password = *value;
    }
    if (auto value = env_(prefix + "_API_TOKEN")) {
        device.credentials.apiToken = *value;
    }
    if (auto value = env_(prefix + "_API_KEY")) {
        device.credentials.apiKey = *value;
    }
    return device;
}

void DeviceRegistry::loadDevices() {
    std::unique_lock lock(mutex_);

    stored_.clear();
    effective_.clear();
    globals_ = defaults_;

    if (!std::filesystem::exists(path_)) {
        spdlog::warn("Device file not found: {}", path_.string());
        return;
    }

    std::ifstream file(path_);
    if (!file) {
        throw std::runtime_error("Failed to open device file: " + path_.string());
    }
    json root = json::parse(file, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw std::runtime_error("Device file is not valid JSON: " + path_.string());
    }

    if (root.contains("global_settings") && root["global_settings"].is_object()) {
        const auto& g = root["global_settings"];
        globals_.defaultTimeout = g.value("default_timeout", globals_.defaultTimeout);
        globals_.defaultRetryCount = g.value("default_retry_count", globals_.defaultRetryCount);
    }

    auto addParsed = [this](const std::string& id, const json& entry) {
        try {
            auto device = parseDevice(id, entry);
            effective_[id] = applyEnvironment(device);
            stored_[id] = std::move(device);
        } catch (const std::exception& e) {
            spdlog::warn("Skipping device '{}': {}", id, e.what());
        }
    };

    const auto devices = root.value("devices", json::array());
    if (devices.is_object()) {
        for (const auto& [id, entry] : devices.items()) {
            addParsed(id, entry);
        }
    } else if (devices.is_array()) {
        for (const auto& entry : devices) {
            if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
                spdlog::warn("Skipping device entry without an id");
                continue;
            }
            addParsed(entry["id"].get<std::string>(), entry);
        }
    }

    spdlog::info("Loaded {} device(s) from {}", effective_.size(), path_.string());
}

void DeviceRegistry::reload() {
    loadDevices();
}

std::vector<core::DeviceRecord> DeviceRegistry::getAllDevices() const {
    std::shared_lock lock(mutex_);
    std::vector<core::DeviceRecord> devices;
    devices.reserve(effective_.size());
    for (const auto& [id, device] : effective_) {
        devices.push_back(device);
    }
    return devices;
}

std::optional<core::DeviceRecord> DeviceRegistry::getDevice(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = effective_.find(id);
    if (it == effective_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DeviceRegistry::addDevice(const core::DeviceRecord& device) {
    if (!device.isValid()) {
        throw std::invalid_argument("Invalid device record: " + device.id);
    }

    std::unique_lock lock(mutex_);
    if (stored_.count(device.id) > 0) {
        throw std::invalid_argument("Device already exists: " + device.id);
    }
    stored_[device.id] = device;
    effective_[device.id] = applyEnvironment(device);
    try {
        saveLocked();
    } catch (...) {
        stored_.erase(device.id);
        effective_.erase(device.id);
        throw;
    }
    spdlog::info("Added device {} ({})", device.id, device.host);
}

void DeviceRegistry::updateDevice(const core::DeviceRecord& device) {
    if (!device.isValid()) {
        throw std::invalid_argument("Invalid device record: " + device.id);
    }

    std::unique_lock lock(mutex_);
    auto it = stored_.find(device.id);
    if (it == stored_.end()) {
        throw std::invalid_argument("Unknown device: " + device.id);
    }
    auto previous = it->second;
    it->second = device;
    effective_[device.id] = applyEnvironment(device);
    try {
        saveLocked();
    } catch (...) {
        it->second = previous;
        effective_[device.id] = applyEnvironment(previous);
        throw;
    }
    spdlog::info("Updated device {}", device.id);
}

bool DeviceRegistry::removeDevice(const std::string& id) {
    std::unique_lock lock(mutex_);
    auto it = stored_.find(id);
    if (it == stored_.end()) {
        return false;
    }
    auto previous = it->second;
    stored_.erase(it);
    effective_.erase(id);
    try {
        saveLocked();
    } catch (...) {
        effective_[id] = applyEnvironment(previous);
        stored_[id] = std::move(previous);
        throw;
    }
    spdlog::info("Removed device {}", id);
    return true;
}

json DeviceRegistry::exportDevices() const {
    std::shared_lock lock(mutex_);

    json devices = json::array();
    for (const auto& [id, device] : effective_) {
        json entry = device;
        const auto& creds = device.credentials;
        entry["credentials"] = json{
            {"snmp_community", core::maskSecret(creds.snmpCommunity)},
            {"snmp_version", core::snmpVersionToString(creds.snmpVersion)},
            {"username", creds.username},
            {"has_password", !creds.password.empty()},
            {"has_ssh_key", !creds.sshKey.empty()},
            {"has_api_token", !creds.apiToken.empty()},
            {"has_api_key", !creds.apiKey.empty()}};
        devices.push_back(std::move(entry));
    }

    return json{{"global_settings",
                 {{"default_timeout", globals_.defaultTimeout},
                  {"default_retry_count", globals_.defaultRetryCount}}},
                {"devices", devices}};
}

std::string DeviceRegistry::generateDeviceId(const std::string& name,
                                             const std::string& host) const {
    std::string base;
    for (char c : name + "-" + host) {
        if (c == ' ' || c == '.') {
            base.push_back('-');
        } else {
            base.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    std::shared_lock lock(mutex_);
    std::string id = base;
    for (int counter = 1; stored_.count(id) > 0; ++counter) {
        id = base + "-" + std::to_string(counter);
    }
    return id;
}

void DeviceRegistry::save() const {
    std::shared_lock lock(mutex_);
    saveLocked();
}

void DeviceRegistry::saveLocked() const {
    json devices = json::array();
    for (const auto& [id, device] : stored_) {
        devices.push_back(json(device));
    }
    json root{{"global_settings",
               {{"default_timeout", globals_.defaultTimeout},
                {"default_retry_count", globals_.defaultRetryCount}}},
              {"devices", devices}};

    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }
    std::ofstream file(path_);
    if (!file) {
        throw std::runtime_error("Failed to open device file for writing: " + path_.string());
    }
    file << root.dump(2);
    if (!file) {
        throw std::runtime_error("Failed to write device file: " + path_.string());
    }
    spdlog::debug("Saved {} device(s) to {}", stored_.size(), path_.string());
}

} // namespace netsentry::infra
