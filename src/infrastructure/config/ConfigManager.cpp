#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace netsentry::infra {

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        return save();
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    const auto& m = config_.monitoring;
    j["monitoring"]["cache_ttl_seconds"] = m.cacheTtlSeconds;
    j["monitoring"]["max_concurrent_queries"] = m.maxConcurrentQueries;
    j["monitoring"]["default_timeout_seconds"] = m.defaultTimeoutSeconds;
    j["monitoring"]["default_retry_count"] = m.defaultRetryCount;
    j["monitoring"]["retry_base_delay_ms"] = m.retryBaseDelayMs;

    const auto& d = config_.discovery;
    j["discovery"]["max_concurrent_probes"] = d.maxConcurrentProbes;
    j["discovery"]["probe_timeout_seconds"] = d.probeTimeoutSeconds;
    j["discovery"]["max_sweep_hosts"] = d.maxSweepHosts;
    j["discovery"]["default_ports"] = d.defaultPorts;
    j["discovery"]["snmp_communities"] = d.snmpCommunities;
    j["discovery"]["use_nmap"] = d.useNmap;
    j["discovery"]["nmap_path"] = d.nmapPath;
    j["discovery"]["failed_scan_grace_seconds"] = d.failedScanGraceSeconds;
    j["discovery"]["history_limit"] = d.historyLimit;
    j["discovery"]["max_network_addresses"] = d.maxNetworkAddresses;

    j["storage"]["results_database"] = config_.storage.resultsDatabase;
    j["storage"]["devices_file"] = config_.storage.devicesFile;

    j["logging"]["level"] = config_.logging.level;
    j["logging"]["file"] = config_.logging.file;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    const AppConfig defaults;

    // Monitoring
    if (j.contains("monitoring")) {
        const auto& m = j["monitoring"];
        auto& out = config_.monitoring;
        out.cacheTtlSeconds = m.value("cache_ttl_seconds", defaults.monitoring.cacheTtlSeconds);
        out.maxConcurrentQueries =
            m.value("max_concurrent_queries", defaults.monitoring.maxConcurrentQueries);
        out.defaultTimeoutSeconds =
            m.value("default_timeout_seconds", defaults.monitoring.defaultTimeoutSeconds);
        out.defaultRetryCount = m.value("default_retry_count", defaults.monitoring.defaultRetryCount);
        out.retryBaseDelayMs = m.value("retry_base_delay_ms", defaults.monitoring.retryBaseDelayMs);
    }

    // Discovery
    if (j.contains("discovery")) {
        const auto& d = j["discovery"];
        auto& out = config_.discovery;
        out.maxConcurrentProbes =
            d.value("max_concurrent_probes", defaults.discovery.maxConcurrentProbes);
        out.probeTimeoutSeconds =
            d.value("probe_timeout_seconds", defaults.discovery.probeTimeoutSeconds);
        out.maxSweepHosts = d.value("max_sweep_hosts", defaults.discovery.maxSweepHosts);
        out.defaultPorts = d.value("default_ports", defaults.discovery.defaultPorts);
        out.snmpCommunities = d.value("snmp_communities", defaults.discovery.snmpCommunities);
        out.useNmap = d.value("use_nmap", defaults.discovery.useNmap);
        out.nmapPath = d.value("nmap_path", defaults.discovery.nmapPath);
        out.failedScanGraceSeconds =
            d.value("failed_scan_grace_seconds", defaults.discovery.failedScanGraceSeconds);
        out.historyLimit = d.value("history_limit", defaults.discovery.historyLimit);
        out.maxNetworkAddresses =
            d.value("max_network_addresses", defaults.discovery.maxNetworkAddresses);
    }

    // Storage
    if (j.contains("storage")) {
        const auto& s = j["storage"];
        config_.storage.resultsDatabase =
            s.value("results_database", defaults.storage.resultsDatabase);
        config_.storage.devicesFile = s.value("devices_file", defaults.storage.devicesFile);
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logging.level = l.value("level", defaults.logging.level);
        config_.logging.file = l.value("file", defaults.logging.file);
    }
}

std::filesystem::path ConfigManager::resolve(const std::string& path) const {
    std::filesystem::path p(path);
    return p.is_absolute() ? p : configDir_ / p;
}

std::filesystem::path ConfigManager::databasePath() const {
    return resolve(config_.storage.resultsDatabase);
}

std::filesystem::path ConfigManager::devicesPath() const {
    return resolve(config_.storage.devicesFile);
}

std::filesystem::path ConfigManager::logPath() const {
    return resolve(config_.logging.file);
}

} // namespace netsentry::infra
