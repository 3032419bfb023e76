#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace netsentry::infra {

/**
 * @brief Settings of the monitoring coordinator.
 */
struct MonitoringSettings {
    int cacheTtlSeconds{300};        ///< Time-to-live of cached poll results.
    int maxConcurrentQueries{10};    ///< Devices polled at once by bulk queries.
    int defaultTimeoutSeconds{10};   ///< Timeout for devices that do not set one.
    int defaultRetryCount{3};        ///< Attempts for devices that do not set one.
    int retryBaseDelayMs{1000};      ///< Delay after the first failed attempt.
};

/**
 * @brief Settings of network discovery and scan jobs.
 */
struct DiscoverySettings {
    int maxConcurrentProbes{50};    ///< Pings/port probes in flight.
    int probeTimeoutSeconds{5};     ///< Per-probe timeout.
    int maxSweepHosts{1000};        ///< Ceiling on addresses enumerated by a sweep.
    std::vector<uint16_t> defaultPorts{22, 23, 80, 161, 443, 8080, 8443, 9000}; ///< Ports probed by default.
    std::vector<std::string> snmpCommunities{"public", "private"}; ///< Communities tried in order.
    bool useNmap{true};             ///< Try nmap before the built-in sweep.
    std::string nmapPath{"nmap"};   ///< nmap executable (name or path).
    int failedScanGraceSeconds{300}; ///< How long failed jobs stay in the active table.
    int historyLimit{50};           ///< Default number of history entries.
    int maxNetworkAddresses{1024};  ///< Largest network accepted by startScan.
};

/**
 * @brief Locations of persisted data.
 */
struct StorageSettings {
    std::string resultsDatabase{"scans.db"}; ///< SQLite file holding scan jobs.
    std::string devicesFile{"devices.json"}; ///< Device registry file.
};

/**
 * @brief Logging settings.
 */
struct LoggingSettings {
    std::string level{"info"};          ///< Console level (trace..critical, off).
    std::string file{"netsentry.log"};  ///< Rotating log file.
};

/**
 * @brief Application configuration settings.
 */
struct AppConfig {
    MonitoringSettings monitoring; ///< Monitoring coordinator.
    DiscoverySettings discovery;   ///< Discovery and scan jobs.
    StorageSettings storage;       ///< Persisted data.
    LoggingSettings logging;       ///< Logging.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Handles loading and saving of config.json in a configuration directory.
 * Missing keys fall back to their defaults; relative storage paths resolve
 * under the configuration directory.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory (created if missing).
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk, writing defaults on first run.
     * @return True if loaded successfully, false if the file was unreadable
     *         (defaults are kept in that case).
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    /**
     * @brief Returns a mutable reference to the configuration.
     * @return Reference to AppConfig.
     */
    AppConfig& config() { return config_; }

    /**
     * @brief Returns a const reference to the configuration.
     * @return Const reference to AppConfig.
     */
    const AppConfig& config() const { return config_; }

    /**
     * @brief Returns the path to the configuration file.
     * @return Path to config.json.
     */
    std::filesystem::path configPath() const { return configPath_; }

    /**
     * @brief Returns the path to the scan results database.
     */
    std::filesystem::path databasePath() const;

    /**
     * @brief Returns the path to the device registry file.
     */
    std::filesystem::path devicesPath() const;

    /**
     * @brief Returns the path to the log file.
     */
    std::filesystem::path logPath() const;

    /**
     * @brief Returns the configuration directory path as a string.
     * @return Configuration directory path.
     */
    std::string configDir() const { return configDir_.string(); }

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

private:
    std::filesystem::path resolve(const std::string& path) const;

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace netsentry::infra
