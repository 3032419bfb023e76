#pragma once

#include "core/services/IDeviceRegistry.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace netsentry::infra {

/**
 * @brief Defaults applied to devices that do not set their own values.
 */
struct GlobalDeviceSettings {
    int defaultTimeout{10};     ///< Timeout in seconds.
    int defaultRetryCount{3};   ///< Attempts per monitor call.
};

/**
 * @brief JSON-file backed device registry.
 *
 * The file layout is
 * @code
 * { "global_settings": { "default_timeout": 10, "default_retry_count": 3 },
 *   "devices": [ { "id": "core-rtr", "host": "10.0.0.1", ... } ] }
 * @endcode
 * "devices" may also be an object keyed by device id.
 *
 * Secrets can be supplied through environment variables named
 * <ID>_PASSWORD, <ID>_API_TOKEN and <ID>_API_KEY, where ID is the device id
 * upper-cased with '-' replaced by '_'. Overrides win over file values and
 * are never written back to the file.
 */
class DeviceRegistry : public core::IDeviceRegistry {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Constructs a registry for a device file.
     * @param path Device file; it need not exist yet.
     * @param defaults Settings used when the file has no global_settings.
     * @param env Environment lookup (defaults to the process environment).
     */
    explicit DeviceRegistry(std::filesystem::path path, GlobalDeviceSettings defaults = {},
                            EnvLookup env = processEnvironment);

    /**
     * @brief Reads the device file, replacing the in-memory set.
     *
     * A missing file yields an empty registry. Malformed device entries are
     * skipped with a warning.
     *
     * @throws std::runtime_error if the file exists but is not valid JSON.
     */
    void loadDevices();

    void reload() override;
    std::vector<core::DeviceRecord> getAllDevices() const override;
    std::optional<core::DeviceRecord> getDevice(const std::string& id) const override;
    void addDevice(const core::DeviceRecord& device) override;

    /**
     * @brief Replaces an existing device and persists the change.
     * @param device Updated record; its id selects the device.
     * @throws std::invalid_argument if the id is unknown or the record invalid.
     */
    void updateDevice(const core::DeviceRecord& device);

    /**
     * @brief Removes a device and persists the change.
     * @param id Device identifier.
     * @return True if the device existed.
     */
    bool removeDevice(const std::string& id);

    /**
     * @brief Exports the device set without secrets.
     *
     * Secrets are replaced by has_password, has_ssh_key, has_api_token and
     * has_api_key flags; the SNMP community is masked.
     */
    nlohmann::json exportDevices() const;

    /**
     * @brief Derives a unique device id from a name and host.
     * @return "<name>-<host>" lower-cased with spaces and dots replaced by '-',
     *         suffixed with -1, -2, ... if already taken.
     */
    std::string generateDeviceId(const std::string& name, const std::string& host) const;

    /**
     * @brief Writes the device set to the device file.
     * @throws std::runtime_error if the file cannot be written.
     */
    void save() const;

    const GlobalDeviceSettings& globalSettings() const { return globals_; }

    /**
     * @brief Reads a variable from the process environment.
     */
    static std::optional<std::string> processEnvironment(const std::string& name);

    /**
     * @brief Returns the environment variable prefix of a device.
     * @param id Device identifier.
     * @return Upper-cased id with '-' replaced by '_'.
     */
    static std::string envPrefix(const std::string& id);

private:
    core::DeviceRecord parseDevice(const std::string& id, const nlohmann::json& j) const;
    core::DeviceRecord applyEnvironment(core::DeviceRecord device) const;
    void saveLocked() const;

    std::filesystem::path path_;
    EnvLookup env_;
    GlobalDeviceSettings defaults_;
    GlobalDeviceSettings globals_;
    std::map<std::string, core::DeviceRecord> stored_;    ///< As written in the file.
    std::map<std::string, core::DeviceRecord> effective_; ///< With environment overrides.
    mutable std::shared_mutex mutex_;
};

} // namespace netsentry::infra
