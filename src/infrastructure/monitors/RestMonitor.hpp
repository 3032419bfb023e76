#pragma once

#include "core/services/IHttpClient.hpp"
#include "core/services/IProtocolMonitor.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace netsentry::infra {

/**
 * @brief Protocol monitor for devices with an HTTP/JSON management API.
 *
 * Vendors disagree on paths and field names, so every capability probes a
 * list of well-known endpoints in order and reads fields through lists of
 * alternative keys. Requests go to http://<host>:<restPort>.
 */
class RestMonitor : public core::IProtocolMonitor {
public:
    /**
     * @brief Constructs a monitor for a device.
     * @param device Device to poll.
     * @param http HTTP client used for all requests.
     */
    RestMonitor(core::DeviceRecord device, core::IHttpClient& http);

    const core::DeviceRecord& device() const override { return device_; }
    core::MonitorProtocol protocol() const override { return core::MonitorProtocol::Rest; }

    /**
     * @brief Probes status endpoints.
     * @return True if any answered 200, 401 or 403.
     */
    bool testConnection() override;

    /**
     * @throws std::runtime_error if no info endpoint returned JSON.
     */
    core::DeviceInfo getDeviceInfo() override;

    /**
     * @throws std::runtime_error if no interface endpoint returned JSON.
     */
    std::vector<core::InterfaceInfo> getInterfaces() override;

    /**
     * @throws std::runtime_error if no health endpoint returned JSON.
     */
    core::DeviceHealth getHealthMetrics() override;

    /**
     * @brief Builds the authentication headers for the device credentials.
     *
     * A bearer token wins over an API key, which wins over HTTP Basic.
     */
    std::map<std::string, std::string> authHeaders() const;

    /// Endpoint lists, in probe order.
    static const std::vector<std::string>& testEndpoints();
    static const std::vector<std::string>& infoEndpoints();
    static const std::vector<std::string>& interfaceEndpoints();
    static const std::vector<std::string>& healthEndpoints();

    /**
     * @brief Converts one interface object of an API response.
     * @param item JSON object.
     * @return The interface, or std::nullopt if it carries no name.
     */
    static std::optional<core::InterfaceInfo> parseInterface(const nlohmann::json& item);

private:
    core::HttpResponse request(const std::string& path);
    std::optional<nlohmann::json> fetchFirst(const std::vector<std::string>& paths);

    core::DeviceRecord device_;
    core::IHttpClient& http_;
};

} // namespace netsentry::infra
