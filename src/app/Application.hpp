#pragma once

#include "app/MonitoringCoordinator.hpp"
#include "app/ScanLifecycleManager.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/config/DeviceRegistry.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/ScanResultRepository.hpp"
#include "infrastructure/discovery/NetworkScanner.hpp"
#include "infrastructure/monitors/MonitorFactory.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/network/HttpClient.hpp"
#include "infrastructure/network/PingService.hpp"
#include "infrastructure/network/PortScanner.hpp"
#include "infrastructure/network/ProcessRunner.hpp"
#include "infrastructure/network/SnmpClient.hpp"

#include <filesystem>
#include <memory>

namespace netsentry::app {

/**
 * @brief Owns every service of the process and wires them together.
 *
 * Construction order is configuration, logging, storage, network runtime,
 * protocol clients, discovery, then the two application services.
 * Destruction runs in reverse after running scans have finished.
 */
class Application {
public:
    /**
     * @brief Loads configuration and builds all components.
     * @param configDir Directory holding config.json, the device file and the database.
     * @throws std::runtime_error if the database or the device file cannot be opened.
     */
    explicit Application(const std::filesystem::path& configDir);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::DeviceRegistry& devices() { return *deviceRegistry_; }
    MonitoringCoordinator& monitoring() { return *coordinator_; }
    ScanLifecycleManager& scans() { return *scanManager_; }

    /**
     * @brief Default configuration directory.
     *
     * $NETSENTRY_CONFIG_DIR, else $XDG_CONFIG_HOME/netsentry, else
     * $HOME/.config/netsentry, else ./.netsentry.
     */
    static std::filesystem::path defaultConfigDir();

private:
    void initializeLogging();
    void initializeComponents();

    std::unique_ptr<infra::ConfigManager> config_;
    std::shared_ptr<infra::Database> database_;
    std::unique_ptr<infra::ScanResultRepository> scanStore_;
    std::unique_ptr<infra::DeviceRegistry> deviceRegistry_;

    std::unique_ptr<infra::AsioContext> asioContext_;
    std::unique_ptr<infra::PingService> pingService_;
    std::unique_ptr<infra::PortScanner> portScanner_;
    std::unique_ptr<infra::SnmpClient> snmpClient_;
    std::unique_ptr<infra::HttpClient> httpClient_;
    std::unique_ptr<infra::ProcessRunner> processRunner_;

    std::unique_ptr<infra::NetworkScanner> networkScanner_;
    std::unique_ptr<infra::MonitorFactory> monitorFactory_;
    std::unique_ptr<MonitoringCoordinator> coordinator_;
    std::unique_ptr<ScanLifecycleManager> scanManager_;
};

} // namespace netsentry::app
