#include "app/Application.hpp"

#include "infrastructure/discovery/BuiltinDiscoveryStrategy.hpp"
#include "infrastructure/discovery/NmapDiscoveryStrategy.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>

namespace netsentry::app {

namespace {

constexpr const char* VERSION = "1.0.0";

} // namespace

Application::Application(const std::filesystem::path& configDir) {
    config_ = std::make_unique<infra::ConfigManager>(configDir);
    config_->load();

    initializeLogging();
    initializeComponents();
}

Application::~Application() {
    spdlog::debug("Application shutting down...");

    if (scanManager_) {
        scanManager_->shutdown();
    }

    if (asioContext_) {
        asioContext_->stop();
    }
}

std::filesystem::path Application::defaultConfigDir() {
    if (const char* dir = std::getenv("NETSENTRY_CONFIG_DIR"); dir && *dir) {
        return dir;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "netsentry";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "netsentry";
    }
    return ".netsentry";
}

void Application::initializeLogging() {
    auto logPath = config_->logPath();
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path());
    }

    // stdout carries command output, so console logging goes to stderr.
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(spdlog::level::from_str(config_->config().logging.level));

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("netsentry", spdlog::sinks_init_list{consoleSink, fileSink});
    logger->set_level(spdlog::level::debug);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    spdlog::debug("NetSentry {} starting...", VERSION);
    spdlog::debug("Log file: {}", logPath.string());
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Database
    database_ = std::make_shared<infra::Database>(config_->databasePath().string());
    database_->runMigrations();
    scanStore_ = std::make_unique<infra::ScanResultRepository>(database_);
    if (int recovered = scanStore_->recoverInterrupted(); recovered > 0) {
        spdlog::warn("Marked {} interrupted scan(s) as failed", recovered);
    }

    // Devices
    infra::GlobalDeviceSettings deviceDefaults;
    deviceDefaults.defaultTimeout = cfg.monitoring.defaultTimeoutSeconds;
    deviceDefaults.defaultRetryCount = cfg.monitoring.defaultRetryCount;
    deviceRegistry_ =
        std::make_unique<infra::DeviceRegistry>(config_->devicesPath(), deviceDefaults);
    deviceRegistry_->loadDevices();

    // Asio context; pings block a worker each, so size the pool for a full sweep.
    auto threads = static_cast<size_t>(std::max(4, cfg.discovery.maxConcurrentProbes));
    asioContext_ = std::make_unique<infra::AsioContext>(threads);
    asioContext_->start();

    // Network services
    pingService_ = std::make_unique<infra::PingService>(*asioContext_);
    portScanner_ = std::make_unique<infra::PortScanner>(*asioContext_);
    snmpClient_ = std::make_unique<infra::SnmpClient>();
    httpClient_ = std::make_unique<infra::HttpClient>();
    processRunner_ = std::make_unique<infra::ProcessRunner>();

    // Discovery
    std::unique_ptr<core::IHostDiscoveryStrategy> external;
    if (cfg.discovery.useNmap) {
        external = std::make_unique<infra::NmapDiscoveryStrategy>(*processRunner_,
                                                                  cfg.discovery.nmapPath);
    }
    networkScanner_ = std::make_unique<infra::NetworkScanner>(
        std::move(external),
        std::make_unique<infra::BuiltinDiscoveryStrategy>(*pingService_, *portScanner_),
        *snmpClient_);

    // Monitoring
    monitorFactory_ =
        std::make_unique<infra::MonitorFactory>(*snmpClient_, *httpClient_, *portScanner_);

    CoordinatorSettings coordinatorSettings;
    coordinatorSettings.cacheTtl = std::chrono::seconds(cfg.monitoring.cacheTtlSeconds);
    coordinatorSettings.maxConcurrentQueries = cfg.monitoring.maxConcurrentQueries;
    coordinatorSettings.retryBaseDelay = std::chrono::milliseconds(cfg.monitoring.retryBaseDelayMs);
    coordinator_ = std::make_unique<MonitoringCoordinator>(
        *deviceRegistry_, *monitorFactory_, *pingService_, *portScanner_, coordinatorSettings);

    // Scans
    ScanManagerSettings scanSettings;
    scanSettings.failedScanGrace = std::chrono::seconds(cfg.discovery.failedScanGraceSeconds);
    scanSettings.maxNetworkAddresses = static_cast<uint64_t>(cfg.discovery.maxNetworkAddresses);
    scanSettings.maxSweepHosts = static_cast<size_t>(cfg.discovery.maxSweepHosts);
    scanSettings.historyLimit = cfg.discovery.historyLimit;
    scanManager_ = std::make_unique<ScanLifecycleManager>(*networkScanner_, *scanStore_,
                                                          *deviceRegistry_, scanSettings);

    spdlog::debug("Application components initialized");
}

} // namespace netsentry::app
