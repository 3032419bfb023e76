#include <catch2/catch_test_macros.hpp>

#include "app/MonitoringCoordinator.hpp"
#include "support/Fakes.hpp"

#include <memory>

using namespace netsentry::core;
using namespace netsentry::app;
using namespace netsentry::test;
using namespace std::chrono_literals;

namespace {

class ManualClock {
public:
    ResultCache::Clock::time_point operator()() const { return *now_; }
    void advance(std::chrono::seconds step) { *now_ += step; }

private:
    std::shared_ptr<ResultCache::Clock::time_point> now_ =
        std::make_shared<ResultCache::Clock::time_point>();
};

CoordinatorSettings fastSettings() {
    CoordinatorSettings settings;
    settings.cacheTtl = 300s;
    settings.maxConcurrentQueries = 10;
    settings.retryBaseDelay = 1ms;
    return settings;
}

} // namespace

TEST_CASE("MonitoringCoordinator status caching", "[MonitoringCoordinator]") {
    FakeDeviceRegistry registry({makeDevice("r1", "10.0.0.1"), makeDevice("r2", "10.0.0.2")});
    FakeMonitorFactory factory;
    FakePingService ping;
    FakePortScanner ports;
    ManualClock clock;
    MonitoringCoordinator coordinator(registry, factory, ping, ports, fastSettings(), clock);

    REQUIRE(coordinator.deviceIds() == std::vector<std::string>{"r1", "r2"});

    SECTION("Unknown device yields nullopt") {
        REQUIRE_FALSE(coordinator.getDeviceStatus("nope").has_value());
        REQUIRE_FALSE(coordinator.getDeviceInterfaces("nope").has_value());
        REQUIRE_FALSE(coordinator.getDeviceHealth("nope").has_value());
        REQUIRE_FALSE(coordinator.pingDevice("nope").has_value());
        REQUIRE_FALSE(coordinator.testDeviceConnection("nope").has_value());
    }

    SECTION("Repeated queries within the TTL hit the monitor once") {
        auto first = coordinator.getDeviceStatus("r1");
        auto second = coordinator.getDeviceStatus("r1");

        REQUIRE(first.has_value());
        REQUIRE(first->reachable);
        REQUIRE(first->health.has_value());
        REQUIRE(first->interfaces->size() == 2);
        REQUIRE(*first == *second);
        REQUIRE(factory.created["r1"]->statusCalls.load() == 1);
    }

    SECTION("Expired entries are refreshed") {
        coordinator.getDeviceStatus("r1");
        clock.advance(301s);
        coordinator.getDeviceStatus("r1");
        REQUIRE(factory.created["r1"]->statusCalls.load() == 2);
    }

    SECTION("Clearing one device keeps the others cached") {
        coordinator.getDeviceStatus("r1");
        coordinator.getDeviceStatus("r2");
        coordinator.clearCache("r1");

        coordinator.getDeviceStatus("r1");
        coordinator.getDeviceStatus("r2");
        REQUIRE(factory.created["r1"]->statusCalls.load() == 2);
        REQUIRE(factory.created["r2"]->statusCalls.load() == 1);

        coordinator.clearCache();
        REQUIRE(coordinator.cacheSize() == 0);
    }

    SECTION("Interfaces and health are cached separately") {
        auto interfaces = coordinator.getDeviceInterfaces("r1");
        REQUIRE(interfaces->size() == 2);
        coordinator.getDeviceInterfaces("r1");
        REQUIRE(factory.created["r1"]->interfaceCalls.load() == 1);

        auto health = coordinator.getDeviceHealth("r1");
        REQUIRE(*health->cpuPercent == 12.5);
        REQUIRE(*health->uptimeSeconds == 1234);
        coordinator.getDeviceHealth("r1");
        REQUIRE(factory.created["r1"]->healthCalls.load() == 1);
    }

    SECTION("Single interface lookup") {
        auto eth1 = coordinator.getDeviceInterface("r1", "eth1");
        REQUIRE(eth1.has_value());
        REQUIRE(eth1->status == InterfaceStatus::Down);
        REQUIRE_FALSE(coordinator.getDeviceInterface("r1", "eth9").has_value());
    }
}

TEST_CASE("MonitoringCoordinator retries", "[MonitoringCoordinator]") {
    FakeDeviceRegistry registry({makeDevice("flaky", "10.0.0.5", 3),
                                 makeDevice("dead", "10.0.0.6", 2),
                                 makeDevice("sick", "10.0.0.7", 2)});
    FakeMonitorFactory factory;
    factory.setup["flaky"] = [](FakeMonitor& m) { m.failuresBeforeSuccess = 2; };
    factory.setup["dead"] = [](FakeMonitor& m) { m.reachable = false; };
    factory.setup["sick"] = [](FakeMonitor& m) { m.healthFailures = 5; };
    FakePingService ping;
    FakePortScanner ports;
    MonitoringCoordinator coordinator(registry, factory, ping, ports, fastSettings());

    SECTION("Transient failures are retried until success") {
        auto status = coordinator.getDeviceStatus("flaky");
        REQUIRE(status->reachable);
        REQUIRE(factory.created["flaky"]->statusCalls.load() == 3);
    }

    SECTION("Persistent failure gives an unreachable status without throwing") {
        std::optional<DeviceStatus> status;
        REQUIRE_NOTHROW(status = coordinator.getDeviceStatus("dead"));
        REQUIRE_FALSE(status->reachable);
        REQUIRE(status->errorMessage == "Request timed out");
        REQUIRE(factory.created["dead"]->statusCalls.load() == 2);

        coordinator.getDeviceStatus("dead");
        REQUIRE(factory.created["dead"]->statusCalls.load() == 2);
    }

    SECTION("Health errors propagate after the last attempt") {
        REQUIRE_THROWS_AS(coordinator.getDeviceHealth("sick"), std::runtime_error);
        REQUIRE(factory.created["sick"]->healthCalls.load() == 2);
    }

    SECTION("Connection test bypasses the cache") {
        REQUIRE(coordinator.testDeviceConnection("flaky") == true);
        REQUIRE(coordinator.testDeviceConnection("dead") == false);
    }
}

TEST_CASE("MonitoringCoordinator bulk queries", "[MonitoringCoordinator]") {
    std::vector<DeviceRecord> devices;
    for (int i = 0; i < 12; ++i) {
        devices.push_back(makeDevice("dev" + std::to_string(i), "10.0.1." + std::to_string(i + 1)));
    }
    FakeDeviceRegistry registry(devices);
    FakeMonitorFactory factory;
    factory.shared.statusDelay = 20ms;
    factory.setup["dev3"] = [](FakeMonitor& m) { m.reachable = false; };
    FakePingService ping;
    FakePortScanner ports;

    auto settings = fastSettings();
    settings.maxConcurrentQueries = 3;
    MonitoringCoordinator coordinator(registry, factory, ping, ports, settings);

    SECTION("Concurrency stays within the limit") {
        auto statuses = coordinator.getAllDeviceStatus();

        REQUIRE(statuses.size() == 12);
        REQUIRE_FALSE(statuses.at("dev3").reachable);
        REQUIRE(statuses.at("dev0").reachable);
        REQUIRE(factory.shared.maxInFlight.load() <= 3);
        REQUIRE(factory.shared.maxInFlight.load() >= 1);
    }

    SECTION("Unknown ids are omitted") {
        auto statuses = coordinator.getMultipleDeviceStatus({"dev1", "ghost", "dev2"});
        REQUIRE(statuses.size() == 2);
        REQUIRE(statuses.count("ghost") == 0);
    }
}

TEST_CASE("MonitoringCoordinator ping", "[MonitoringCoordinator]") {
    FakeDeviceRegistry registry({makeDevice("icmp", "10.0.2.1"), makeDevice("tcp", "10.0.2.2"),
                                 makeDevice("gone", "10.0.2.3")});
    FakeMonitorFactory factory;
    FakePingService ping({"10.0.2.1"});
    FakePortScanner ports;
    ports.open("10.0.2.2", 443);
    MonitoringCoordinator coordinator(registry, factory, ping, ports, fastSettings());

    SECTION("ICMP reply") {
        auto check = coordinator.pingDevice("icmp");
        REQUIRE(check->success);
        REQUIRE(*check->responseTimeMs == 1.5);
        REQUIRE(ports.probed.empty());
    }

    SECTION("TCP fallback tries 22, 80 then 443") {
        auto check = coordinator.pingDevice("tcp");
        REQUIRE(check->success);
        REQUIRE(check->output.find("10.0.2.2:443") != std::string::npos);
        REQUIRE(ports.probed.size() == 3);
        REQUIRE(ports.probed[0].second == 22);
        REQUIRE(ports.probed[2].second == 443);
    }

    SECTION("No reply at all") {
        auto check = coordinator.pingDevice("gone");
        REQUIRE_FALSE(check->success);
        REQUIRE_FALSE(check->responseTimeMs.has_value());
        REQUIRE(check->output.find("No reply from 10.0.2.3") != std::string::npos);
    }
}

TEST_CASE("MonitoringCoordinator reload", "[MonitoringCoordinator]") {
    FakeDeviceRegistry registry({makeDevice("old", "10.0.3.1")});
    FakeMonitorFactory factory;
    FakePingService ping;
    FakePortScanner ports;
    MonitoringCoordinator coordinator(registry, factory, ping, ports, fastSettings());

    coordinator.getDeviceStatus("old");
    REQUIRE(coordinator.cacheSize() == 1);

    registry.replace({makeDevice("new", "10.0.3.2")});
    coordinator.reloadDevices();

    REQUIRE(registry.reloads == 1);
    REQUIRE(coordinator.cacheSize() == 0);
    REQUIRE(coordinator.deviceIds() == std::vector<std::string>{"new"});
    REQUIRE_FALSE(coordinator.getDeviceStatus("old").has_value());
    REQUIRE(coordinator.getDeviceStatus("new")->reachable);
}
