#include <catch2/catch_test_macros.hpp>

#include "infrastructure/serialization/JsonConvert.hpp"

#include <stdexcept>

using namespace netsentry::core;
using json = nlohmann::json;

TEST_CASE("Timestamp formatting", "[JsonConvert]") {
    auto time = fromEpochMillis(1700000000123);

    SECTION("ISO 8601 UTC with milliseconds") {
        REQUIRE(formatTimestamp(time) == "2023-11-14T22:13:20.123Z");
    }

    SECTION("Parse is the inverse of format") {
        REQUIRE(parseTimestamp("2023-11-14T22:13:20.123Z") == time);
    }

    SECTION("Fraction and zone are optional") {
        REQUIRE(parseTimestamp("2023-11-14T22:13:20") == fromEpochMillis(1700000000000));
        REQUIRE(parseTimestamp("2023-11-14T22:13:20.5Z") == fromEpochMillis(1700000000500));
    }

    SECTION("Malformed text") {
        REQUIRE_FALSE(parseTimestamp("yesterday").has_value());
        REQUIRE_FALSE(parseTimestamp("2023-11-14T22:13:20.Z").has_value());
    }
}

TEST_CASE("ScanJob JSON layout", "[JsonConvert]") {
    ScanJob job;
    job.scanId = "6f1c2e1a-0000-4000-8000-000000000001";
    job.network = "10.0.0.0/30";
    job.scanType = ScanType::Port;
    job.status = ScanStatus::Completed;
    job.startedAt = fromEpochMillis(1700000000000);
    job.completedAt = fromEpochMillis(1700000004500);
    job.totalHosts = 2;
    job.scannedHosts = 2;

    DiscoveredDevice device;
    device.ip = "10.0.0.1";
    device.responseTimeMs = 1.25;
    device.openPorts = {22, 161};
    device.suggestedProtocols = {"snmp", "ssh"};
    device.deviceType = DeviceType::Router;
    device.confidenceScore = 0.8;
    job.discoveredDevices.push_back(device);

    json j = job;

    REQUIRE(j["scan_type"] == "port");
    REQUIRE(j["status"] == "completed");
    REQUIRE(j["started_at"] == "2023-11-14T22:13:20.000Z");
    REQUIRE(j["devices_found"] == 1);
    REQUIRE(j["error_message"].is_null());
    REQUIRE(j["discovered_devices"][0]["open_ports"] == json::array({22, 161}));
    REQUIRE(j["discovered_devices"][0]["hostname"].is_null());

    SECTION("Restores every field") {
        REQUIRE(j.get<ScanJob>() == job);
    }

    SECTION("Running job has a null completion time") {
        job.status = ScanStatus::Running;
        job.completedAt.reset();
        json running = job;
        REQUIRE(running["completed_at"].is_null());
        REQUIRE_FALSE(running.get<ScanJob>().completedAt.has_value());
    }

    SECTION("Unknown status is rejected") {
        j["status"] = "paused";
        REQUIRE_THROWS_AS(j.get<ScanJob>(), std::invalid_argument);
    }

    SECTION("Missing mandatory field") {
        j.erase("network");
        REQUIRE_THROWS_AS(j.get<ScanJob>(), json::exception);
    }
}

TEST_CASE("DiscoveredDevice keeps the unknown type", "[JsonConvert]") {
    json j = {{"ip", "10.0.0.9"}, {"device_type", "unknown"}};
    auto device = j.get<DiscoveredDevice>();
    REQUIRE(device.deviceType == DeviceType::Unknown);
    REQUIRE(device.openPorts.empty());
    REQUIRE(device.confidenceScore == 0.0);
}

TEST_CASE("Device status JSON", "[JsonConvert]") {
    auto status = DeviceStatus::unreachable("r1", "Request timed out");
    json j = status;
    REQUIRE(j["device_id"] == "r1");
    REQUIRE(j["reachable"] == false);
    REQUIRE(j["error_message"] == "Request timed out");
    REQUIRE(j["health"].is_null());
    REQUIRE(j["interfaces"].is_null());

    DeviceHealth health;
    health.cpuPercent = 5.0;
    health.diskUsagePercent = std::map<std::string, double>{{"/", 40.0}};
    json h = health;
    REQUIRE(h["cpu_percent"] == 5.0);
    REQUIRE(h["memory_percent"].is_null());
    REQUIRE(h["disk_usage_percent"]["/"] == 40.0);

    InterfaceInfo iface;
    iface.name = "eth0";
    iface.status = InterfaceStatus::AdminDown;
    json i = iface;
    REQUIRE(i["status"] == "admin_down");
    REQUIRE(i["ip_addresses"].is_array());
}

TEST_CASE("DeviceRecord JSON uses device-file layout", "[JsonConvert]") {
    DeviceRecord device;
    device.id = "edge-r1";
    device.host = "10.0.0.1";
    device.deviceType = DeviceType::Router;
    device.enabledProtocols = {MonitorProtocol::Snmp, MonitorProtocol::Ssh};
    device.credentials.snmpCommunity = "n0cread";
    device.credentials.snmpVersion = SnmpVersion::V1;

    json j = device;
    REQUIRE(j["device_type"] == "router");
    REQUIRE(j["enabled_protocols"] == json::array({"snmp", "ssh"}));
    REQUIRE(j["timeout"] == 10);
    REQUIRE(j["retry_count"] == 3);
    REQUIRE(j["credentials"]["snmp_version"] == "1");

    json masked = device.credentials.maskedCopy();
    REQUIRE(masked["snmp_community"] == "n0***ad");
}
