#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "infrastructure/monitors/SnmpMonitor.hpp"
#include "support/Fakes.hpp"

#include <stdexcept>

using namespace netsentry::core;
using namespace netsentry::infra;
using namespace netsentry::test;

namespace {

std::string column(const char* base, const std::string& index) {
    return std::string(base) + "." + index;
}

void populateSystemGroup(FakeSnmpClient& agent) {
    agent.setScalar(stringVar(SnmpOids::SYS_DESCR, "Cisco IOS Software, C2900"));
    agent.setScalar(stringVar(SnmpOids::SYS_NAME, "edge-r1"));
    agent.setScalar(stringVar(SnmpOids::SYS_CONTACT, "noc@example.net"));
    agent.setScalar(counterVar(SnmpOids::SYS_UPTIME, 123456, SnmpDataType::TimeTicks));
}

void populateInterfaces(FakeSnmpClient& agent) {
    agent.setTable(SnmpOids::IF_DESCR, {stringVar(column(SnmpOids::IF_DESCR, "1"), "Gi0/0"),
                                        stringVar(column(SnmpOids::IF_DESCR, "2"), "Gi0/1")});
    agent.setTable(SnmpOids::IF_OPER_STATUS, {intVar(column(SnmpOids::IF_OPER_STATUS, "1"), 1),
                                              intVar(column(SnmpOids::IF_OPER_STATUS, "2"), 2),
                                              intVar(column(SnmpOids::IF_OPER_STATUS, "9"), 1)});
    agent.setTable(SnmpOids::IF_ADMIN_STATUS, {intVar(column(SnmpOids::IF_ADMIN_STATUS, "1"), 1),
                                               intVar(column(SnmpOids::IF_ADMIN_STATUS, "2"), 2)});
    agent.setTable(SnmpOids::IF_SPEED, {counterVar(column(SnmpOids::IF_SPEED, "1"), 1000000000,
                                                   SnmpDataType::Gauge32)});
    agent.setTable(SnmpOids::IF_PHYS_ADDRESS,
                   {stringVar(column(SnmpOids::IF_PHYS_ADDRESS, "1"),
                              std::string("\x00\x1a\x2b\x3c\x4d\x5e", 6))});
    agent.setTable(SnmpOids::IF_IN_OCTETS, {counterVar(column(SnmpOids::IF_IN_OCTETS, "1"), 5000)});
    agent.setTable(SnmpOids::IP_AD_ENT_IF_INDEX,
                   {intVar(column(SnmpOids::IP_AD_ENT_IF_INDEX, "10.0.0.1"), 1),
                    intVar(column(SnmpOids::IP_AD_ENT_IF_INDEX, "192.0.2.1"), 1),
                    intVar(column(SnmpOids::IP_AD_ENT_IF_INDEX, "172.16.0.1"), 42)});
}

} // namespace

TEST_CASE("SnmpMonitor connection test", "[SnmpMonitor]") {
    FakeSnmpClient agent;
    auto device = makeDevice("edge-r1", "10.0.0.1");
    device.credentials.snmpCommunity = "n0c";
    SnmpMonitor monitor(device, agent);

    SECTION("Answering agent") {
        populateSystemGroup(agent);
        REQUIRE(monitor.testConnection());
    }

    SECTION("Wrong community looks like a dead agent") {
        populateSystemGroup(agent);
        agent.communities = {"public"};
        REQUIRE_FALSE(monitor.testConnection());
    }

    SECTION("Agent without sysDescr") {
        REQUIRE_FALSE(monitor.testConnection());
    }

    SECTION("Each request makes a single transport attempt") {
        auto patient = device;
        patient.retryCount = 5;
        SnmpMonitor retrying(patient, agent);
        agent.setDown(true);

        REQUIRE_FALSE(retrying.testConnection());
        REQUIRE(agent.getCalls.load() == 1);
        REQUIRE(agent.lastRetries.load() == 1);
    }
}

TEST_CASE("SnmpMonitor device info", "[SnmpMonitor]") {
    FakeSnmpClient agent;
    populateSystemGroup(agent);
    SnmpMonitor monitor(makeDevice("edge-r1", "10.0.0.1"), agent);

    auto info = monitor.getDeviceInfo();
    REQUIRE(info.name == "edge-r1");
    REQUIRE(info.description == "Cisco IOS Software, C2900");
    REQUIRE(info.contact == "noc@example.net");
    REQUIRE(info.location == "Unknown");
    REQUIRE(info.uptimeSeconds == 1234);

    SECTION("Dead agent throws") {
        agent.setDown(true);
        REQUIRE_THROWS_AS(monitor.getDeviceInfo(), std::runtime_error);
    }
}

TEST_CASE("SnmpMonitor joins interface columns by index", "[SnmpMonitor]") {
    FakeSnmpClient agent;
    populateSystemGroup(agent);
    populateInterfaces(agent);
    SnmpMonitor monitor(makeDevice("edge-r1", "10.0.0.1"), agent);

    auto interfaces = monitor.getInterfaces();

    // Row 9 has an oper status but no ifDescr and is dropped.
    REQUIRE(interfaces.size() == 2);

    const auto& gi0 = interfaces[0];
    REQUIRE(gi0.name == "Gi0/0");
    REQUIRE(gi0.status == InterfaceStatus::Up);
    REQUIRE(gi0.adminStatus == InterfaceStatus::Up);
    REQUIRE(gi0.speedMbps == 1000);
    REQUIRE(gi0.macAddress == "00:1a:2b:3c:4d:5e");
    REQUIRE(gi0.inOctets == 5000u);
    REQUIRE(gi0.ipAddresses == std::set<std::string>{"10.0.0.1", "192.0.2.1"});

    const auto& gi1 = interfaces[1];
    REQUIRE(gi1.name == "Gi0/1");
    REQUIRE(gi1.status == InterfaceStatus::Down);
    REQUIRE(gi1.adminStatus == InterfaceStatus::AdminDown);
    REQUIRE_FALSE(gi1.speedMbps.has_value());
    REQUIRE(gi1.ipAddresses.empty());

    SECTION("getInterface looks up by name") {
        REQUIRE(monitor.getInterface("Gi0/1").has_value());
        REQUIRE_FALSE(monitor.getInterface("Gi0/9").has_value());
    }
}

TEST_CASE("SnmpMonitor interface edge cases", "[SnmpMonitor]") {
    FakeSnmpClient agent;
    SnmpMonitor monitor(makeDevice("sw1", "10.0.0.2"), agent);

    SECTION("Empty table on a live agent") {
        populateSystemGroup(agent);
        REQUIRE(monitor.getInterfaces().empty());
    }

    SECTION("Dead agent throws") {
        agent.setDown(true);
        REQUIRE_THROWS_AS(monitor.getInterfaces(), std::runtime_error);
    }
}

TEST_CASE("SnmpMonitor health strategies", "[SnmpMonitor]") {
    FakeSnmpClient agent;
    populateSystemGroup(agent);
    SnmpMonitor monitor(makeDevice("edge-r1", "10.0.0.1"), agent);

    SECTION("Uptime comes from sysUpTime ticks") {
        auto health = monitor.getHealthMetrics();
        REQUIRE(health.uptimeSeconds == 1234);
        REQUIRE_FALSE(health.cpuPercent.has_value());
        REQUIRE_FALSE(health.memoryPercent.has_value());
    }

    SECTION("Cisco MIBs are preferred") {
        agent.setTable(SnmpOids::CISCO_CPU_5MIN,
                       {counterVar(column(SnmpOids::CISCO_CPU_5MIN, "1"), 17, SnmpDataType::Gauge32)});
        agent.setTable(SnmpOids::HR_PROCESSOR_LOAD,
                       {intVar(column(SnmpOids::HR_PROCESSOR_LOAD, "196608"), 90)});
        agent.setTable(SnmpOids::CISCO_MEM_POOL_USED,
                       {counterVar(column(SnmpOids::CISCO_MEM_POOL_USED, "1"), 256ULL * 1024 * 1024,
                                   SnmpDataType::Gauge32)});
        agent.setTable(SnmpOids::CISCO_MEM_POOL_FREE,
                       {counterVar(column(SnmpOids::CISCO_MEM_POOL_FREE, "1"), 768ULL * 1024 * 1024,
                                   SnmpDataType::Gauge32)});
        agent.setTable(SnmpOids::CISCO_TEMPERATURE,
                       {counterVar(column(SnmpOids::CISCO_TEMPERATURE, "1"), 40, SnmpDataType::Gauge32),
                        counterVar(column(SnmpOids::CISCO_TEMPERATURE, "2"), 0, SnmpDataType::Gauge32),
                        counterVar(column(SnmpOids::CISCO_TEMPERATURE, "3"), 50, SnmpDataType::Gauge32)});

        auto health = monitor.getHealthMetrics();
        REQUIRE(*health.cpuPercent == Catch::Approx(17.0));
        REQUIRE(*health.memoryPercent == Catch::Approx(25.0));
        REQUIRE(health.memoryUsedMb == 256);
        REQUIRE(health.memoryTotalMb == 1024);
        REQUIRE(*health.temperatureCelsius == Catch::Approx(45.0));
    }

    SECTION("Host resources MIB fallback") {
        agent.setTable(SnmpOids::HR_PROCESSOR_LOAD,
                       {intVar(column(SnmpOids::HR_PROCESSOR_LOAD, "196608"), 20),
                        intVar(column(SnmpOids::HR_PROCESSOR_LOAD, "196609"), 40)});

        SnmpVarBind ramType;
        ramType.oid = column(SnmpOids::HR_STORAGE_TYPE, "1");
        ramType.type = SnmpDataType::ObjectIdentifier;
        ramType.value = SnmpOids::HR_STORAGE_RAM;
        SnmpVarBind diskType = ramType;
        diskType.oid = column(SnmpOids::HR_STORAGE_TYPE, "31");
        diskType.value = "1.3.6.1.2.1.25.2.1.4";
        agent.setTable(SnmpOids::HR_STORAGE_TYPE, {ramType, diskType});
        agent.setTable(SnmpOids::HR_STORAGE_ALLOC_UNITS,
                       {intVar(column(SnmpOids::HR_STORAGE_ALLOC_UNITS, "1"), 1024),
                        intVar(column(SnmpOids::HR_STORAGE_ALLOC_UNITS, "31"), 4096)});
        agent.setTable(SnmpOids::HR_STORAGE_SIZE,
                       {intVar(column(SnmpOids::HR_STORAGE_SIZE, "1"), 2048 * 1024),
                        intVar(column(SnmpOids::HR_STORAGE_SIZE, "31"), 1000000)});
        agent.setTable(SnmpOids::HR_STORAGE_USED,
                       {intVar(column(SnmpOids::HR_STORAGE_USED, "1"), 512 * 1024),
                        intVar(column(SnmpOids::HR_STORAGE_USED, "31"), 900000)});

        auto health = monitor.getHealthMetrics();
        REQUIRE(*health.cpuPercent == Catch::Approx(30.0));
        REQUIRE(*health.memoryPercent == Catch::Approx(25.0));
        REQUIRE(health.memoryTotalMb == 2048);
        REQUIRE(health.memoryUsedMb == 512);
        REQUIRE_FALSE(health.temperatureCelsius.has_value());
    }

    SECTION("hrMemorySize gives a total without a percentage") {
        agent.setScalar(intVar(SnmpOids::HR_MEMORY_SIZE, 8 * 1024 * 1024));
        auto health = monitor.getHealthMetrics();
        REQUIRE(health.memoryTotalMb == 8192);
        REQUIRE_FALSE(health.memoryPercent.has_value());
    }

    SECTION("Dead agent throws") {
        agent.setDown(true);
        REQUIRE_THROWS_AS(monitor.getHealthMetrics(), std::runtime_error);
    }
}

TEST_CASE("SnmpMonitor composite status", "[SnmpMonitor]") {
    FakeSnmpClient agent;
    populateSystemGroup(agent);
    populateInterfaces(agent);
    SnmpMonitor monitor(makeDevice("edge-r1", "10.0.0.1"), agent);

    SECTION("Reachable device") {
        auto status = monitor.getDeviceStatus();
        REQUIRE(status.reachable);
        REQUIRE(status.deviceId == "edge-r1");
        REQUIRE(status.uptimeSeconds == 1234);
        REQUIRE(status.interfaces->size() == 2);
        REQUIRE_FALSE(status.errorMessage.has_value());
    }

    SECTION("Unreachable device has no health or interfaces") {
        agent.setDown(true);
        auto status = monitor.getDeviceStatus();
        REQUIRE_FALSE(status.reachable);
        REQUIRE(status.errorMessage.has_value());
        REQUIRE_FALSE(status.health.has_value());
        REQUIRE_FALSE(status.interfaces.has_value());
    }
}

TEST_CASE("formatMacAddress", "[SnmpMonitor]") {
    REQUIRE(formatMacAddress(std::string("\xAA\xBB\x0C\x00\x01\xFF", 6)) == "aa:bb:0c:00:01:ff");
    REQUIRE(formatMacAddress("").empty());
}
