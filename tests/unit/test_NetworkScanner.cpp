#include <catch2/catch_test_macros.hpp>

#include "infrastructure/discovery/BuiltinDiscoveryStrategy.hpp"
#include "infrastructure/discovery/NetworkScanner.hpp"
#include "infrastructure/discovery/NmapDiscoveryStrategy.hpp"
#include "support/Fakes.hpp"

#include <algorithm>
#include <mutex>
#include <set>
#include <stdexcept>

using namespace netsentry::core;
using namespace netsentry::infra;
using namespace netsentry::test;
using namespace std::chrono_literals;

namespace {

class FakeProcessRunner : public ProcessRunner {
public:
    ProcessResult run(const std::string& executable, const std::vector<std::string>& args,
                      std::chrono::milliseconds timeout) override {
        ++runs;
        lastExecutable = executable;
        lastArgs = args;
        lastTimeout = timeout;
        return result;
    }

    std::optional<std::string> findExecutable(const std::string& name) override {
        if (!installed) {
            return std::nullopt;
        }
        return "/usr/bin/" + name;
    }

    bool installed{true};
    ProcessResult result;
    int runs{0};
    std::string lastExecutable;
    std::vector<std::string> lastArgs;
    std::chrono::milliseconds lastTimeout{0};
};

const char* const REPORT = R"(<?xml version="1.0"?>
<nmaprun>
  <host><status state="up"/><address addr="10.0.0.1" addrtype="ipv4"/><times srtt="800"/>
    <ports><port protocol="tcp" portid="22"><state state="open"/></port></ports></host>
  <host><status state="up"/><address addr="10.9.9.9" addrtype="ipv4"/></host>
</nmaprun>)";

ProcessResult finished(const std::string& output, int exitCode = 0) {
    ProcessResult result;
    result.started = true;
    result.exitCode = exitCode;
    result.output = output;
    return result;
}

NetworkScanResult cannedResult(const std::string& strategy) {
    NetworkScanResult result;
    result.strategy = strategy;
    result.totalHosts = 2;
    result.aliveHosts.push_back({"10.0.0.1", 1.0, std::nullopt});
    return result;
}

} // namespace

TEST_CASE("NmapDiscoveryStrategy command line", "[NmapDiscoveryStrategy]") {
    DiscoveryRequest request;
    request.network = "10.0.0.0/24";

    SECTION("Ping scan") {
        REQUIRE(NmapDiscoveryStrategy::buildArguments(request) ==
                std::vector<std::string>{"-sn", "-oX", "-", "10.0.0.0/24"});
    }

    SECTION("Port scan") {
        request.scanPorts = true;
        request.ports = {22, 80, 161};
        REQUIRE(NmapDiscoveryStrategy::buildArguments(request) ==
                std::vector<std::string>{"-T4", "-p", "22,80,161", "--open", "-oX", "-",
                                         "10.0.0.0/24"});
    }

    SECTION("Port scan without ports degrades to a ping scan") {
        request.scanPorts = true;
        REQUIRE(NmapDiscoveryStrategy::buildArguments(request).front() == "-sn");
    }
}

TEST_CASE("NmapDiscoveryStrategy runs nmap", "[NmapDiscoveryStrategy]") {
    FakeProcessRunner runner;
    NmapDiscoveryStrategy nmap(runner);

    DiscoveryRequest request;
    request.network = "10.0.0.0/30";
    request.timeout = 2s;

    SECTION("Availability follows PATH lookup") {
        REQUIRE(nmap.isAvailable());
        runner.installed = false;
        REQUIRE_FALSE(nmap.isAvailable());
    }

    SECTION("Port scan result is restricted to the range and requested ports") {
        request.scanPorts = true;
        request.ports = {22, 443};
        runner.result = finished(REPORT);

        int progressTotal = -1;
        request.onProgress = [&](int, int total) { progressTotal = total; };

        auto result = nmap.discover(request);
        REQUIRE(result.has_value());
        REQUIRE(runner.lastTimeout == 200s);
        REQUIRE(result->strategy == "nmap");
        REQUIRE(result->totalHosts == 2);
        REQUIRE(progressTotal == 2);
        REQUIRE(result->aliveHosts.size() == 1);
        REQUIRE(result->aliveHosts[0].address == "10.0.0.1");
        REQUIRE(result->portResults.at("10.0.0.1").at(22));
        REQUIRE_FALSE(result->portResults.at("10.0.0.1").at(443));
    }

    SECTION("Ping scan uses the shorter wall clock and records no ports") {
        runner.result = finished(REPORT);
        auto result = nmap.discover(request);
        REQUIRE(result.has_value());
        REQUIRE(runner.lastTimeout == 100s);
        REQUIRE(result->portResults.empty());
    }

    SECTION("Non-zero exit declines") {
        runner.result = finished(REPORT, 1);
        REQUIRE_FALSE(nmap.discover(request).has_value());
    }

    SECTION("Timeout declines") {
        runner.result = finished("");
        runner.result.timedOut = true;
        REQUIRE_FALSE(nmap.discover(request).has_value());
    }

    SECTION("Unparsable output declines") {
        runner.result = finished("Starting Nmap 7.94");
        REQUIRE_FALSE(nmap.discover(request).has_value());
    }
}

TEST_CASE("BuiltinDiscoveryStrategy sweeps and scans", "[BuiltinDiscoveryStrategy]") {
    FakePingService ping({"10.0.0.6", "10.0.0.2"});
    FakePortScanner ports;
    ports.open("10.0.0.2", 22);
    BuiltinDiscoveryStrategy builtin(ping, ports);

    DiscoveryRequest request;
    request.network = "10.0.0.0/29";
    request.maxConcurrent = 3;

    std::mutex progressMutex;
    int lastScanned = 0;
    std::set<int> reportedTotals;
    request.onProgress = [&](int scanned, int total) {
        std::lock_guard lock(progressMutex);
        reportedTotals.insert(total);
        lastScanned = std::max(lastScanned, scanned);
    };

    SECTION("Ping only") {
        auto result = builtin.discover(request);
        REQUIRE(result.has_value());
        REQUIRE(ping.calls.load() == 6);
        REQUIRE(lastScanned == 6);
        REQUIRE(reportedTotals == std::set<int>{6});
        REQUIRE(result->totalHosts == 6);
        REQUIRE(result->aliveHosts.size() == 2);
        REQUIRE(result->aliveHosts[0].address == "10.0.0.2");
        REQUIRE(result->aliveHosts[1].address == "10.0.0.6");
        REQUIRE(result->aliveHosts[0].responseTimeMs == 1.5);
        REQUIRE(result->portResults.empty());
        REQUIRE(ports.probed.empty());
    }

    SECTION("With ports") {
        request.scanPorts = true;
        request.ports = {22, 80};
        auto result = builtin.discover(request);
        REQUIRE(result.has_value());
        REQUIRE(ports.probed.size() == 4);
        REQUIRE(result->openPorts("10.0.0.2") == std::set<uint16_t>{22});
        REQUIRE(result->portResults.at("10.0.0.6").size() == 2);
        REQUIRE(result->openPorts("10.0.0.6").empty());
    }

    SECTION("maxHosts caps the sweep") {
        request.network = "10.0.0.0/24";
        request.onProgress = nullptr;
        request.maxHosts = 10;
        auto result = builtin.discover(request);
        REQUIRE(ping.calls.load() == 10);
        REQUIRE(result->totalHosts == 10);
        REQUIRE(result->aliveHosts.size() == 2);
    }
}

TEST_CASE("NetworkScanner strategy selection", "[NetworkScanner]") {
    FakeSnmpClient snmp;
    DiscoveryRequest request;
    request.network = "10.0.0.0/30";

    auto makeScanner = [&](std::optional<NetworkScanResult> external, bool externalAvailable,
                           std::optional<NetworkScanResult> builtin, FakeDiscoveryStrategy*& ext,
                           FakeDiscoveryStrategy*& bi) {
        auto extStrategy =
            std::make_unique<FakeDiscoveryStrategy>("nmap", std::move(external), externalAvailable);
        auto biStrategy = std::make_unique<FakeDiscoveryStrategy>("builtin", std::move(builtin));
        ext = extStrategy.get();
        bi = biStrategy.get();
        return NetworkScanner(std::move(extStrategy), std::move(biStrategy), snmp,
                              [](const std::string&) { return std::optional<std::string>(); });
    };

    FakeDiscoveryStrategy* ext = nullptr;
    FakeDiscoveryStrategy* bi = nullptr;

    SECTION("External result is used when it succeeds") {
        auto scanner = makeScanner(cannedResult("nmap"), true, cannedResult("builtin"), ext, bi);
        REQUIRE(scanner.discoverHosts(request, true).strategy == "nmap");
        REQUIRE(bi->calls == 0);
    }

    SECTION("External failure falls back") {
        auto scanner = makeScanner(std::nullopt, true, cannedResult("builtin"), ext, bi);
        REQUIRE(scanner.discoverHosts(request, true).strategy == "builtin");
        REQUIRE(ext->calls == 1);
        REQUIRE(bi->calls == 1);
    }

    SECTION("Unavailable external tool is not run") {
        auto scanner = makeScanner(cannedResult("nmap"), false, cannedResult("builtin"), ext, bi);
        REQUIRE(scanner.discoverHosts(request, true).strategy == "builtin");
        REQUIRE(ext->calls == 0);
    }

    SECTION("Caller can disable the external tool") {
        auto scanner = makeScanner(cannedResult("nmap"), true, cannedResult("builtin"), ext, bi);
        REQUIRE(scanner.discoverHosts(request, false).strategy == "builtin");
        REQUIRE(ext->calls == 0);
    }

    SECTION("Built-in failure is an error") {
        auto scanner = makeScanner(std::nullopt, true, std::nullopt, ext, bi);
        REQUIRE_THROWS_AS(scanner.discoverHosts(request, true), std::runtime_error);
    }

    SECTION("A built-in strategy is required") {
        REQUIRE_THROWS_AS(NetworkScanner(nullptr, nullptr, snmp), std::invalid_argument);
    }
}

TEST_CASE("NetworkScanner enrichment", "[NetworkScanner]") {
    FakeSnmpClient snmp;
    snmp.setScalar(stringVar(SnmpOids::SYS_DESCR, "Cisco IOS Software"));
    snmp.communities = {"private"};

    NetworkScanner scanner(
        nullptr, std::make_unique<FakeDiscoveryStrategy>("builtin", std::nullopt), snmp,
        [](const std::string& address) -> std::optional<std::string> {
            if (address == "10.0.0.1") {
                return std::string("gw.lab.local");
            }
            return std::nullopt;
        });

    SECTION("First answering community wins") {
        auto enrichment = scanner.enrichHosts({"10.0.0.1", "10.0.0.2"}, {"public", "private"}, 1s, 2);
        REQUIRE(enrichment.size() == 2);
        REQUIRE(enrichment.at("10.0.0.1").hostname == "gw.lab.local");
        REQUIRE_FALSE(enrichment.at("10.0.0.2").hostname.has_value());
        REQUIRE(enrichment.at("10.0.0.1").snmp->community == "private");
        REQUIRE(enrichment.at("10.0.0.1").snmp->systemDescription == "Cisco IOS Software");
    }

    SECTION("No communities skips SNMP") {
        auto enrichment = scanner.enrichHosts({"10.0.0.1"}, {}, 1s, 2);
        REQUIRE_FALSE(enrichment.at("10.0.0.1").snmp.has_value());
        REQUIRE(snmp.getCalls.load() == 0);
    }

    SECTION("No community answers") {
        auto enrichment = scanner.enrichHosts({"10.0.0.1"}, {"public"}, 1s, 2);
        REQUIRE_FALSE(enrichment.at("10.0.0.1").snmp.has_value());
    }
}
