#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>

using namespace netsentry::infra;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "netsentry_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path);
    file << content;
}

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "netsentry_config_new_test";
        std::filesystem::remove_all(tempPath);

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::is_directory(tempPath));
        std::filesystem::remove_all(tempPath);
    }

    SECTION("Sets correct config path") {
        TestConfigDir testDir;
        ConfigManager manager(testDir.path());

        REQUIRE(manager.configPath() == testDir.path() / "config.json");
    }
}

TEST_CASE("ConfigManager storage paths", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path());

    SECTION("Relative paths resolve under the config directory") {
        REQUIRE(manager.databasePath() == testDir.path() / "scans.db");
        REQUIRE(manager.devicesPath() == testDir.path() / "devices.json");
        REQUIRE(manager.logPath() == testDir.path() / "netsentry.log");
    }

    SECTION("Absolute paths are kept") {
        manager.config().storage.resultsDatabase = "/var/lib/netsentry/scans.db";
        REQUIRE(manager.databasePath() == std::filesystem::path("/var/lib/netsentry/scans.db"));
    }
}

TEST_CASE("ConfigManager load", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("First run writes defaults") {
        ConfigManager manager(testDir.path());

        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));
        REQUIRE(manager.config().monitoring.cacheTtlSeconds == 300);
        REQUIRE(manager.config().monitoring.maxConcurrentQueries == 10);
        REQUIRE(manager.config().discovery.maxConcurrentProbes == 50);
        REQUIRE(manager.config().discovery.useNmap);
    }

    SECTION("Missing keys keep their defaults") {
        writeFile(testDir.path() / "config.json",
                  R"({"monitoring": {"cache_ttl_seconds": 60},
                      "discovery": {"use_nmap": false, "default_ports": [22, 161]}})");
        ConfigManager manager(testDir.path());

        REQUIRE(manager.load());
        REQUIRE(manager.config().monitoring.cacheTtlSeconds == 60);
        REQUIRE(manager.config().monitoring.defaultRetryCount == 3);
        REQUIRE_FALSE(manager.config().discovery.useNmap);
        REQUIRE(manager.config().discovery.defaultPorts == std::vector<uint16_t>{22, 161});
        REQUIRE(manager.config().discovery.snmpCommunities ==
                std::vector<std::string>{"public", "private"});
        REQUIRE(manager.config().logging.level == "info");
    }

    SECTION("Malformed file keeps defaults and reports failure") {
        writeFile(testDir.path() / "config.json", "{ not json");
        ConfigManager manager(testDir.path());

        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().monitoring.cacheTtlSeconds == 300);
    }
}

TEST_CASE("ConfigManager save and reload", "[ConfigManager]") {
    TestConfigDir testDir;

    {
        ConfigManager manager(testDir.path());
        manager.config().monitoring.maxConcurrentQueries = 4;
        manager.config().discovery.nmapPath = "/usr/local/bin/nmap";
        manager.config().storage.devicesFile = "inventory.json";
        manager.config().logging.level = "debug";
        REQUIRE(manager.save());
    }

    ConfigManager reloaded(testDir.path());
    REQUIRE(reloaded.load());
    REQUIRE(reloaded.config().monitoring.maxConcurrentQueries == 4);
    REQUIRE(reloaded.config().discovery.nmapPath == "/usr/local/bin/nmap");
    REQUIRE(reloaded.devicesPath() == testDir.path() / "inventory.json");
    REQUIRE(reloaded.config().logging.level == "debug");
}
