#include "app/Application.hpp"
#include "infrastructure/serialization/JsonConvert.hpp"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace po = boost::program_options;
using json = nlohmann::json;
using netsentry::app::Application;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_USAGE = 2;

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Command name -> {minimum, maximum} positional arguments (-1: unbounded).
const std::map<std::string, std::pair<int, int>> COMMANDS{
    {"status", {0, -1}},     {"interfaces", {1, 1}},  {"interface", {2, 2}},
    {"health", {1, 1}},      {"ping", {1, 1}},        {"test", {1, 1}},
    {"reload", {0, 0}},      {"scan", {1, 1}},        {"scans", {0, 0}},
    {"scan-status", {1, 1}}, {"scan-results", {1, 1}}, {"scan-delete", {1, 1}},
    {"auto-add", {1, 1}},    {"cleanup", {1, 1}},     {"devices", {0, 0}},
};

void printUsage(const po::options_description& options) {
    std::cout << "NetSentry - network device monitoring and discovery\n\n"
              << "Usage:\n"
              << "  netsentry [OPTIONS] <command> [ARGS...]\n\n"
              << "Commands:\n"
              << "  status [ID...]           Status of the given (or all) devices\n"
              << "  interfaces ID            Interfaces of a device\n"
              << "  interface ID NAME        One interface of a device\n"
              << "  health ID                Health metrics of a device\n"
              << "  ping ID                  Reachability check\n"
              << "  test ID                  Protocol connection test\n"
              << "  reload                   Reload the device file\n"
              << "  scan CIDR                Run a discovery scan and wait for it\n"
              << "  scans                    Scan history\n"
              << "  scan-status ID           One scan job\n"
              << "  scan-results ID          Devices found by a scan\n"
              << "  scan-delete ID           Delete a finished scan\n"
              << "  auto-add ID              Register the devices of a completed scan\n"
              << "  cleanup DAYS             Delete scans older than DAYS days\n"
              << "  devices                  List devices (secrets masked)\n\n"
              << options << std::endl;
}

void printJson(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

int notFound(const std::string& what) {
    printJson(json{{"error", what + " not found"}});
    return EXIT_ERROR;
}

std::vector<uint16_t> parsePorts(const std::string& text) {
    std::vector<uint16_t> ports;
    std::istringstream iss(text);
    std::string token;
    while (std::getline(iss, token, ',')) {
        if (token.empty()) {
            continue;
        }
        size_t consumed = 0;
        int port = 0;
        try {
            port = std::stoi(token, &consumed);
        } catch (const std::exception&) {
            throw UsageError("Invalid port: " + token);
        }
        if (consumed != token.size() || port < 1 || port > 65535) {
            throw UsageError("Invalid port: " + token);
        }
        ports.push_back(static_cast<uint16_t>(port));
    }
    if (ports.empty()) {
        throw UsageError("No ports given");
    }
    return ports;
}

int parseInt(const std::string& text, const char* what) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw UsageError(std::string("Invalid ") + what + ": " + text);
    }
    if (consumed != text.size()) {
        throw UsageError(std::string("Invalid ") + what + ": " + text);
    }
    return value;
}

json historyEntry(const netsentry::core::ScanJob& job) {
    json entry = job;
    entry.erase("discovered_devices");
    return entry;
}

int runCommand(Application& app, const std::string& command, const std::vector<std::string>& args,
               const po::variables_map& vm) {
    namespace core = netsentry::core;
    auto& monitoring = app.monitoring();
    auto& scans = app.scans();

    if (command == "status") {
        auto statuses = args.empty() ? monitoring.getAllDeviceStatus()
                                     : monitoring.getMultipleDeviceStatus(args);
        if (args.size() == 1 && statuses.empty()) {
            return notFound("Device " + args[0]);
        }
        json out = json::object();
        for (const auto& [id, status] : statuses) {
            out[id] = status;
        }
        printJson(out);
        return EXIT_OK;
    }

    if (command == "interfaces") {
        auto interfaces = monitoring.getDeviceInterfaces(args[0]);
        if (!interfaces) {
            return notFound("Device " + args[0]);
        }
        printJson(*interfaces);
        return EXIT_OK;
    }

    if (command == "interface") {
        if (!app.devices().getDevice(args[0])) {
            return notFound("Device " + args[0]);
        }
        auto iface = monitoring.getDeviceInterface(args[0], args[1]);
        if (!iface) {
            return notFound("Interface " + args[1]);
        }
        printJson(*iface);
        return EXIT_OK;
    }

    if (command == "health") {
        auto health = monitoring.getDeviceHealth(args[0]);
        if (!health) {
            return notFound("Device " + args[0]);
        }
        printJson(*health);
        return EXIT_OK;
    }

    if (command == "ping") {
        auto check = monitoring.pingDevice(args[0]);
        if (!check) {
            return notFound("Device " + args[0]);
        }
        printJson(*check);
        return check->success ? EXIT_OK : EXIT_ERROR;
    }

    if (command == "test") {
        auto connected = monitoring.testDeviceConnection(args[0]);
        if (!connected) {
            return notFound("Device " + args[0]);
        }
        printJson(json{{"device_id", args[0]}, {"connected", *connected}});
        return *connected ? EXIT_OK : EXIT_ERROR;
    }

    if (command == "reload") {
        monitoring.reloadDevices();
        printJson(json{{"devices", monitoring.deviceIds()}});
        return EXIT_OK;
    }

    if (command == "scan") {
        const auto& discovery = app.config().config().discovery;
        auto type = core::scanTypeFromString(vm["type"].as<std::string>());
        if (!type) {
            throw UsageError("Unknown scan type: " + vm["type"].as<std::string>());
        }

        core::ScanOptions options;
        options.ports = vm.count("ports") ? parsePorts(vm["ports"].as<std::string>())
                                          : discovery.defaultPorts;
        options.snmpCommunities = discovery.snmpCommunities;
        options.timeoutSeconds = discovery.probeTimeoutSeconds;
        options.maxConcurrent = discovery.maxConcurrentProbes;
        options.useExternalTool = discovery.useNmap && !vm.count("no-nmap");

        std::string scanId;
        try {
            scanId = scans.startScan(args[0], *type, options);
        } catch (const std::invalid_argument& e) {
            throw UsageError(e.what());
        }

        auto wait = std::chrono::seconds(vm["wait"].as<int>());
        auto job = scans.waitForScan(scanId, wait);
        if (!job) {
            return notFound("Scan " + scanId);
        }
        printJson(job->maskedCopy());
        return job->status == core::ScanStatus::Completed ? EXIT_OK : EXIT_ERROR;
    }

    if (command == "scans") {
        int limit = vm.count("limit") ? vm["limit"].as<int>() : 0;
        json out = json::array();
        for (const auto& job : scans.getScanHistory(limit)) {
            out.push_back(historyEntry(job));
        }
        printJson(out);
        return EXIT_OK;
    }

    if (command == "scan-status") {
        auto job = scans.getScanStatus(args[0]);
        if (!job) {
            return notFound("Scan " + args[0]);
        }
        printJson(job->maskedCopy());
        return EXIT_OK;
    }

    if (command == "scan-results") {
        auto devices = scans.getScanResults(args[0]);
        if (!devices) {
            return notFound("Scan " + args[0]);
        }
        json out = json::array();
        for (const auto& device : *devices) {
            out.push_back(device.maskedCopy());
        }
        printJson(out);
        return EXIT_OK;
    }

    if (command == "scan-delete") {
        if (!scans.deleteScanResult(args[0])) {
            return notFound("Scan " + args[0]);
        }
        printJson(json{{"deleted", args[0]}});
        return EXIT_OK;
    }

    if (command == "auto-add") {
        netsentry::app::AutoAddResult result;
        try {
            result = scans.autoAddDevicesFromScan(args[0]);
        } catch (const std::invalid_argument& e) {
            printJson(json{{"error", e.what()}});
            return EXIT_ERROR;
        }
        json failed = json::array();
        for (const auto& failure : result.failed) {
            failed.push_back(json{{"ip", failure.ip}, {"error", failure.error}});
        }
        printJson(json{{"added_devices", result.added},
                       {"failed_devices", failed},
                       {"summary",
                        {{"total_discovered", result.totalDiscovered},
                         {"successfully_added", result.added.size()},
                         {"failed", result.failed.size()}}}});
        return result.failed.empty() ? EXIT_OK : EXIT_ERROR;
    }

    if (command == "cleanup") {
        int days = parseInt(args[0], "number of days");
        if (days < 0) {
            throw UsageError("Number of days must not be negative");
        }
        printJson(json{{"removed", scans.cleanupOldResults(days)}});
        return EXIT_OK;
    }

    if (command == "devices") {
        printJson(app.devices().exportDevices());
        return EXIT_OK;
    }

    throw UsageError("Unknown command: " + command);
}

} // namespace

int main(int argc, char* argv[]) {
    po::options_description options("Options");
    options.add_options()
        ("help,h", "Show help message")
        ("config-dir,c", po::value<std::string>(), "Configuration directory")
        ("type,t", po::value<std::string>()->default_value("ping"), "Scan type: ping, port or full")
        ("ports,p", po::value<std::string>(), "Comma-separated ports to scan")
        ("no-nmap", "Do not use nmap for this scan")
        ("wait,w", po::value<int>()->default_value(3600), "Seconds to wait for a scan")
        ("limit,n", po::value<int>(), "Number of history entries");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(), "Command")
        ("args", po::value<std::vector<std::string>>(), "Arguments");

    po::options_description all;
    all.add(options).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\nUse --help for usage information" << std::endl;
        return EXIT_USAGE;
    }

    if (vm.count("help")) {
        printUsage(options);
        return EXIT_OK;
    }
    if (!vm.count("command")) {
        printUsage(options);
        return EXIT_USAGE;
    }

    auto command = vm["command"].as<std::string>();
    std::vector<std::string> args;
    if (vm.count("args")) {
        args = vm["args"].as<std::vector<std::string>>();
    }
    auto entry = COMMANDS.find(command);
    if (entry == COMMANDS.end()) {
        std::cerr << "Error: unknown command '" << command << "'" << std::endl;
        return EXIT_USAGE;
    }
    auto [minArgs, maxArgs] = entry->second;
    if (static_cast<int>(args.size()) < minArgs ||
        (maxArgs >= 0 && static_cast<int>(args.size()) > maxArgs)) {
        std::cerr << "Error: wrong number of arguments for '" << command << "'" << std::endl;
        return EXIT_USAGE;
    }

    auto configDir = vm.count("config-dir")
                         ? std::filesystem::path(vm["config-dir"].as<std::string>())
                         : Application::defaultConfigDir();

    try {
        Application app(configDir);
        return runCommand(app, command, args, vm);
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        printJson(json{{"error", e.what()}});
        return EXIT_ERROR;
    }
}
