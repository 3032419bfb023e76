#pragma once

#include "core/services/IDeviceRegistry.hpp"
#include "core/services/IHttpClient.hpp"
#include "core/services/INetworkScanner.hpp"
#include "core/services/IPingService.hpp"
#include "core/services/IPortScanner.hpp"
#include "core/services/IProtocolMonitor.hpp"
#include "core/services/ISnmpClient.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace netsentry::test {

inline core::SnmpVarBind stringVar(const std::string& oid, const std::string& value) {
    core::SnmpVarBind vb;
    vb.oid = oid;
    vb.type = core::SnmpDataType::OctetString;
    vb.value = value;
    return vb;
}

inline core::SnmpVarBind intVar(const std::string& oid, int64_t value) {
    core::SnmpVarBind vb;
    vb.oid = oid;
    vb.type = core::SnmpDataType::Integer;
    vb.value = std::to_string(value);
    vb.intValue = value;
    return vb;
}

inline core::SnmpVarBind counterVar(const std::string& oid, uint64_t value,
                                    core::SnmpDataType type = core::SnmpDataType::Counter32) {
    core::SnmpVarBind vb;
    vb.oid = oid;
    vb.type = type;
    vb.value = std::to_string(value);
    vb.counterValue = value;
    return vb;
}

/**
 * @brief Agent answering GETs from a scalar table and WALKs from subtrees.
 */
class FakeSnmpClient : public core::ISnmpClient {
public:
    void setScalar(const core::SnmpVarBind& vb) { scalars_[vb.oid] = vb; }
    void setTable(const std::string& root, std::vector<core::SnmpVarBind> rows) {
        tables_[root] = std::move(rows);
    }
    void setDown(bool down) { down_ = down; }

    /// Communities the agent answers to; empty accepts all.
    std::set<std::string> communities;

    core::SnmpResult get(const core::SnmpTarget& target,
                         const std::vector<std::string>& oids) override {
        ++getCalls;
        lastRetries = target.retries;
        core::SnmpResult result;
        result.timestamp = std::chrono::system_clock::now();
        if (down_ || (!communities.empty() && communities.count(target.community) == 0)) {
            result.errorMessage = "Request timed out";
            return result;
        }
        result.success = true;
        for (const auto& oid : oids) {
            auto it = scalars_.find(oid);
            if (it != scalars_.end()) {
                result.varbinds.push_back(it->second);
            } else {
                core::SnmpVarBind missing;
                missing.oid = oid;
                missing.type = core::SnmpDataType::NoSuchObject;
                result.varbinds.push_back(missing);
            }
        }
        return result;
    }

    core::SnmpResult getNext(const core::SnmpTarget&, const std::vector<std::string>&) override {
        core::SnmpResult result;
        result.errorMessage = "not supported";
        return result;
    }

    std::vector<core::SnmpVarBind> walk(const core::SnmpTarget& target,
                                        const std::string& root) override {
        ++walkCalls;
        lastRetries = target.retries;
        if (down_) {
            return {};
        }
        auto it = tables_.find(root);
        return it == tables_.end() ? std::vector<core::SnmpVarBind>{} : it->second;
    }

    std::atomic<int> getCalls{0};
    std::atomic<int> walkCalls{0};
    std::atomic<int> lastRetries{0}; ///< SnmpTarget::retries of the latest request

private:
    std::map<std::string, core::SnmpVarBind> scalars_;
    std::map<std::string, std::vector<core::SnmpVarBind>> tables_;
    bool down_{false};
};

/**
 * @brief HTTP server stub keyed by request path.
 */
class FakeHttpClient : public core::IHttpClient {
public:
    void respond(const std::string& path, int status, const std::string& body) {
        core::HttpResponse response;
        response.success = true;
        response.statusCode = status;
        response.body = body;
        responses_[path] = response;
    }

    core::HttpResponse send(const core::HttpRequest& request) override {
        std::lock_guard lock(mutex_);
        requests.push_back(request);
        auto it = responses_.find(request.path);
        if (it != responses_.end()) {
            return it->second;
        }
        core::HttpResponse notFound;
        notFound.success = true;
        notFound.statusCode = 404;
        return notFound;
    }

    std::vector<core::HttpRequest> requests;

private:
    std::map<std::string, core::HttpResponse> responses_;
    std::mutex mutex_;
};

/**
 * @brief Ping service where a fixed set of addresses answers.
 */
class FakePingService : public core::IPingService {
public:
    explicit FakePingService(std::set<std::string> alive = {}) : alive_(std::move(alive)) {}

    std::future<core::PingResult> pingAsync(const std::string& address,
                                            std::chrono::milliseconds) override {
        ++calls;
        core::PingResult result;
        result.address = address;
        result.timestamp = std::chrono::system_clock::now();
        if (alive_.count(address) > 0) {
            result.success = true;
            result.latency = std::chrono::microseconds(1500);
        } else {
            result.errorMessage = "Request timed out";
        }
        std::promise<core::PingResult> promise;
        promise.set_value(result);
        return promise.get_future();
    }

    std::atomic<int> calls{0};

private:
    std::set<std::string> alive_;
};

/**
 * @brief Port scanner with a fixed set of open (host, port) pairs.
 */
class FakePortScanner : public core::IPortScanner {
public:
    void open(const std::string& host, uint16_t port) { open_[host].insert(port); }

    std::vector<core::PortProbeResult> scan(const core::PortScanRequest& request) override {
        std::vector<core::PortProbeResult> results;
        for (const auto& host : request.targets) {
            for (auto port : request.ports) {
                results.push_back({host, port, probe(host, port, request.timeout)});
            }
        }
        return results;
    }

    core::PortState probe(const std::string& address, uint16_t port,
                          std::chrono::milliseconds) override {
        std::lock_guard lock(mutex_);
        probed.emplace_back(address, port);
        auto it = open_.find(address);
        return it != open_.end() && it->second.count(port) > 0 ? core::PortState::Open
                                                               : core::PortState::Closed;
    }

    std::vector<std::pair<std::string, uint16_t>> probed;

private:
    std::map<std::string, std::set<uint16_t>> open_;
    std::mutex mutex_;
};

/**
 * @brief In-memory registry.
 */
class FakeDeviceRegistry : public core::IDeviceRegistry {
public:
    explicit FakeDeviceRegistry(std::vector<core::DeviceRecord> devices = {}) {
        for (auto& device : devices) {
            devices_[device.id] = std::move(device);
        }
    }

    void reload() override { ++reloads; }

    std::vector<core::DeviceRecord> getAllDevices() const override {
        std::lock_guard lock(mutex_);
        std::vector<core::DeviceRecord> all;
        for (const auto& [id, device] : devices_) {
            all.push_back(device);
        }
        return all;
    }

    std::optional<core::DeviceRecord> getDevice(const std::string& id) const override {
        std::lock_guard lock(mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void addDevice(const core::DeviceRecord& device) override {
        std::lock_guard lock(mutex_);
        if (rejectHost == device.host) {
            throw std::runtime_error("storage rejected " + device.host);
        }
        if (!device.isValid() || devices_.count(device.id) > 0) {
            throw std::invalid_argument("cannot add " + device.id);
        }
        devices_[device.id] = device;
    }

    void replace(std::vector<core::DeviceRecord> devices) {
        std::lock_guard lock(mutex_);
        devices_.clear();
        for (auto& device : devices) {
            devices_[device.id] = std::move(device);
        }
    }

    std::string rejectHost;
    int reloads{0};

private:
    std::map<std::string, core::DeviceRecord> devices_;
    mutable std::mutex mutex_;
};

/**
 * @brief Scriptable protocol monitor.
 *
 * Fails the first failuresBeforeSuccess status attempts, then succeeds.
 * Tracks the number of concurrent getDeviceStatus() calls.
 */
class FakeMonitor : public core::IProtocolMonitor {
public:
    struct Shared {
        std::atomic<int> inFlight{0};
        std::atomic<int> maxInFlight{0};
        std::chrono::milliseconds statusDelay{0};
    };

    FakeMonitor(core::DeviceRecord device, Shared& shared) : device_(std::move(device)), shared_(shared) {}

    const core::DeviceRecord& device() const override { return device_; }
    core::MonitorProtocol protocol() const override { return core::MonitorProtocol::Snmp; }

    bool testConnection() override { return reachable; }

    core::DeviceInfo getDeviceInfo() override {
        core::DeviceInfo info;
        info.name = device_.name;
        return info;
    }

    std::vector<core::InterfaceInfo> getInterfaces() override {
        ++interfaceCalls;
        core::InterfaceInfo eth0;
        eth0.name = "eth0";
        eth0.status = core::InterfaceStatus::Up;
        core::InterfaceInfo eth1;
        eth1.name = "eth1";
        eth1.status = core::InterfaceStatus::Down;
        return {eth0, eth1};
    }

    core::DeviceHealth getHealthMetrics() override {
        ++healthCalls;
        if (healthFailures > 0) {
            --healthFailures;
            throw std::runtime_error("health walk timed out");
        }
        core::DeviceHealth health;
        health.cpuPercent = 12.5;
        health.uptimeSeconds = 1234;
        return health;
    }

    core::DeviceStatus getDeviceStatus() override {
        ++statusCalls;
        int now = ++shared_.inFlight;
        int previous = shared_.maxInFlight.load();
        while (now > previous && !shared_.maxInFlight.compare_exchange_weak(previous, now)) {
        }
        if (shared_.statusDelay.count() > 0) {
            std::this_thread::sleep_for(shared_.statusDelay);
        }
        --shared_.inFlight;

        if (failuresBeforeSuccess > 0) {
            --failuresBeforeSuccess;
            return core::DeviceStatus::unreachable(device_.id, "Request timed out");
        }
        if (!reachable) {
            return core::DeviceStatus::unreachable(device_.id, "Request timed out");
        }
        return core::IProtocolMonitor::getDeviceStatus();
    }

    bool reachable{true};
    std::atomic<int> failuresBeforeSuccess{0};
    std::atomic<int> healthFailures{0};
    std::atomic<int> statusCalls{0};
    std::atomic<int> interfaceCalls{0};
    std::atomic<int> healthCalls{0};

private:
    core::DeviceRecord device_;
    Shared& shared_;
};

/**
 * @brief Factory handing out FakeMonitors and keeping pointers to them.
 */
class FakeMonitorFactory : public core::IMonitorFactory {
public:
    std::unique_ptr<core::IProtocolMonitor> createMonitor(const core::DeviceRecord& device) override {
        auto monitor = std::make_unique<FakeMonitor>(device, shared);
        if (auto it = setup.find(device.id); it != setup.end()) {
            it->second(*monitor);
        }
        std::lock_guard lock(mutex_);
        created[device.id] = monitor.get();
        return monitor;
    }

    FakeMonitor::Shared shared;
    std::map<std::string, std::function<void(FakeMonitor&)>> setup;
    std::map<std::string, FakeMonitor*> created;

private:
    std::mutex mutex_;
};

/**
 * @brief Discovery strategy returning a canned result.
 */
class FakeDiscoveryStrategy : public core::IHostDiscoveryStrategy {
public:
    FakeDiscoveryStrategy(std::string name, std::optional<core::NetworkScanResult> result,
                          bool available = true)
        : name_(std::move(name)), result_(std::move(result)), available_(available) {}

    std::string name() const override { return name_; }
    bool isAvailable() override { return available_; }

    std::optional<core::NetworkScanResult> discover(const core::DiscoveryRequest& request) override {
        ++calls;
        lastRequest = request;
        if (result_ && request.onProgress) {
            request.onProgress(result_->totalHosts, result_->totalHosts);
        }
        return result_;
    }

    int calls{0};
    core::DiscoveryRequest lastRequest;

private:
    std::string name_;
    std::optional<core::NetworkScanResult> result_;
    bool available_;
};

/**
 * @brief Discovery strategy that holds every scan until released.
 */
class GatedDiscoveryStrategy : public core::IHostDiscoveryStrategy {
public:
    explicit GatedDiscoveryStrategy(core::NetworkScanResult result) : result_(std::move(result)) {}

    std::string name() const override { return "gated"; }
    bool isAvailable() override { return true; }

    std::optional<core::NetworkScanResult> discover(const core::DiscoveryRequest&) override {
        std::unique_lock lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return released_; });
        return result_;
    }

    bool waitUntilEntered(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return entered_; });
    }

    void release() {
        std::lock_guard lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

private:
    core::NetworkScanResult result_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_{false};
    bool released_{false};
};

inline core::DeviceRecord makeDevice(const std::string& id, const std::string& host,
                                     int retryCount = 1) {
    core::DeviceRecord device;
    device.id = id;
    device.name = id;
    device.host = host;
    device.retryCount = retryCount;
    device.timeoutSeconds = 1;
    return device;
}

} // namespace netsentry::test
