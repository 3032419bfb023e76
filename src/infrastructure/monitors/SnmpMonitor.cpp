#include "infrastructure/monitors/SnmpMonitor.hpp"

#include "infrastructure/network/SnmpCodec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <stdexcept>

namespace netsentry::infra {

namespace {

using core::SnmpOids::CISCO_CPU_5MIN;
using core::SnmpOids::CISCO_MEM_POOL_FREE;
using core::SnmpOids::CISCO_MEM_POOL_USED;
using core::SnmpOids::CISCO_TEMPERATURE;

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

std::optional<int64_t> parseIndex(const std::string& suffix) {
    if (suffix.empty() || suffix.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoll(suffix);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<int64_t> numericValues(const std::vector<core::SnmpVarBind>& varbinds) {
    std::vector<int64_t> values;
    for (const auto& vb : varbinds) {
        if (auto n = vb.numericValue()) {
            values.push_back(*n);
        }
    }
    return values;
}

// Column values keyed by index suffix.
std::map<std::string, int64_t> numericColumn(const std::vector<core::SnmpVarBind>& varbinds,
                                             const std::string& column) {
    std::map<std::string, int64_t> values;
    for (const auto& vb : varbinds) {
        auto n = vb.numericValue();
        auto suffix = SnmpCodec::oidSuffix(column, vb.oid);
        if (n && !suffix.empty()) {
            values[suffix] = *n;
        }
    }
    return values;
}

std::string valueOr(const core::SnmpResult& result, const char* oid, const std::string& fallback) {
    auto vb = result.getVarBind(oid);
    return vb && !vb->value.empty() ? vb->value : fallback;
}

} // namespace

std::string formatMacAddress(const std::string& raw) {
    static constexpr char hex[] = "0123456789abcdef";
    std::string mac;
    for (size_t i = 0; i < raw.size(); ++i) {
        if (i > 0) {
            mac.push_back(':');
        }
        auto byte = static_cast<uint8_t>(raw[i]);
        mac.push_back(hex[byte >> 4]);
        mac.push_back(hex[byte & 0x0F]);
    }
    return mac;
}

SnmpMonitor::SnmpMonitor(core::DeviceRecord device, core::ISnmpClient& client)
    : device_(std::move(device)), client_(client) {}

core::SnmpTarget SnmpMonitor::target() const {
    core::SnmpTarget target;
    target.address = device_.host;
    target.community = device_.credentials.snmpCommunity;
    target.version = device_.credentials.snmpVersion;
    target.timeoutMs = std::max(1, device_.timeoutSeconds) * 1000;
    // One transport attempt per request; MonitoringCoordinator retries whole polls.
    target.retries = 1;
    return target;
}

bool SnmpMonitor::testConnection() {
    auto result = client_.get(target(), {core::SnmpOids::SYS_DESCR});
    if (!result.success) {
        spdlog::debug("SNMP test of {} failed: {}", device_.id, result.errorMessage);
        return false;
    }
    return result.getVarBind(core::SnmpOids::SYS_DESCR).has_value();
}

core::DeviceInfo SnmpMonitor::getDeviceInfo() {
    using namespace core::SnmpOids;

    auto result = client_.get(
        target(), {SYS_DESCR, SYS_OBJECT_ID, SYS_UPTIME, SYS_CONTACT, SYS_NAME, SYS_LOCATION});
    if (!result.success) {
        throw std::runtime_error("SNMP system query failed: " + result.errorMessage);
    }

    core::DeviceInfo info;
    info.description = valueOr(result, SYS_DESCR, "Unknown");
    info.name = valueOr(result, SYS_NAME, "Unknown");
    info.location = valueOr(result, SYS_LOCATION, "Unknown");
    info.contact = valueOr(result, SYS_CONTACT, "Unknown");
    info.objectId = valueOr(result, SYS_OBJECT_ID, "");
    if (auto uptime = result.getVarBind(SYS_UPTIME)) {
        if (auto ticks = uptime->numericValue()) {
            info.uptimeSeconds = *ticks / 100;
        }
    }
    return info;
}

std::vector<core::InterfaceInfo> SnmpMonitor::getInterfaces() {
    using namespace core::SnmpOids;

    struct Row {
        core::InterfaceInfo info;
        bool hasDescr{false};
    };
    std::map<int64_t, Row> rows;
    const auto agent = target();

    auto descrs = client_.walk(agent, IF_DESCR);
    if (descrs.empty()) {
        // An empty table and a dead agent look the same to a walk.
        auto probe = client_.get(agent, {SYS_DESCR});
        if (!probe.success) {
            throw std::runtime_error("SNMP interface query failed: " + probe.errorMessage);
        }
        return {};
    }

    for (const auto& vb : descrs) {
        if (auto index = parseIndex(SnmpCodec::oidSuffix(IF_DESCR, vb.oid))) {
            auto& row = rows[*index];
            row.info.name = vb.value;
            row.info.description = vb.value;
            row.hasDescr = true;
        }
    }

    // Columns that fill one field each; rows may be sparse.
    using Iface = core::InterfaceInfo;
    using VarBind = core::SnmpVarBind;
    using ColumnSetter = std::function<void(Iface&, const VarBind&)>;
    const std::vector<std::pair<const char*, ColumnSetter>> columns = {
        {IF_MTU,
         [](Iface& info, const VarBind& vb) { info.mtu = vb.numericValue(); }},
        {IF_SPEED,
         [](Iface& info, const VarBind& vb) {
             auto bps = vb.numericValue();
             if (bps && *bps > 0) {
                 info.speedMbps = *bps / 1000000;
             }
         }},
        {IF_PHYS_ADDRESS,
         [](Iface& info, const VarBind& vb) {
             if (!vb.value.empty()) {
                 info.macAddress = formatMacAddress(vb.value);
             }
         }},
        {IF_ADMIN_STATUS,
         [](Iface& info, const VarBind& vb) {
             auto code = vb.numericValue().value_or(0);
             info.adminStatus = code == 2 ? core::InterfaceStatus::AdminDown
                                          : core::interfaceStatusFromSnmp(code);
         }},
        {IF_OPER_STATUS,
         [](Iface& info, const VarBind& vb) {
             info.status = core::interfaceStatusFromSnmp(vb.numericValue().value_or(0));
         }},
        {IF_LAST_CHANGE,
         [](Iface& info, const VarBind& vb) {
             if (auto ticks = vb.numericValue()) {
                 info.lastChangeSeconds = *ticks / 100;
             }
         }},
        {IF_IN_OCTETS, [](Iface& info, const VarBind& vb) { info.inOctets = vb.counterValue; }},
        {IF_IN_ERRORS, [](Iface& info, const VarBind& vb) { info.inErrors = vb.counterValue; }},
        {IF_OUT_OCTETS, [](Iface& info, const VarBind& vb) { info.outOctets = vb.counterValue; }},
        {IF_OUT_ERRORS, [](Iface& info, const VarBind& vb) { info.outErrors = vb.counterValue; }},
    };

    for (const auto& [column, apply] : columns) {
        for (const auto& vb : client_.walk(agent, column)) {
            auto index = parseIndex(SnmpCodec::oidSuffix(column, vb.oid));
            if (!index) {
                continue;
            }
            auto it = rows.find(*index);
            if (it != rows.end()) {
                apply(it->second.info, vb);
            }
        }
    }

    // ipAdEntIfIndex: the suffix is the address, the value the ifIndex
    for (const auto& vb : client_.walk(agent, IP_AD_ENT_IF_INDEX)) {
        auto ifIndex = vb.numericValue();
        auto address = SnmpCodec::oidSuffix(IP_AD_ENT_IF_INDEX, vb.oid);
        if (!ifIndex || address.empty()) {
            continue;
        }
        auto it = rows.find(*ifIndex);
        if (it != rows.end()) {
            it->second.info.ipAddresses.insert(address);
        }
    }

    std::vector<core::InterfaceInfo> interfaces;
    for (auto& [index, row] : rows) {
        if (row.hasDescr) {
            interfaces.push_back(std::move(row.info));
        }
    }
    spdlog::debug("Device {} reported {} interfaces", device_.id, interfaces.size());
    return interfaces;
}

core::DeviceHealth SnmpMonitor::getHealthMetrics() {
    core::DeviceHealth health;

    auto uptime = client_.get(target(), {core::SnmpOids::SYS_UPTIME});
    if (!uptime.success) {
        throw std::runtime_error("SNMP health query failed: " + uptime.errorMessage);
    }
    if (auto vb = uptime.getVarBind(core::SnmpOids::SYS_UPTIME)) {
        if (auto ticks = vb->numericValue()) {
            health.uptimeSeconds = *ticks / 100;
        }
    }

    for (auto& metric : healthStrategies()) {
        bool found = false;
        for (auto& strategy : metric.strategies) {
            if (strategy(health)) {
                found = true;
                break;
            }
        }
        if (!found) {
            spdlog::debug("No {} metric available for {}", metric.metric, device_.id);
        }
    }

    return health;
}

std::vector<SnmpMonitor::MetricStrategies> SnmpMonitor::healthStrategies() {
    return {
        {"cpu",
         {[this](core::DeviceHealth& h) { return ciscoCpu(h); }, [this](core::DeviceHealth& h) { return hostResourcesCpu(h); }}},
        {"memory",
         {[this](core::DeviceHealth& h) { return ciscoMemory(h); },
          [this](core::DeviceHealth& h) { return hostResourcesStorage(h); },
          [this](core::DeviceHealth& h) { return hostResourcesMemorySize(h); }}},
        {"temperature", {[this](core::DeviceHealth& h) { return ciscoTemperature(h); }}},
    };
}

bool SnmpMonitor::ciscoCpu(core::DeviceHealth& health) {
    auto values = numericValues(client_.walk(target(), CISCO_CPU_5MIN));
    if (values.empty()) {
        return false;
    }
    health.cpuPercent = static_cast<double>(values.front());
    return true;
}

bool SnmpMonitor::hostResourcesCpu(core::DeviceHealth& health) {
    auto values = numericValues(client_.walk(target(), core::SnmpOids::HR_PROCESSOR_LOAD));
    if (values.empty()) {
        return false;
    }
    double sum = 0.0;
    for (auto v : values) {
        sum += static_cast<double>(v);
    }
    health.cpuPercent = sum / static_cast<double>(values.size());
    return true;
}

bool SnmpMonitor::ciscoMemory(core::DeviceHealth& health) {
    auto used = numericValues(client_.walk(target(), CISCO_MEM_POOL_USED));
    auto free = numericValues(client_.walk(target(), CISCO_MEM_POOL_FREE));
    if (used.empty() || free.empty()) {
        return false;
    }

    double usedBytes = 0.0;
    double freeBytes = 0.0;
    for (auto v : used) {
        usedBytes += static_cast<double>(v);
    }
    for (auto v : free) {
        freeBytes += static_cast<double>(v);
    }
    double total = usedBytes + freeBytes;
    if (total <= 0.0) {
        return false;
    }

    health.memoryPercent = usedBytes / total * 100.0;
    health.memoryUsedMb = static_cast<int64_t>(usedBytes / BYTES_PER_MB);
    health.memoryTotalMb = static_cast<int64_t>(total / BYTES_PER_MB);
    return true;
}

bool SnmpMonitor::hostResourcesStorage(core::DeviceHealth& health) {
    using namespace core::SnmpOids;
    const auto agent = target();

    std::vector<std::string> ramRows;
    for (const auto& vb : client_.walk(agent, HR_STORAGE_TYPE)) {
        if (vb.value == HR_STORAGE_RAM) {
            ramRows.push_back(SnmpCodec::oidSuffix(HR_STORAGE_TYPE, vb.oid));
        }
    }
    if (ramRows.empty()) {
        return false;
    }

    auto units = numericColumn(client_.walk(agent, HR_STORAGE_ALLOC_UNITS), HR_STORAGE_ALLOC_UNITS);
    auto sizes = numericColumn(client_.walk(agent, HR_STORAGE_SIZE), HR_STORAGE_SIZE);
    auto used = numericColumn(client_.walk(agent, HR_STORAGE_USED), HR_STORAGE_USED);

    double totalBytes = 0.0;
    double usedBytes = 0.0;
    for (const auto& row : ramRows) {
        if (!units.contains(row) || !sizes.contains(row) || !used.contains(row)) {
            continue;
        }
        auto unit = static_cast<double>(units[row]);
        totalBytes += static_cast<double>(sizes[row]) * unit;
        usedBytes += static_cast<double>(used[row]) * unit;
    }
    if (totalBytes <= 0.0) {
        return false;
    }

    health.memoryPercent = usedBytes / totalBytes * 100.0;
    health.memoryUsedMb = static_cast<int64_t>(usedBytes / BYTES_PER_MB);
    health.memoryTotalMb = static_cast<int64_t>(totalBytes / BYTES_PER_MB);
    return true;
}

bool SnmpMonitor::hostResourcesMemorySize(core::DeviceHealth& health) {
    auto result = client_.get(target(), {core::SnmpOids::HR_MEMORY_SIZE});
    if (!result.success) {
        return false;
    }
    auto vb = result.getVarBind(core::SnmpOids::HR_MEMORY_SIZE);
    if (!vb || !vb->numericValue() || *vb->numericValue() <= 0) {
        return false;
    }
    health.memoryTotalMb = *vb->numericValue() / 1024;
    return true;
}

bool SnmpMonitor::ciscoTemperature(core::DeviceHealth& health) {
    double sum = 0.0;
    int count = 0;
    for (auto v : numericValues(client_.walk(target(), CISCO_TEMPERATURE))) {
        if (v > 0) {
            sum += static_cast<double>(v);
            ++count;
        }
    }
    if (count == 0) {
        return false;
    }
    health.temperatureCelsius = sum / count;
    return true;
}

} // namespace netsentry::infra
