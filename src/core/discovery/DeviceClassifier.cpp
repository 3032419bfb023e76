#include "core/discovery/DeviceClassifier.hpp"

#include <algorithm>
#include <cctype>

namespace netsentry::core {

namespace {

constexpr uint16_t PORT_SSH = 22;
constexpr uint16_t PORT_TELNET = 23;
constexpr uint16_t PORT_HTTP = 80;
constexpr uint16_t PORT_SNMP = 161;
constexpr uint16_t PORT_HTTPS = 443;
constexpr uint16_t PORT_HTTP_ALT = 8080;
constexpr uint16_t PORT_HTTPS_ALT = 8443;

std::string toLower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

DeviceClassifier::DeviceClassifier() : rules_(defaultRules()) {}

DeviceClassifier::DeviceClassifier(std::vector<KeywordRule> rules) : rules_(std::move(rules)) {}

std::vector<DeviceClassifier::KeywordRule> DeviceClassifier::defaultRules() {
    return {
        {DeviceType::Router, {"router", "cisco", "juniper"}},
        {DeviceType::Switch, {"switch", "catalyst"}},
        {DeviceType::Firewall, {"firewall", "fortigate", "palo alto"}},
        {DeviceType::AccessPoint, {"access point", "ap", "wireless"}},
        {DeviceType::Server, {"server", "linux", "windows"}},
    };
}

std::optional<DeviceType> DeviceClassifier::typeFromDescription(
    const std::string& systemDescription) const {
    auto text = toLower(systemDescription);
    for (const auto& rule : rules_) {
        for (const auto& keyword : rule.keywords) {
            if (text.find(keyword) != std::string::npos) {
                return rule.type;
            }
        }
    }
    return std::nullopt;
}

DeviceType DeviceClassifier::typeFromPorts(const std::set<uint16_t>& openPorts) {
    bool snmp = openPorts.contains(PORT_SNMP);
    bool ssh = openPorts.contains(PORT_SSH);
    bool telnet = openPorts.contains(PORT_TELNET);
    bool web = openPorts.contains(PORT_HTTP) || openPorts.contains(PORT_HTTPS);

    if (snmp) {
        return (ssh || telnet) ? DeviceType::Router : DeviceType::Switch;
    }
    if (web) {
        return DeviceType::Server;
    }
    if (ssh && openPorts.size() == 1) {
        return DeviceType::Firewall;
    }
    return DeviceType::Generic;
}

std::vector<std::string> DeviceClassifier::suggestProtocols(const std::set<uint16_t>& openPorts,
                                                            bool snmpAnswered) {
    std::vector<std::string> protocols;
    if (snmpAnswered || openPorts.contains(PORT_SNMP)) {
        protocols.emplace_back("snmp");
    }
    if (openPorts.contains(PORT_SSH)) {
        protocols.emplace_back("ssh");
    }
    if (openPorts.contains(PORT_HTTP) || openPorts.contains(PORT_HTTPS) ||
        openPorts.contains(PORT_HTTP_ALT) || openPorts.contains(PORT_HTTPS_ALT)) {
        protocols.emplace_back("rest");
    }
    if (protocols.empty()) {
        protocols.emplace_back("ping");
    }
    return protocols;
}

double DeviceClassifier::confidence(const std::set<uint16_t>& openPorts, bool snmpAnswered) {
    double score = 0.3;
    if (snmpAnswered || openPorts.contains(PORT_SNMP)) {
        score += 0.3;
    }
    if (openPorts.contains(PORT_SSH)) {
        score += 0.2;
    }
    if (openPorts.contains(PORT_TELNET)) {
        score += 0.1;
    }
    if (openPorts.contains(PORT_HTTP) || openPorts.contains(PORT_HTTPS)) {
        score += 0.2;
    }
    return std::min(score, 1.0);
}

Classification DeviceClassifier::classify(const std::set<uint16_t>& openPorts,
                                          const std::optional<std::string>& systemDescription) const {
    Classification result;
    bool snmpAnswered = systemDescription.has_value();

    std::optional<DeviceType> fromDescription;
    if (systemDescription && !systemDescription->empty()) {
        fromDescription = typeFromDescription(*systemDescription);
    }
    result.deviceType = fromDescription.value_or(typeFromPorts(openPorts));
    result.suggestedProtocols = suggestProtocols(openPorts, snmpAnswered);
    result.confidenceScore = confidence(openPorts, snmpAnswered);
    return result;
}

} // namespace netsentry::core
