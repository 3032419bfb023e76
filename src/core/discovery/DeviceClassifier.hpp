/**
 * @file DeviceClassifier.hpp
 * @brief Heuristic device classification from scan signals.
 */

#pragma once

#include "core/types/DeviceRecord.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief Outcome of classifying a discovered host.
 */
struct Classification {
    DeviceType deviceType{DeviceType::Generic};  ///< Best guess
    std::vector<std::string> suggestedProtocols; ///< Protocols worth monitoring with
    double confidenceScore{0.0};                 ///< Confidence in [0, 1]

    bool operator==(const Classification& other) const = default;
};

/**
 * @brief Pure classifier over open ports and an optional SNMP sysDescr.
 *
 * Keyword rules are data: each rule maps a set of lower-case terms to a
 * device type and the first rule with a matching term wins. Terms match as
 * substrings of the lower-cased description. A system description takes
 * priority over port-based inference.
 */
class DeviceClassifier {
public:
    /**
     * @brief A keyword rule for system descriptions.
     */
    struct KeywordRule {
        DeviceType type;
        std::vector<std::string> keywords;
    };

    /**
     * @brief Constructs a classifier with the default keyword rules.
     */
    DeviceClassifier();

    /**
     * @brief Constructs a classifier with custom keyword rules.
     * @param rules Rules in priority order.
     */
    explicit DeviceClassifier(std::vector<KeywordRule> rules);

    /**
     * @brief Classifies a host.
     * @param openPorts Open TCP ports.
     * @param systemDescription SNMP sysDescr, if an agent answered.
     * @return Type guess, suggested protocols and confidence.
     */
    [[nodiscard]] Classification classify(const std::set<uint16_t>& openPorts,
                                          const std::optional<std::string>& systemDescription) const;

    /**
     * @brief Infers the device type from a system description alone.
     * @param systemDescription Free-form description.
     * @return The type of the first matching rule, or std::nullopt.
     */
    [[nodiscard]] std::optional<DeviceType> typeFromDescription(
        const std::string& systemDescription) const;

    /**
     * @brief Infers the device type from open ports alone.
     * @param openPorts Open TCP ports.
     * @return Router, switch, server, firewall or generic.
     */
    [[nodiscard]] static DeviceType typeFromPorts(const std::set<uint16_t>& openPorts);

    /**
     * @brief Suggests monitoring protocols.
     * @param openPorts Open TCP ports.
     * @param snmpAnswered Whether an SNMP agent answered.
     * @return Ordered subset of {"snmp", "ssh", "rest"}, or {"ping"}.
     */
    [[nodiscard]] static std::vector<std::string> suggestProtocols(const std::set<uint16_t>& openPorts,
                                                                   bool snmpAnswered);

    /**
     * @brief Scores how much the scan signals tell about the host.
     * @param openPorts Open TCP ports.
     * @param snmpAnswered Whether an SNMP agent answered.
     * @return 0.3 for answering, plus 0.3 SNMP, 0.2 SSH, 0.1 Telnet, 0.2 HTTP(S), capped at 1.
     */
    [[nodiscard]] static double confidence(const std::set<uint16_t>& openPorts, bool snmpAnswered);

    /**
     * @brief Returns the default keyword rules.
     */
    static std::vector<KeywordRule> defaultRules();

private:
    std::vector<KeywordRule> rules_;
};

} // namespace netsentry::core
