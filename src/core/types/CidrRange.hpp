/**
 * @file CidrRange.hpp
 * @brief IPv4 network range in CIDR notation.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief An IPv4 network such as 10.0.0.0/24.
 *
 * Parsing is non-strict: host bits in the address are cleared, so
 * "10.0.0.7/30" is the network 10.0.0.4/30. A bare address is a /32.
 */
class CidrRange {
public:
    /**
     * @brief Parses CIDR notation.
     * @param text Network in "a.b.c.d/len" or "a.b.c.d" form.
     * @return The parsed range.
     * @throws std::invalid_argument if the text is not a valid IPv4 network.
     */
    static CidrRange parse(const std::string& text);

    /**
     * @brief Checks whether text is a valid IPv4 network.
     * @param text Candidate network.
     * @return True if parse() would succeed.
     */
    static bool isValid(const std::string& text);

    /**
     * @brief Number of addresses in the range, network and broadcast included.
     */
    [[nodiscard]] uint64_t addressCount() const;

    /**
     * @brief Number of usable host addresses.
     *
     * Excludes the network and broadcast addresses for prefixes up to /30;
     * a /31 has two hosts and a /32 has one.
     */
    [[nodiscard]] uint64_t hostCount() const;

    /**
     * @brief Enumerates usable host addresses in ascending order.
     * @param limit Maximum number of addresses to return.
     * @return Dotted-quad addresses.
     */
    [[nodiscard]] std::vector<std::string> hosts(size_t limit) const;

    /**
     * @brief Checks whether an address belongs to the range.
     * @param address Dotted-quad IPv4 address.
     * @return True if inside the network.
     */
    [[nodiscard]] bool contains(const std::string& address) const;

    [[nodiscard]] uint32_t networkAddress() const { return network_; }
    [[nodiscard]] int prefixLength() const { return prefix_; }

    /**
     * @brief Formats the range in canonical CIDR notation.
     * @return e.g. "10.0.0.0/30".
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const CidrRange& other) const = default;

private:
    CidrRange(uint32_t network, int prefix) : network_(network), prefix_(prefix) {}

    [[nodiscard]] uint32_t mask() const;

    uint32_t network_{0};
    int prefix_{32};
};

/**
 * @brief Parses a dotted-quad IPv4 address.
 * @param text Address text.
 * @param out Receives the address in host byte order.
 * @return True on success.
 */
bool parseIpv4(const std::string& text, uint32_t& out);

/**
 * @brief Formats an IPv4 address held in host byte order.
 * @param address Address value.
 * @return Dotted-quad text.
 */
std::string formatIpv4(uint32_t address);

} // namespace netsentry::core
