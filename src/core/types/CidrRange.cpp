#include "core/types/CidrRange.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>

namespace netsentry::core {

bool parseIpv4(const std::string& text, uint32_t& out) {
    uint32_t result = 0;
    const char* p = text.data();
    const char* end = text.data() + text.size();

    for (int octet = 0; octet < 4; ++octet) {
        if (octet > 0) {
            if (p == end || *p != '.') {
                return false;
            }
            ++p;
        }
        unsigned value = 0;
        auto [next, ec] = std::from_chars(p, end, value);
        if (ec != std::errc() || next == p || next - p > 3 || value > 255) {
            return false;
        }
        result = (result << 8) | value;
        p = next;
    }

    if (p != end) {
        return false;
    }
    out = result;
    return true;
}

std::string formatIpv4(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) +
           "." + std::to_string((address >> 8) & 0xFF) + "." + std::to_string(address & 0xFF);
}

CidrRange CidrRange::parse(const std::string& text) {
    std::string addressPart = text;
    int prefix = 32;

    auto slash = text.find('/');
    if (slash != std::string::npos) {
        addressPart = text.substr(0, slash);
        std::string prefixPart = text.substr(slash + 1);
        auto [next, ec] = std::from_chars(prefixPart.data(),
                                          prefixPart.data() + prefixPart.size(), prefix);
        if (prefixPart.empty() || ec != std::errc() ||
            next != prefixPart.data() + prefixPart.size() || prefix < 0 || prefix > 32) {
            throw std::invalid_argument("Invalid network prefix: " + text);
        }
    }

    uint32_t address = 0;
    if (!parseIpv4(addressPart, address)) {
        throw std::invalid_argument("Invalid network address: " + text);
    }

    CidrRange range(0, prefix);
    range.network_ = address & range.mask();
    return range;
}

bool CidrRange::isValid(const std::string& text) {
    try {
        parse(text);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

uint32_t CidrRange::mask() const {
    return prefix_ == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix_));
}

uint64_t CidrRange::addressCount() const {
    return uint64_t{1} << (32 - prefix_);
}

uint64_t CidrRange::hostCount() const {
    if (prefix_ >= 31) {
        return addressCount();
    }
    return addressCount() - 2;
}

std::vector<std::string> CidrRange::hosts(size_t limit) const {
    std::vector<std::string> result;
    uint64_t first = network_;
    uint64_t count = hostCount();
    if (prefix_ < 31) {
        first += 1;
    }

    uint64_t take = std::min<uint64_t>(count, limit);
    result.reserve(static_cast<size_t>(take));
    for (uint64_t i = 0; i < take; ++i) {
        result.push_back(formatIpv4(static_cast<uint32_t>(first + i)));
    }
    return result;
}

bool CidrRange::contains(const std::string& address) const {
    uint32_t value = 0;
    if (!parseIpv4(address, value)) {
        return false;
    }
    return (value & mask()) == network_;
}

std::string CidrRange::toString() const {
    return formatIpv4(network_) + "/" + std::to_string(prefix_);
}

} // namespace netsentry::core
