#include "infrastructure/network/PingService.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <random>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace netsentry::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;

bool resolveIpv4(const std::string& hostname, in_addr& out) {
    if (inet_pton(AF_INET, hostname.c_str(), &out) == 1) {
        return true;
    }

    struct addrinfo hints {};
    hints.ai_family = AF_INET;

    struct addrinfo* result = nullptr;
    if (getaddrinfo(hostname.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        return false;
    }
    out = reinterpret_cast<struct sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

// Closes the descriptor when the probe returns.
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

} // namespace

PingService::PingService(AsioContext& context) : context_(context) {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("PingService initialized with identifier: {}", identifier_);
}

uint16_t PingService::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> PingService::buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(64, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[1] = 0;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[8], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

core::PingResult PingService::ping(const std::string& address, std::chrono::milliseconds timeout) {
    core::PingResult result;
    result.address = address;
    result.timestamp = std::chrono::system_clock::now();

    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    if (!resolveIpv4(address, dest.sin_addr)) {
        result.errorMessage = "Failed to resolve address: " + address;
        return result;
    }

    // Raw sockets deliver the IP header; datagram ICMP sockets do not and
    // rewrite the identifier, so only the sequence is matched there.
    bool raw = true;
    SocketGuard sock(socket(AF_INET, SOCK_RAW, IPPROTO_ICMP));
    int fd = sock.get();
    std::optional<SocketGuard> dgram;
    if (fd < 0) {
        dgram.emplace(socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP));
        fd = dgram->get();
        raw = false;
    }
    if (fd < 0) {
        result.errorMessage = "Failed to create ICMP socket (need CAP_NET_RAW)";
        spdlog::debug("Ping to {} failed: {}", address, result.errorMessage);
        return result;
    }

    uint16_t seq = sequenceNumber_++;
    auto packet = buildIcmpEchoRequest(identifier_, seq);

    auto sendTime = std::chrono::steady_clock::now();
    auto deadline = sendTime + timeout;

    ssize_t sent = sendto(fd, packet.data(), packet.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        result.errorMessage = std::string("Failed to send ICMP packet: ") + std::strerror(errno);
        return result;
    }

    std::array<uint8_t, 1500> recvBuffer{};
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        struct pollfd pfd {};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready <= 0) {
            break;
        }

        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(fd, recvBuffer.data(), recvBuffer.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        auto recvTime = std::chrono::steady_clock::now();
        if (received <= 0 || from.sin_addr.s_addr != dest.sin_addr.s_addr) {
            continue;
        }

        size_t ipHeaderLen = 0;
        std::optional<int> ttl;
        if (raw) {
            if (received < 28) {
                continue;
            }
            ipHeaderLen = static_cast<size_t>((recvBuffer[0] & 0x0F) * 4);
            ttl = recvBuffer[8];
        }
        if (static_cast<size_t>(received) < ipHeaderLen + 8) {
            continue;
        }

        const uint8_t* icmpHeader = recvBuffer.data() + ipHeaderLen;
        if (icmpHeader[0] != ICMP_ECHO_REPLY) {
            continue;
        }
        uint16_t recvId = (static_cast<uint16_t>(icmpHeader[4]) << 8) | icmpHeader[5];
        uint16_t recvSeq = (static_cast<uint16_t>(icmpHeader[6]) << 8) | icmpHeader[7];
        if (recvSeq != seq || (raw && recvId != identifier_)) {
            continue;
        }

        result.success = true;
        result.latency = std::chrono::duration_cast<std::chrono::microseconds>(recvTime - sendTime);
        result.ttl = ttl;
        spdlog::debug("Ping to {} successful: {:.2f}ms", address, result.latencyMs());
        return result;
    }

    result.errorMessage = "Request timed out";
    return result;
}

std::future<core::PingResult> PingService::pingAsync(const std::string& address,
                                                     std::chrono::milliseconds timeout) {
    auto promise = std::make_shared<std::promise<core::PingResult>>();
    auto future = promise->get_future();

    context_.post([this, address, timeout, promise]() {
        try {
            promise->set_value(ping(address, timeout));
        } catch (const std::exception& e) {
            core::PingResult result;
            result.address = address;
            result.timestamp = std::chrono::system_clock::now();
            result.errorMessage = e.what();
            promise->set_value(result);
        }
    });

    return future;
}

} // namespace netsentry::infra
