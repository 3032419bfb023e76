#pragma once

#include "core/services/IPingService.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace netsentry::infra {

/**
 * @brief ICMP echo probes for host reachability.
 *
 * Probes run on the AsioContext worker pool. A raw ICMP socket is used when
 * the process holds CAP_NET_RAW; otherwise an unprivileged ICMP datagram
 * socket is tried (Linux, net.ipv4.ping_group_range).
 */
class PingService : public core::IPingService {
public:
    /**
     * @brief Constructs a PingService with the given Asio context.
     * @param context Worker pool the probes are posted to.
     */
    explicit PingService(AsioContext& context);

    /**
     * @brief Performs an asynchronous ping to the specified address.
     * @param address Target hostname or IP address to ping.
     * @param timeout Maximum time to wait for a response.
     * @return Future containing the PingResult with latency or error info.
     */
    std::future<core::PingResult> pingAsync(const std::string& address,
                                            std::chrono::milliseconds timeout) override;

    /**
     * @brief Performs a ping on the calling thread.
     * @param address Target hostname or IP address.
     * @param timeout Maximum time to wait for a response.
     * @return Probe result.
     */
    core::PingResult ping(const std::string& address, std::chrono::milliseconds timeout);

    // ICMP helpers
    static uint16_t calculateChecksum(const uint8_t* data, size_t length);
    static std::vector<uint8_t> buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence);

private:
    AsioContext& context_;
    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
};

} // namespace netsentry::infra
