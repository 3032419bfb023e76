/**
 * @file IPingService.hpp
 * @brief Interface for host reachability probes.
 */

#pragma once

#include "core/types/PingResult.hpp"

#include <chrono>
#include <future>
#include <string>

namespace netsentry::core {

/**
 * @brief Interface for single-shot reachability probes.
 */
class IPingService {
public:
    virtual ~IPingService() = default;

    /**
     * @brief Probes an address asynchronously.
     * @param address Hostname or IP address.
     * @param timeout Maximum time to wait for a reply.
     * @return Future with the probe result. The future never holds an exception.
     */
    virtual std::future<PingResult> pingAsync(const std::string& address,
                                              std::chrono::milliseconds timeout) = 0;
};

} // namespace netsentry::core
