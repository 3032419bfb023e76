/**
 * @file IPortScanner.hpp
 * @brief Interface for TCP connect probes.
 */

#pragma once

#include "core/types/PortScanResult.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief Interface for TCP connect scanning.
 */
class IPortScanner {
public:
    virtual ~IPortScanner() = default;

    /**
     * @brief Probes every (target, port) pair of a request.
     *
     * Blocks until all probes finished. At most request.maxConcurrency
     * probes are in flight at once; a probe that times out is Filtered and
     * does not affect the others.
     *
     * @param request Targets, ports, timeout and concurrency bound.
     * @return One result per (target, port) pair.
     */
    virtual std::vector<PortProbeResult> scan(const PortScanRequest& request) = 0;

    /**
     * @brief Probes a single port.
     * @param address Target address.
     * @param port TCP port.
     * @param timeout Connect timeout.
     * @return State of the port.
     */
    virtual PortState probe(const std::string& address, uint16_t port,
                            std::chrono::milliseconds timeout) = 0;
};

} // namespace netsentry::core
