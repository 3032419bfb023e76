#pragma once

#include "core/services/IPortScanner.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>

namespace netsentry::infra {

/**
 * @brief TCP connect scanner.
 *
 * Each probe is an asynchronous connect raced against a steady_timer on the
 * AsioContext. The calling thread blocks until the batch completes, and at
 * most PortScanRequest::maxConcurrency connects are outstanding at once.
 *
 * @note scan() and probe() must not be called from an AsioContext worker.
 */
class PortScanner : public core::IPortScanner {
public:
    /**
     * @brief Constructs a PortScanner with the given Asio context.
     * @param context Running context the probes execute on.
     */
    explicit PortScanner(AsioContext& context);

    /**
     * @brief Probes every (target, port) pair of a request.
     * @param request Targets, ports, timeout and concurrency bound.
     * @return One result per pair, in target-major order.
     * @throws std::runtime_error if the AsioContext is not running.
     */
    std::vector<core::PortProbeResult> scan(const core::PortScanRequest& request) override;

    /**
     * @brief Probes a single port.
     * @throws std::runtime_error if the AsioContext is not running.
     */
    core::PortState probe(const std::string& address, uint16_t port,
                          std::chrono::milliseconds timeout) override;

private:
    struct ProbeState {
        std::shared_ptr<asio::ip::tcp::socket> socket;
        std::shared_ptr<asio::steady_timer> timer;
        std::atomic<bool> completed{false};
    };

    using ProbeCallback = std::function<void(core::PortState)>;

    void startProbe(const std::string& address, uint16_t port, std::chrono::milliseconds timeout,
                    ProbeCallback onDone);

    AsioContext& context_;
};

} // namespace netsentry::infra
