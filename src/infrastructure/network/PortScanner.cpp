#include "infrastructure/network/PortScanner.hpp"

#include "core/util/Concurrency.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <stdexcept>

namespace netsentry::infra {

namespace {
void closeQuietly(asio::ip::tcp::socket& socket) {
    asio::error_code ignored;
    socket.close(ignored);
}
} // namespace

PortScanner::PortScanner(AsioContext& context) : context_(context) {}

std::vector<core::PortProbeResult> PortScanner::scan(const core::PortScanRequest& request) {
    if (!context_.isRunning()) {
        throw std::runtime_error("Port scanner requires a running AsioContext");
    }

    const size_t total = request.targets.size() * request.ports.size();
    auto results = std::make_shared<std::vector<core::PortProbeResult>>(total);
    if (total == 0) {
        return {};
    }

    spdlog::debug("Starting port scan of {} hosts on {} ports", request.targets.size(),
                  request.ports.size());

    auto limiter = std::make_shared<core::ConcurrencyLimiter>(request.maxConcurrency);
    auto remaining = std::make_shared<std::atomic<size_t>>(total);
    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();

    size_t index = 0;
    for (const auto& target : request.targets) {
        for (uint16_t port : request.ports) {
            (*results)[index] = core::PortProbeResult{target, port, core::PortState::Closed};
            limiter->acquireRaw();
            startProbe(target, port, request.timeout,
                       [results, limiter, remaining, done, index](core::PortState state) {
                           (*results)[index].state = state;
                           limiter->release();
                           if (--(*remaining) == 0) {
                               done->set_value();
                           }
                       });
            ++index;
        }
    }

    finished.wait();

    size_t open = 0;
    for (const auto& result : *results) {
        if (result.isOpen()) {
            ++open;
        }
    }
    spdlog::debug("Port scan complete: {} of {} probes open", open, total);
    return std::move(*results);
}

core::PortState PortScanner::probe(const std::string& address, uint16_t port,
                                   std::chrono::milliseconds timeout) {
    if (!context_.isRunning()) {
        throw std::runtime_error("Port scanner requires a running AsioContext");
    }

    auto promise = std::make_shared<std::promise<core::PortState>>();
    auto future = promise->get_future();
    startProbe(address, port, timeout,
               [promise](core::PortState state) { promise->set_value(state); });
    return future.get();
}

void PortScanner::startProbe(const std::string& address, uint16_t port,
                             std::chrono::milliseconds timeout, ProbeCallback onDone) {
    auto& io = context_.getContext();

    asio::ip::tcp::endpoint endpoint;
    try {
        asio::error_code ec;
        auto ip = asio::ip::make_address(address, ec);
        if (ec) {
            asio::ip::tcp::resolver resolver(io);
            auto endpoints = resolver.resolve(asio::ip::tcp::v4(), address, std::to_string(port));
            if (endpoints.empty()) {
                throw std::runtime_error("no addresses");
            }
            endpoint = endpoints.begin()->endpoint();
        } else {
            endpoint = asio::ip::tcp::endpoint(ip, port);
        }
    } catch (const std::exception& e) {
        spdlog::debug("Port probe {}:{} could not resolve: {}", address, port, e.what());
        onDone(core::PortState::Closed);
        return;
    }

    auto state = std::make_shared<ProbeState>();
    state->socket = std::make_shared<asio::ip::tcp::socket>(io);
    state->timer = std::make_shared<asio::steady_timer>(io);

    state->timer->expires_after(timeout);
    state->timer->async_wait([state, onDone](const asio::error_code& ec) {
        if (ec || state->completed.exchange(true)) {
            return;
        }
        closeQuietly(*state->socket);
        onDone(core::PortState::Filtered);
    });

    state->socket->async_connect(endpoint, [state, onDone](const asio::error_code& ec) {
        if (state->completed.exchange(true)) {
            return;
        }
        state->timer->cancel();
        closeQuietly(*state->socket);
        onDone(ec ? core::PortState::Closed : core::PortState::Open);
    });
}

} // namespace netsentry::infra
