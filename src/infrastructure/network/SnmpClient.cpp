#include "infrastructure/network/SnmpClient.hpp"

#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <algorithm>
#include <random>

#include <sys/socket.h>
#include <sys/time.h>

namespace netsentry::infra {

namespace {
int32_t initialRequestId() {
    std::random_device rd;
    std::uniform_int_distribution<int32_t> dist(1, 0x3FFFFFFF);
    return dist(rd);
}

void setReceiveTimeout(asio::ip::udp::socket& socket, std::chrono::milliseconds timeout) {
    auto ms = std::max<int64_t>(1, timeout.count());
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
    setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}
} // namespace

SnmpClient::SnmpClient(int maxWalkIterations)
    : requestIdCounter_(initialRequestId()), maxWalkIterations_(std::max(1, maxWalkIterations)) {}

core::SnmpResult SnmpClient::get(const core::SnmpTarget& target,
                                 const std::vector<std::string>& oids) {
    return performRequest(target, oids, PduType::GetRequest);
}

core::SnmpResult SnmpClient::getNext(const core::SnmpTarget& target,
                                     const std::vector<std::string>& oids) {
    return performRequest(target, oids, PduType::GetNextRequest);
}

std::vector<core::SnmpVarBind> SnmpClient::walk(const core::SnmpTarget& target,
                                                const std::string& rootOid) {
    std::vector<core::SnmpVarBind> results;
    std::string currentOid = rootOid;

    for (int iteration = 0; iteration < maxWalkIterations_; ++iteration) {
        auto result = performRequest(target, {currentOid}, PduType::GetNextRequest);
        if (!result.success || result.varbinds.empty()) {
            if (!result.success) {
                spdlog::debug("SNMP walk of {} on {} stopped: {}", rootOid, target.address,
                              result.errorMessage);
            }
            break;
        }

        const auto& vb = result.varbinds.front();
        if (vb.isException() || !SnmpCodec::isOidPrefix(rootOid, vb.oid) || vb.oid == currentOid) {
            break;
        }

        results.push_back(vb);
        currentOid = vb.oid;
    }

    return results;
}

core::SnmpResult SnmpClient::performRequest(const core::SnmpTarget& target,
                                            const std::vector<std::string>& oids,
                                            PduType pduType) {
    core::SnmpResult result;
    result.timestamp = std::chrono::system_clock::now();
    auto startTime = std::chrono::steady_clock::now();

    auto finish = [&result, startTime]() {
        result.responseTime = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - startTime);
        return result;
    };

    SnmpMessage request;
    request.version = target.version;
    request.community = target.community;
    request.pduType = pduType;
    for (const auto& oid : oids) {
        core::SnmpVarBind vb;
        vb.oid = oid;
        vb.type = core::SnmpDataType::Null;
        request.varbinds.push_back(std::move(vb));
    }

    try {
        asio::io_context io;
        asio::ip::udp::resolver resolver(io);
        auto endpoints = resolver.resolve(asio::ip::udp::v4(), target.address,
                                          std::to_string(target.port));
        if (endpoints.empty()) {
            result.errorMessage = "Failed to resolve address: " + target.address;
            return finish();
        }
        auto endpoint = endpoints.begin()->endpoint();

        asio::ip::udp::socket socket(io, asio::ip::udp::v4());
        std::vector<uint8_t> recvBuffer(65535);
        const auto perAttempt = std::chrono::milliseconds(std::max(1, target.timeoutMs));
        const int attempts = std::max(1, target.retries);

        for (int attempt = 1; attempt <= attempts; ++attempt) {
            request.requestId = requestIdCounter_++;
            auto packet = SnmpCodec::encode(request);
            socket.send_to(asio::buffer(packet), endpoint);

            auto deadline = std::chrono::steady_clock::now() + perAttempt;
            while (true) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    break;
                }
                setReceiveTimeout(socket, remaining);

                asio::ip::udp::endpoint sender;
                asio::error_code ec;
                size_t received = socket.receive_from(asio::buffer(recvBuffer), sender, 0, ec);
                if (ec) {
                    if (ec != asio::error::timed_out && ec != asio::error::would_block &&
                        ec != asio::error::try_again) {
                        result.errorMessage = "Receive error: " + ec.message();
                        return finish();
                    }
                    break;
                }

                SnmpMessage response;
                try {
                    response = SnmpCodec::decode(
                        std::vector<uint8_t>(recvBuffer.begin(), recvBuffer.begin() + received));
                } catch (const std::exception& e) {
                    spdlog::debug("Discarding malformed SNMP packet from {}: {}", target.address,
                                  e.what());
                    continue;
                }
                if (response.requestId != request.requestId ||
                    response.pduType != PduType::GetResponse) {
                    continue;
                }

                result.errorStatus = response.errorStatus;
                if (response.errorStatus != 0) {
                    result.errorMessage = SnmpCodec::errorStatusToString(response.errorStatus);
                    return finish();
                }
                result.varbinds = std::move(response.varbinds);
                result.success = true;
                return finish();
            }

            spdlog::debug("SNMP request to {} timed out (attempt {}/{})", target.address, attempt,
                          attempts);
        }

        result.errorMessage = "Request timed out";
    } catch (const std::exception& e) {
        result.errorMessage = std::string("SNMP error: ") + e.what();
    }

    return finish();
}

} // namespace netsentry::infra
