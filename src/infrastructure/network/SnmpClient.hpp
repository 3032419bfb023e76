#pragma once

#include "core/services/ISnmpClient.hpp"
#include "infrastructure/network/SnmpCodec.hpp"

#include <atomic>
#include <cstdint>

namespace netsentry::infra {

/**
 * @brief Blocking SNMP v1/v2c client over UDP.
 *
 * Each request opens its own socket, so one client may be shared by any
 * number of threads. Responses whose request-id does not match the request
 * are discarded until the per-attempt timeout expires.
 *
 * @note This class is non-copyable.
 */
class SnmpClient : public core::ISnmpClient {
public:
    /**
     * @brief Constructs an SnmpClient.
     * @param maxWalkIterations Upper bound on GET-NEXT requests per walk.
     */
    explicit SnmpClient(int maxWalkIterations = 10000);

    SnmpClient(const SnmpClient&) = delete;
    SnmpClient& operator=(const SnmpClient&) = delete;

    core::SnmpResult get(const core::SnmpTarget& target,
                         const std::vector<std::string>& oids) override;

    core::SnmpResult getNext(const core::SnmpTarget& target,
                             const std::vector<std::string>& oids) override;

    std::vector<core::SnmpVarBind> walk(const core::SnmpTarget& target,
                                        const std::string& rootOid) override;

private:
    core::SnmpResult performRequest(const core::SnmpTarget& target,
                                    const std::vector<std::string>& oids, PduType pduType);

    std::atomic<int32_t> requestIdCounter_;
    int maxWalkIterations_;
};

} // namespace netsentry::infra
