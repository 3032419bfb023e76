/**
 * @file ISnmpClient.hpp
 * @brief Interface for community-based SNMP queries.
 */

#pragma once

#include "core/types/SnmpTypes.hpp"

#include <string>
#include <vector>

namespace netsentry::core {

/**
 * @brief Interface for SNMP v1/v2c GET, GET-NEXT and WALK.
 *
 * All calls block the calling thread for at most
 * target.timeoutMs * target.retries per request. Failures are reported in
 * the returned SnmpResult, never thrown.
 */
class ISnmpClient {
public:
    virtual ~ISnmpClient() = default;

    /**
     * @brief Performs an SNMP GET.
     * @param target Agent to query.
     * @param oids OIDs to retrieve.
     * @return Result with one varbind per requested OID on success.
     */
    virtual SnmpResult get(const SnmpTarget& target, const std::vector<std::string>& oids) = 0;

    /**
     * @brief Performs an SNMP GET-NEXT.
     * @param target Agent to query.
     * @param oids OIDs whose successors to retrieve.
     * @return Result with the lexicographic successors.
     */
    virtual SnmpResult getNext(const SnmpTarget& target, const std::vector<std::string>& oids) = 0;

    /**
     * @brief Walks the subtree under rootOid using repeated GET-NEXT.
     *
     * The walk stops when the returned OID leaves the subtree, when the agent
     * reports end of MIB view, or when a request fails. Varbinds collected
     * before the stop are returned.
     *
     * @param target Agent to query.
     * @param rootOid Base OID of the subtree.
     * @return Varbinds in walk order.
     */
    virtual std::vector<SnmpVarBind> walk(const SnmpTarget& target, const std::string& rootOid) = 0;
};

} // namespace netsentry::core
