#pragma once

#include "core/types/SnmpTypes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace netsentry::infra {

/**
 * @brief SNMP PDU types used by the client.
 */
enum class PduType : uint8_t {
    GetRequest = 0xA0,
    GetNextRequest = 0xA1,
    GetResponse = 0xA2,
    SetRequest = 0xA3
};

/**
 * @brief A decoded SNMP v1/v2c message.
 */
struct SnmpMessage {
    core::SnmpVersion version{core::SnmpVersion::V2c}; ///< Protocol version
    std::string community{"public"};                   ///< Community string
    PduType pduType{PduType::GetRequest};              ///< PDU type
    int32_t requestId{0};                              ///< Request identifier
    int errorStatus{0};                                ///< Error status (0 = noError)
    int errorIndex{0};                                 ///< 1-based index of the failing varbind
    std::vector<core::SnmpVarBind> varbinds;           ///< Variable bindings
};

/**
 * @brief BER/ASN.1 codec for community-based SNMP messages.
 *
 * Encoding writes request varbinds as OID + NULL, and response varbinds with
 * the value type given in SnmpVarBind::type. Decoding is bounds-checked and
 * throws std::runtime_error on malformed input.
 */
class SnmpCodec {
public:
    /**
     * @brief Encodes a message.
     * @param message Message to encode.
     * @return Wire bytes.
     * @throws std::invalid_argument if an OID or value cannot be encoded.
     */
    static std::vector<uint8_t> encode(const SnmpMessage& message);

    /**
     * @brief Decodes a message.
     * @param data Wire bytes.
     * @return The decoded message.
     * @throws std::runtime_error if the bytes are not a valid v1/v2c message.
     */
    static SnmpMessage decode(const std::vector<uint8_t>& data);

    /**
     * @brief Splits a dotted OID into components.
     * @param oid Dotted OID, optionally with a leading dot.
     * @return Components.
     * @throws std::invalid_argument on non-numeric components or fewer than two.
     */
    static std::vector<uint32_t> parseOid(const std::string& oid);

    /**
     * @brief Joins OID components with dots.
     */
    static std::string formatOid(const std::vector<uint32_t>& components);

    /**
     * @brief Checks whether oid lies in the subtree rooted at prefix.
     *
     * The match must end on a component boundary, so 1.3.6.1.2.1.2.2.1.1
     * is not under 1.3.6.1.2.1.2.2.1.10.
     *
     * @param prefix Subtree root.
     * @param oid OID to test.
     * @return True if oid equals prefix or extends it.
     */
    static bool isOidPrefix(const std::string& prefix, const std::string& oid);

    /**
     * @brief Returns the components of oid that follow prefix.
     * @param prefix Subtree root.
     * @param oid OID under prefix.
     * @return Suffix without the leading dot, or an empty string.
     */
    static std::string oidSuffix(const std::string& prefix, const std::string& oid);

    /**
     * @brief Describes an SNMP error-status value.
     */
    static std::string errorStatusToString(int errorStatus);

private:
    static std::vector<uint8_t> encodeLength(size_t length);
    static std::vector<uint8_t> encodeTlv(uint8_t tag, const std::vector<uint8_t>& content);
    static std::vector<uint8_t> encodeInteger(int64_t value);
    static std::vector<uint8_t> encodeUnsigned(uint8_t tag, uint64_t value);
    static std::vector<uint8_t> encodeOctetString(const std::string& str);
    static std::vector<uint8_t> encodeOid(const std::string& oid);
    static std::vector<uint8_t> encodeValue(const core::SnmpVarBind& varbind);

    static int64_t decodeInteger(const uint8_t* data, size_t length);
    static uint64_t decodeUnsigned(const uint8_t* data, size_t length);
    static std::string decodeOid(const uint8_t* data, size_t length);
    static core::SnmpVarBind decodeValue(const std::string& oid, uint8_t tag, const uint8_t* data,
                                         size_t length);
};

} // namespace netsentry::infra
