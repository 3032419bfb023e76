#include "infrastructure/network/SnmpCodec.hpp"

#include "core/types/CidrRange.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace netsentry::infra {

namespace {
// ASN.1/BER tag types
constexpr uint8_t TAG_INTEGER = 0x02;
constexpr uint8_t TAG_OCTET_STRING = 0x04;
constexpr uint8_t TAG_NULL = 0x05;
constexpr uint8_t TAG_OID = 0x06;
constexpr uint8_t TAG_SEQUENCE = 0x30;
constexpr uint8_t TAG_IP_ADDRESS = 0x40;
constexpr uint8_t TAG_COUNTER32 = 0x41;
constexpr uint8_t TAG_GAUGE32 = 0x42;
constexpr uint8_t TAG_TIMETICKS = 0x43;
constexpr uint8_t TAG_COUNTER64 = 0x46;
constexpr uint8_t TAG_NO_SUCH_OBJECT = 0x80;
constexpr uint8_t TAG_NO_SUCH_INSTANCE = 0x81;
constexpr uint8_t TAG_END_OF_MIB_VIEW = 0x82;

constexpr int64_t WIRE_VERSION_1 = 0;
constexpr int64_t WIRE_VERSION_2C = 1;

core::SnmpDataType tagToDataType(uint8_t tag) {
    switch (tag) {
        case TAG_INTEGER: return core::SnmpDataType::Integer;
        case TAG_OCTET_STRING: return core::SnmpDataType::OctetString;
        case TAG_OID: return core::SnmpDataType::ObjectIdentifier;
        case TAG_IP_ADDRESS: return core::SnmpDataType::IpAddress;
        case TAG_COUNTER32: return core::SnmpDataType::Counter32;
        case TAG_GAUGE32: return core::SnmpDataType::Gauge32;
        case TAG_TIMETICKS: return core::SnmpDataType::TimeTicks;
        case TAG_COUNTER64: return core::SnmpDataType::Counter64;
        case TAG_NULL: return core::SnmpDataType::Null;
        case TAG_NO_SUCH_OBJECT: return core::SnmpDataType::NoSuchObject;
        case TAG_NO_SUCH_INSTANCE: return core::SnmpDataType::NoSuchInstance;
        case TAG_END_OF_MIB_VIEW: return core::SnmpDataType::EndOfMibView;
        default: return core::SnmpDataType::Unknown;
    }
}

// Bounds-checked cursor over a BER buffer.
class BerReader {
public:
    BerReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool atEnd() const { return offset_ >= size_; }

    uint8_t peekTag() const {
        if (atEnd()) {
            throw std::runtime_error("Unexpected end of data");
        }
        return data_[offset_];
    }

    // Reads one TLV header; returns the content length and leaves the cursor
    // on the first content byte.
    size_t readHeader(uint8_t& tag) {
        tag = peekTag();
        ++offset_;
        if (atEnd()) {
            throw std::runtime_error("Truncated length");
        }
        size_t length = data_[offset_++];
        if (length & 0x80) {
            size_t numBytes = length & 0x7F;
            if (numBytes == 0 || numBytes > 4) {
                throw std::runtime_error("Unsupported length encoding");
            }
            length = 0;
            for (size_t i = 0; i < numBytes; ++i) {
                if (atEnd()) {
                    throw std::runtime_error("Truncated length");
                }
                length = (length << 8) | data_[offset_++];
            }
        }
        if (length > size_ - offset_) {
            throw std::runtime_error("Length exceeds buffer");
        }
        return length;
    }

    size_t expect(uint8_t expectedTag, const char* what) {
        uint8_t tag = 0;
        size_t length = readHeader(tag);
        if (tag != expectedTag) {
            throw std::runtime_error(std::string("Expected ") + what);
        }
        return length;
    }

    const uint8_t* current() const { return data_ + offset_; }
    size_t offset() const { return offset_; }
    void skip(size_t length) { offset_ += length; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_{0};
};

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void appendBase128(std::vector<uint8_t>& out, uint32_t value) {
    std::vector<uint8_t> encoded;
    encoded.push_back(static_cast<uint8_t>(value & 0x7F));
    value >>= 7;
    while (value > 0) {
        encoded.insert(encoded.begin(), static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    append(out, encoded);
}
} // namespace

std::vector<uint8_t> SnmpCodec::encode(const SnmpMessage& message) {
    std::vector<uint8_t> varbindList;
    for (const auto& vb : message.varbinds) {
        std::vector<uint8_t> varbind = encodeOid(vb.oid);
        append(varbind, encodeValue(vb));
        append(varbindList, encodeTlv(TAG_SEQUENCE, varbind));
    }

    std::vector<uint8_t> pdu;
    append(pdu, encodeTlv(TAG_INTEGER, encodeInteger(message.requestId)));
    append(pdu, encodeTlv(TAG_INTEGER, encodeInteger(message.errorStatus)));
    append(pdu, encodeTlv(TAG_INTEGER, encodeInteger(message.errorIndex)));
    append(pdu, encodeTlv(TAG_SEQUENCE, varbindList));

    int64_t wireVersion =
        message.version == core::SnmpVersion::V1 ? WIRE_VERSION_1 : WIRE_VERSION_2C;

    std::vector<uint8_t> body;
    append(body, encodeTlv(TAG_INTEGER, encodeInteger(wireVersion)));
    append(body, encodeOctetString(message.community));
    append(body, encodeTlv(static_cast<uint8_t>(message.pduType), pdu));

    return encodeTlv(TAG_SEQUENCE, body);
}

SnmpMessage SnmpCodec::decode(const std::vector<uint8_t>& data) {
    SnmpMessage message;
    BerReader reader(data.data(), data.size());

    reader.expect(TAG_SEQUENCE, "SEQUENCE");

    size_t len = reader.expect(TAG_INTEGER, "INTEGER for version");
    int64_t version = decodeInteger(reader.current(), len);
    reader.skip(len);
    if (version == WIRE_VERSION_1) {
        message.version = core::SnmpVersion::V1;
    } else if (version == WIRE_VERSION_2C) {
        message.version = core::SnmpVersion::V2c;
    } else {
        throw std::runtime_error("Unsupported SNMP version " + std::to_string(version));
    }

    len = reader.expect(TAG_OCTET_STRING, "OCTET STRING for community");
    message.community.assign(reinterpret_cast<const char*>(reader.current()), len);
    reader.skip(len);

    uint8_t pduTag = 0;
    reader.readHeader(pduTag);
    if (pduTag < 0xA0 || pduTag > 0xA3) {
        throw std::runtime_error("Unsupported PDU type");
    }
    message.pduType = static_cast<PduType>(pduTag);

    len = reader.expect(TAG_INTEGER, "INTEGER for request-id");
    message.requestId = static_cast<int32_t>(decodeInteger(reader.current(), len));
    reader.skip(len);

    len = reader.expect(TAG_INTEGER, "INTEGER for error-status");
    message.errorStatus = static_cast<int>(decodeInteger(reader.current(), len));
    reader.skip(len);

    len = reader.expect(TAG_INTEGER, "INTEGER for error-index");
    message.errorIndex = static_cast<int>(decodeInteger(reader.current(), len));
    reader.skip(len);

    size_t listLen = reader.expect(TAG_SEQUENCE, "SEQUENCE for varbind-list");
    size_t listEnd = reader.offset() + listLen;

    while (reader.offset() < listEnd) {
        reader.expect(TAG_SEQUENCE, "SEQUENCE for varbind");

        len = reader.expect(TAG_OID, "OID");
        std::string oid = decodeOid(reader.current(), len);
        reader.skip(len);

        uint8_t valueTag = 0;
        size_t valueLen = reader.readHeader(valueTag);
        message.varbinds.push_back(decodeValue(oid, valueTag, reader.current(), valueLen));
        reader.skip(valueLen);
    }

    return message;
}

std::vector<uint32_t> SnmpCodec::parseOid(const std::string& oid) {
    std::vector<uint32_t> components;
    std::string text = (!oid.empty() && oid.front() == '.') ? oid.substr(1) : oid;
    std::istringstream iss(text);
    std::string part;

    while (std::getline(iss, part, '.')) {
        if (part.empty() || part.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("Invalid OID: " + oid);
        }
        unsigned long value = 0;
        try {
            value = std::stoul(part);
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("OID component out of range: " + oid);
        }
        if (value > 0xFFFFFFFFUL) {
            throw std::invalid_argument("OID component out of range: " + oid);
        }
        components.push_back(static_cast<uint32_t>(value));
    }

    if (components.size() < 2 || components[0] > 2 ||
        (components[0] < 2 && components[1] >= 40)) {
        throw std::invalid_argument("Invalid OID: " + oid);
    }
    return components;
}

std::string SnmpCodec::formatOid(const std::vector<uint32_t>& components) {
    std::ostringstream oss;
    for (size_t i = 0; i < components.size(); ++i) {
        if (i > 0) {
            oss << ".";
        }
        oss << components[i];
    }
    return oss.str();
}

bool SnmpCodec::isOidPrefix(const std::string& prefix, const std::string& oid) {
    if (oid.size() < prefix.size() || oid.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return oid.size() == prefix.size() || oid[prefix.size()] == '.';
}

std::string SnmpCodec::oidSuffix(const std::string& prefix, const std::string& oid) {
    if (!isOidPrefix(prefix, oid) || oid.size() == prefix.size()) {
        return "";
    }
    return oid.substr(prefix.size() + 1);
}

std::string SnmpCodec::errorStatusToString(int errorStatus) {
    switch (errorStatus) {
        case 0: return "No error";
        case 1: return "Response too big";
        case 2: return "No such name";
        case 3: return "Bad value";
        case 4: return "Read only";
        case 5: return "General error";
        default: return "SNMP error " + std::to_string(errorStatus);
    }
}

// BER encoding helpers

std::vector<uint8_t> SnmpCodec::encodeLength(size_t length) {
    std::vector<uint8_t> encoded;

    if (length < 128) {
        encoded.push_back(static_cast<uint8_t>(length));
        return encoded;
    }

    std::vector<uint8_t> bytes;
    while (length > 0) {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(length & 0xFF));
        length >>= 8;
    }
    encoded.push_back(static_cast<uint8_t>(0x80 | bytes.size()));
    append(encoded, bytes);
    return encoded;
}

std::vector<uint8_t> SnmpCodec::encodeTlv(uint8_t tag, const std::vector<uint8_t>& content) {
    std::vector<uint8_t> encoded;
    encoded.push_back(tag);
    append(encoded, encodeLength(content.size()));
    append(encoded, content);
    return encoded;
}

std::vector<uint8_t> SnmpCodec::encodeInteger(int64_t value) {
    // Minimal two's complement, most significant byte first
    std::vector<uint8_t> bytes;
    do {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    } while (!((value == 0 && !(bytes.front() & 0x80)) ||
               (value == -1 && (bytes.front() & 0x80))));
    return bytes;
}

std::vector<uint8_t> SnmpCodec::encodeUnsigned(uint8_t tag, uint64_t value) {
    std::vector<uint8_t> bytes;
    do {
        bytes.insert(bytes.begin(), static_cast<uint8_t>(value & 0xFF));
        value >>= 8;
    } while (value > 0);
    if (bytes.front() & 0x80) {
        bytes.insert(bytes.begin(), 0x00);
    }
    return encodeTlv(tag, bytes);
}

std::vector<uint8_t> SnmpCodec::encodeOctetString(const std::string& str) {
    return encodeTlv(TAG_OCTET_STRING, std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> SnmpCodec::encodeOid(const std::string& oid) {
    auto components = parseOid(oid);

    std::vector<uint8_t> content;
    appendBase128(content, components[0] * 40 + components[1]);
    for (size_t i = 2; i < components.size(); ++i) {
        appendBase128(content, components[i]);
    }
    return encodeTlv(TAG_OID, content);
}

std::vector<uint8_t> SnmpCodec::encodeValue(const core::SnmpVarBind& varbind) {
    using core::SnmpDataType;

    auto unsignedValue = [&varbind]() -> uint64_t {
        if (varbind.counterValue) {
            return *varbind.counterValue;
        }
        if (varbind.intValue && *varbind.intValue >= 0) {
            return static_cast<uint64_t>(*varbind.intValue);
        }
        try {
            return std::stoull(varbind.value);
        } catch (const std::exception&) {
            throw std::invalid_argument("Non-numeric value for " + varbind.oid);
        }
    };

    switch (varbind.type) {
        case SnmpDataType::Integer: {
            int64_t value = 0;
            if (varbind.intValue) {
                value = *varbind.intValue;
            } else {
                try {
                    value = std::stoll(varbind.value);
                } catch (const std::exception&) {
                    throw std::invalid_argument("Non-numeric value for " + varbind.oid);
                }
            }
            return encodeTlv(TAG_INTEGER, encodeInteger(value));
        }
        case SnmpDataType::OctetString:
            return encodeOctetString(varbind.value);
        case SnmpDataType::ObjectIdentifier:
            return encodeOid(varbind.value);
        case SnmpDataType::IpAddress: {
            uint32_t address = 0;
            if (!core::parseIpv4(varbind.value, address)) {
                throw std::invalid_argument("Invalid IpAddress value for " + varbind.oid);
            }
            return encodeTlv(TAG_IP_ADDRESS,
                             {static_cast<uint8_t>(address >> 24), static_cast<uint8_t>(address >> 16),
                              static_cast<uint8_t>(address >> 8), static_cast<uint8_t>(address)});
        }
        case SnmpDataType::Counter32: return encodeUnsigned(TAG_COUNTER32, unsignedValue());
        case SnmpDataType::Gauge32: return encodeUnsigned(TAG_GAUGE32, unsignedValue());
        case SnmpDataType::TimeTicks: return encodeUnsigned(TAG_TIMETICKS, unsignedValue());
        case SnmpDataType::Counter64: return encodeUnsigned(TAG_COUNTER64, unsignedValue());
        case SnmpDataType::NoSuchObject: return encodeTlv(TAG_NO_SUCH_OBJECT, {});
        case SnmpDataType::NoSuchInstance: return encodeTlv(TAG_NO_SUCH_INSTANCE, {});
        case SnmpDataType::EndOfMibView: return encodeTlv(TAG_END_OF_MIB_VIEW, {});
        case SnmpDataType::Null:
        case SnmpDataType::Unknown:
            break;
    }
    return encodeTlv(TAG_NULL, {});
}

// BER decoding helpers

int64_t SnmpCodec::decodeInteger(const uint8_t* data, size_t length) {
    if (length == 0 || length > 8) {
        throw std::runtime_error("Invalid INTEGER length");
    }
    uint64_t value = (data[0] & 0x80) ? ~uint64_t{0} : 0;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 8) | data[i];
    }
    return static_cast<int64_t>(value);
}

uint64_t SnmpCodec::decodeUnsigned(const uint8_t* data, size_t length) {
    if (length > 9 || (length == 9 && data[0] != 0)) {
        throw std::runtime_error("Unsigned value too long");
    }
    uint64_t value = 0;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

std::string SnmpCodec::decodeOid(const uint8_t* data, size_t length) {
    if (length == 0) {
        throw std::runtime_error("Empty OID");
    }

    std::vector<uint32_t> components;
    uint64_t value = 0;
    bool first = true;

    for (size_t i = 0; i < length; ++i) {
        value = (value << 7) | (data[i] & 0x7F);
        if (value > 0xFFFFFFFFULL) {
            throw std::runtime_error("OID component too large");
        }
        if (data[i] & 0x80) {
            continue;
        }
        if (first) {
            uint32_t head = static_cast<uint32_t>(value);
            if (head < 40) {
                components = {0, head};
            } else if (head < 80) {
                components = {1, head - 40};
            } else {
                components = {2, head - 80};
            }
            first = false;
        } else {
            components.push_back(static_cast<uint32_t>(value));
        }
        value = 0;
    }

    if (data[length - 1] & 0x80) {
        throw std::runtime_error("Truncated OID");
    }
    return formatOid(components);
}

core::SnmpVarBind SnmpCodec::decodeValue(const std::string& oid, uint8_t tag, const uint8_t* data,
                                         size_t length) {
    core::SnmpVarBind varbind;
    varbind.oid = oid;
    varbind.type = tagToDataType(tag);

    switch (tag) {
        case TAG_INTEGER:
            varbind.intValue = decodeInteger(data, length);
            varbind.value = std::to_string(*varbind.intValue);
            break;
        case TAG_OCTET_STRING:
            varbind.value.assign(reinterpret_cast<const char*>(data), length);
            break;
        case TAG_OID:
            varbind.value = decodeOid(data, length);
            break;
        case TAG_IP_ADDRESS:
            if (length != 4) {
                throw std::runtime_error("Invalid IpAddress length");
            }
            varbind.value = std::to_string(data[0]) + "." + std::to_string(data[1]) + "." +
                            std::to_string(data[2]) + "." + std::to_string(data[3]);
            break;
        case TAG_COUNTER32:
        case TAG_GAUGE32:
        case TAG_TIMETICKS:
        case TAG_COUNTER64:
            varbind.counterValue = decodeUnsigned(data, length);
            varbind.value = std::to_string(*varbind.counterValue);
            break;
        case TAG_NULL:
        case TAG_NO_SUCH_OBJECT:
        case TAG_NO_SUCH_INSTANCE:
        case TAG_END_OF_MIB_VIEW:
            break;
        default: {
            // Unknown types are kept as hex
            std::ostringstream oss;
            oss << std::hex;
            for (size_t i = 0; i < length; ++i) {
                oss << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
            }
            varbind.value = oss.str();
            break;
        }
    }
    return varbind;
}

} // namespace netsentry::infra
