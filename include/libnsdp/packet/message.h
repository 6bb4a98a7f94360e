#pragma once

#include "../core/types.h"
#include "../core/endian.h"
#include "../core/error.h"
#include <vector>

namespace libnsdp {

/// NSDP operation codes (header byte 1)
enum class Operation : uint8_t {
    ReadRequest   = 0x01,
    ReadResponse  = 0x02,
    WriteRequest  = 0x03,
    WriteResponse = 0x04,
};

/// NSDP message header
/// Total header size: 32 bytes
struct MessageHeader {
    uint8_t    version = 0x01;
    Operation  operation = Operation::ReadRequest;
    uint16_t   result = 0;          // 0 = success (responses only)
    MacAddress hostMac;
    MacAddress deviceMac;           // all zero = any device
    uint16_t   sequence = 0;

    static constexpr size_t HEADER_SIZE = 32;
    static constexpr uint8_t VERSION = 0x01;
    static constexpr uint8_t SIGNATURE[4] = {'N', 'S', 'D', 'P'};

    /// Serialize to bytes
    void serialize(std::vector<uint8_t>& buf) const;

    /// Deserialize from bytes (checks version and signature)
    static Result deserialize(const uint8_t* data, size_t len, MessageHeader& out);
};

/// One Type-Length-Value record of a message body
struct TlvRecord {
    TlvId type = 0;
    Bytes value;

    static constexpr size_t HEADER_SIZE = 4;
};

/// Complete NSDP message: header plus TLV body
class Message {
public:
    /// Body terminator: type 0xFFFF, length 0
    static constexpr TlvId END_OF_MESSAGE = 0xFFFF;

    /// UDP port the host listens on
    static constexpr uint16_t HOST_PORT = 63321;
    /// UDP port devices listen on
    static constexpr uint16_t DEVICE_PORT = 63322;

    MessageHeader header;
    std::vector<TlvRecord> tlvs;

    /// Build a read request asking for each id with an empty value
    static Message readRequest(const MacAddress& hostMac,
                               const MacAddress& deviceMac,
                               uint16_t sequence,
                               const std::vector<TlvId>& ids);

    /// Append a TLV record
    void add(TlvId type, Bytes value = {}) { tlvs.push_back({type, std::move(value)}); }

    /// Find the first record with the given type
    /// @return pointer into tlvs, or nullptr
    const TlvRecord* find(TlvId type) const;

    /// Encode header, TLVs and end marker
    Bytes encode() const;

    /// Decode a received datagram
    static Result decode(const uint8_t* data, size_t len, Message& out);
    static Result decode(const Bytes& data, Message& out) { return decode(data.data(), data.size(), out); }
};

} // namespace libnsdp
