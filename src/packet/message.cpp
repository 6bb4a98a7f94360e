#include "libnsdp/packet/message.h"
#include "libnsdp/core/log.h"
#include <cstring>

namespace libnsdp {

// ══════════════════════════════════════════════════════
//  MessageHeader
// ══════════════════════════════════════════════════════
void MessageHeader::serialize(std::vector<uint8_t>& buf) const {
    buf.push_back(version);
    buf.push_back(static_cast<uint8_t>(operation));
    Endian::appendBe16(buf, result);
    Endian::appendZeros(buf, 4);                     // reserved
    buf.insert(buf.end(), hostMac.bytes.begin(), hostMac.bytes.end());
    buf.insert(buf.end(), deviceMac.bytes.begin(), deviceMac.bytes.end());
    Endian::appendZeros(buf, 2);                     // reserved
    Endian::appendBe16(buf, sequence);
    buf.insert(buf.end(), SIGNATURE, SIGNATURE + 4);
    Endian::appendZeros(buf, 4);                     // reserved
}

Result MessageHeader::deserialize(const uint8_t* data, size_t len,
                                  MessageHeader& out) {
    if (len < HEADER_SIZE) return ErrorCode::BufferTooSmall;

    if (data[0] != VERSION) return ErrorCode::InvalidMessage;
    if (std::memcmp(data + 24, SIGNATURE, 4) != 0) return ErrorCode::InvalidMessage;

    out.version   = data[0];
    out.operation = static_cast<Operation>(data[1]);
    out.result    = Endian::readBe16(data + 2);
    out.hostMac   = MacAddress(data + 8);
    out.deviceMac = MacAddress(data + 14);
    out.sequence  = Endian::readBe16(data + 22);

    return ErrorCode::Success;
}

// ══════════════════════════════════════════════════════
//  Message
// ══════════════════════════════════════════════════════
Message Message::readRequest(const MacAddress& hostMac,
                             const MacAddress& deviceMac,
                             uint16_t sequence,
                             const std::vector<TlvId>& ids) {
    Message msg;
    msg.header.operation = Operation::ReadRequest;
    msg.header.hostMac = hostMac;
    msg.header.deviceMac = deviceMac;
    msg.header.sequence = sequence;
    for (auto id : ids) msg.add(id);
    return msg;
}

const TlvRecord* Message::find(TlvId type) const {
    for (const auto& t : tlvs) {
        if (t.type == type) return &t;
    }
    return nullptr;
}

Bytes Message::encode() const {
    Bytes buf;
    buf.reserve(MessageHeader::HEADER_SIZE + tlvs.size() * 8 + 4);
    header.serialize(buf);

    for (const auto& t : tlvs) {
        Endian::appendBe16(buf, t.type);
        Endian::appendBe16(buf, static_cast<uint16_t>(t.value.size()));
        buf.insert(buf.end(), t.value.begin(), t.value.end());
    }

    Endian::appendBe16(buf, END_OF_MESSAGE);
    Endian::appendBe16(buf, 0);
    return buf;
}

Result Message::decode(const uint8_t* data, size_t len, Message& out) {
    out.tlvs.clear();

    auto r = MessageHeader::deserialize(data, len, out.header);
    if (r.failed()) {
        LIBNSDP_TRACE("Rejected datagram (%zu bytes): %s", len, r.message().c_str());
        return r;
    }

    size_t offset = MessageHeader::HEADER_SIZE;
    while (offset + TlvRecord::HEADER_SIZE <= len) {
        TlvId type = Endian::readBe16(data + offset);
        uint16_t length = Endian::readBe16(data + offset + 2);
        offset += TlvRecord::HEADER_SIZE;

        if (type == END_OF_MESSAGE) {
            return ErrorCode::Success;
        }

        if (offset + length > len) {
            LIBNSDP_DEBUG("TLV 0x%04X truncated: length %u, %zu bytes left",
                          type, length, len - offset);
            return ErrorCode::MalformedResponse;
        }

        TlvRecord rec;
        rec.type = type;
        rec.value.assign(data + offset, data + offset + length);
        out.tlvs.push_back(std::move(rec));
        offset += length;
    }

    // Some firmware omits the end marker; trailing bytes shorter than a
    // TLV header are ignored.
    return ErrorCode::Success;
}

} // namespace libnsdp
