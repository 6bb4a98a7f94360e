#include "mock/mock_transport.h"
#include "libnsdp/core/endian.h"

namespace libnsdp {
namespace test {

MockTransport::MockTransport()
    : hostMac_(makeMac(0x02, 0x00, 0x00, 0x00, 0x00, 0x01)) {}

Result MockTransport::send(ByteSpan payload) {
    ++sendCount_;
    if (recordSends_) {
        sendHistory_.emplace_back(payload.begin(), payload.end());
    }

    if (sendHandler_) {
        return sendHandler_(payload);
    }
    return ErrorCode::Success;
}

Result MockTransport::recv(MutableByteSpan buffer, size_t& bytesReceived,
                           uint32_t /*timeoutMs*/) {
    bytesReceived = 0;
    if (recvQueue_.empty()) {
        return ErrorCode::TransportTimeout;
    }

    const auto& datagram = recvQueue_.front();
    size_t copyLen = std::min(datagram.size(), buffer.size());
    std::memcpy(buffer.data(), datagram.data(), copyLen);
    bytesReceived = copyLen;

    recvQueue_.pop_front();
    return ErrorCode::Success;
}

// ══════════════════════════════════════════════════════
//  SimulatedSwitch
// ══════════════════════════════════════════════════════

SimulatedSwitch::SimulatedSwitch(const MacAddress& mac)
    : mac_(mac) {}

void SimulatedSwitch::attach(MockTransport& transport) {
    transport.setSendHandler([this, &transport](ByteSpan payload) -> Result {
        ++requests_;
        Message request;
        auto r = Message::decode(payload.data(), payload.size(), request);
        if (r.failed()) return ErrorCode::Success;

        if (auto datagram = reply(request)) {
            transport.queueRecvData(*datagram);
        }
        return ErrorCode::Success;
    });
}

std::optional<Bytes> SimulatedSwitch::reply(const Message& request) const {
    if (request.header.operation != Operation::ReadRequest) return std::nullopt;
    if (!request.header.deviceMac.isZero() && request.header.deviceMac != mac_) {
        return std::nullopt;
    }

    Message response;
    response.header.operation = Operation::ReadResponse;
    response.header.hostMac = request.header.hostMac;
    response.header.deviceMac = mac_;
    response.header.sequence = request.header.sequence;

    bool malformed = false;
    for (const auto& t : request.tlvs) {
        if (rejectedIds_.count(t.type)) {
            response.header.result = 0x0007;
            response.tlvs.clear();
            return response.encode();
        }
        if (malformedIds_.count(t.type)) {
            malformed = true;
            response.add(t.type, {0xAA});
            continue;
        }
        auto it = params_.find(t.type);
        if (it != params_.end()) {
            response.add(t.type, it->second);
        } else if (emptyIds_.count(t.type)) {
            response.add(t.type);
        }
    }

    if (response.tlvs.empty()) return std::nullopt;

    Bytes datagram = response.encode();
    if (malformed) {
        // Claim more value bytes than the datagram carries
        size_t offset = MessageHeader::HEADER_SIZE;
        Endian::writeBe16(datagram.data() + offset + 2, 0x0100);
        datagram.resize(offset + TlvRecord::HEADER_SIZE + 1);
    }
    return datagram;
}

} // namespace test
} // namespace libnsdp
