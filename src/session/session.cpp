#include "libnsdp/session/session.h"
#include "libnsdp/packet/tlv_ids.h"
#include "libnsdp/core/log.h"
#include <algorithm>
#include <chrono>
#include <cstdio>

namespace libnsdp {

namespace {
    std::optional<std::string> textValue(const Message& msg, TlvId id) {
        auto* rec = msg.find(id);
        if (!rec || rec->value.empty()) return std::nullopt;
        std::string s(rec->value.begin(), rec->value.end());
        // Firmware pads strings with NULs
        auto end = s.find('\0');
        if (end != std::string::npos) s.resize(end);
        if (s.empty()) return std::nullopt;
        return s;
    }

    std::optional<std::string> ipValue(const Message& msg, TlvId id) {
        auto* rec = msg.find(id);
        if (!rec || rec->value.size() != 4) return std::nullopt;
        char buf[16];
        snprintf(buf, sizeof(buf), "%u.%u.%u.%u",
                 rec->value[0], rec->value[1], rec->value[2], rec->value[3]);
        return std::string(buf);
    }
} // anonymous

Session::Session(std::shared_ptr<ITransport> transport)
    : transport_(std::move(transport)) {}

Result Session::sendRequest(const Message& request) {
    if (!transport_ || !transport_->isOpen()) {
        return ErrorCode::TransportNotAvailable;
    }

    Bytes data = request.encode();
    LIBNSDP_TRACE("Send seq=%u tlvs=%zu size=%zu",
                  request.header.sequence, request.tlvs.size(), data.size());

    auto r = transport_->send(ByteSpan(data.data(), data.size()));
    if (r.failed()) {
        LIBNSDP_DEBUG("Send failed: %s", r.message().c_str());
    }
    return r;
}

bool Session::matches(const MessageHeader& request, const MessageHeader& reply) const {
    if (reply.operation != Operation::ReadResponse &&
        reply.operation != Operation::WriteResponse) {
        return false;
    }
    if (reply.sequence != request.sequence) return false;
    if (!request.deviceMac.isZero() && reply.deviceMac != request.deviceMac) return false;
    return true;
}

Result Session::transact(const Message& request, Message& response, uint32_t timeoutMs) {
    auto r = sendRequest(request);
    if (r.failed()) return r;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return ErrorCode::TransportTimeout;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

        Bytes datagram;
        r = transport_->recv(datagram, static_cast<uint32_t>(std::max<int64_t>(remaining, 1)));
        if (r.failed()) return r;

        auto dr = Message::decode(datagram, response);
        if (dr.code() == ErrorCode::BufferTooSmall || dr.code() == ErrorCode::InvalidMessage) {
            continue;  // not NSDP
        }
        if (!matches(request.header, response.header)) {
            LIBNSDP_TRACE("Ignoring reply seq=%u from %s",
                          response.header.sequence, response.header.deviceMac.toString().c_str());
            continue;
        }
        return dr;
    }
}

Result Session::query(const MacAddress& device, TlvId tlv, Bytes& value, uint32_t timeoutMs) {
    value.clear();

    auto hostMac = transport_ ? transport_->hostMac() : MacAddress();
    Message request = Message::readRequest(hostMac, device, nextSequence(), {tlv});

    Message response;
    auto r = transact(request, response, timeoutMs);
    if (r.failed()) return r;

    if (response.header.result != 0) {
        LIBNSDP_TRACE("TLV 0x%04X rejected by %s (result 0x%04X)",
                      tlv, device.toString().c_str(), response.header.result);
        return ErrorCode::DeviceRejected;
    }

    auto* rec = response.find(tlv);
    if (!rec) return ErrorCode::TlvNotPresent;

    value = rec->value;
    return ErrorCode::Success;
}

Result Session::discover(uint32_t timeoutMs, std::vector<DeviceInfo>& devices) {
    devices.clear();

    auto hostMac = transport_ ? transport_->hostMac() : MacAddress();
    Message request = Message::readRequest(hostMac, MacAddress(), nextSequence(),
                                           {tlv::Model, tlv::Name, tlv::Mac,
                                            tlv::IpAddress, tlv::FirmwareSlot1});

    auto r = sendRequest(request);
    if (r.failed()) return r;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

        Bytes datagram;
        r = transport_->recv(datagram, static_cast<uint32_t>(std::max<int64_t>(remaining, 1)));
        if (r.code() == ErrorCode::TransportTimeout) break;
        if (r.failed()) return r;

        Message reply;
        if (Message::decode(datagram, reply).failed()) continue;
        if (!matches(request.header, reply.header)) continue;

        DeviceInfo info;
        info.mac = reply.header.deviceMac;
        if (auto* macTlv = reply.find(tlv::Mac)) {
            if (macTlv->value.size() == 6) info.mac = MacAddress(macTlv->value.data());
        }

        auto seen = std::find_if(devices.begin(), devices.end(),
                                 [&](const DeviceInfo& d) { return d.mac == info.mac; });
        if (seen != devices.end()) continue;

        info.model = textValue(reply, tlv::Model);
        info.name = textValue(reply, tlv::Name);
        info.ipAddress = ipValue(reply, tlv::IpAddress);
        info.firmware = textValue(reply, tlv::FirmwareSlot1);

        LIBNSDP_DEBUG("Discovered %s (%s)", info.mac.toString().c_str(),
                      info.model ? info.model->c_str() : "unknown model");
        devices.push_back(std::move(info));
    }

    LIBNSDP_INFO("Discovery found %zu device(s)", devices.size());
    return ErrorCode::Success;
}

} // namespace libnsdp
