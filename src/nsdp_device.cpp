#include "libnsdp/nsdp_device.h"
#include "libnsdp/packet/tlv_ids.h"
#include "libnsdp/core/log.h"

namespace libnsdp {

NsdpDevice::NsdpDevice(std::shared_ptr<Session> session, const MacAddress& mac)
    : session_(std::move(session)), mac_(mac) {}

Result NsdpDevice::readTlv(TlvId tlv, Bytes& value, uint32_t timeoutMs) {
    if (!session_) return ErrorCode::TransportNotAvailable;
    return session_->query(mac_, tlv, value, timeoutMs);
}

std::optional<std::string> NsdpDevice::name(uint32_t timeoutMs) {
    return readText(tlv::Name, timeoutMs);
}

std::optional<std::string> NsdpDevice::model(uint32_t timeoutMs) {
    return readText(tlv::Model, timeoutMs);
}

std::optional<std::string> NsdpDevice::readText(TlvId tlv, uint32_t timeoutMs) {
    Bytes value;
    auto r = readTlv(tlv, value, timeoutMs);
    if (r.failed()) {
        LIBNSDP_DEBUG("%s: TLV 0x%04X unavailable: %s",
                      mac_.toString().c_str(), tlv, r.message().c_str());
        return std::nullopt;
    }

    std::string text(value.begin(), value.end());
    auto end = text.find('\0');
    if (end != std::string::npos) text.resize(end);
    if (text.empty()) return std::nullopt;
    return text;
}

} // namespace libnsdp
