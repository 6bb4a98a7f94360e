#pragma once

#include "core/types.h"
#include "core/error.h"
#include "session/session.h"
#include <memory>
#include <optional>
#include <string>

namespace libnsdp {

/// One NSDP device reachable through a session.
/// The device does not own the session; several devices found by the same
/// discovery share it, and are scanned one after another.
class NsdpDevice {
public:
    NsdpDevice(std::shared_ptr<Session> session, const MacAddress& mac);

    const MacAddress& mac() const { return mac_; }

    /// Read one parameter with an empty request value
    Result readTlv(TlvId tlv, Bytes& value, uint32_t timeoutMs);

    /// Device name, or nullopt when the device does not answer
    std::optional<std::string> name(uint32_t timeoutMs);

    /// Device model, or nullopt when the device does not answer
    std::optional<std::string> model(uint32_t timeoutMs);

private:
    std::optional<std::string> readText(TlvId tlv, uint32_t timeoutMs);

    std::shared_ptr<Session> session_;
    MacAddress mac_;
};

} // namespace libnsdp
