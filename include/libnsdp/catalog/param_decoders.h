#pragma once

#include "../core/types.h"
#include <optional>
#include <string>

namespace libnsdp {

/// Semantic decoders for parameter codes whose layout is known.
///
/// Each TLV-level decoder returns nullopt when the payload is too short
/// for its layout; the caller then shows the label alone.
class ParamDecoders {
public:
    // ── Field formatters ─────────────────────────────

    /// Link state byte of a port status record ("Up (1000 Mbps)")
    static std::string portStatus(uint8_t status);
    static std::string vlanEngineMode(uint8_t mode);
    static std::string qosEngineMode(uint8_t mode);
    static std::string qosPriority(uint8_t priority);
    /// 0x00 disabled; 0x01 and 0x03 enabled
    static std::string enabledDisabled(uint8_t value);
    /// Rate limit step (0 = no limit .. 11 = 512 Mbps)
    static std::string rateLimit(uint16_t limit);

    // ── TLV decoders ─────────────────────────────────

    /// 0x0C00: 3-byte records {port, status, flags}
    static std::optional<std::string> decodePortStatus(ByteSpan data);
    /// 0x2000: engine mode in the first byte
    static std::optional<std::string> decodeVlanEngine(ByteSpan data);
    /// 0x3400: engine mode in the first byte
    static std::optional<std::string> decodeQosEngine(ByteSpan data);
    /// 0x3800: 2-byte records {port, priority}
    static std::optional<std::string> decodeQosPriority(ByteSpan data);
    /// 0x4C00 / 0x5000: {port, ..., limit (16-bit, last two bytes)}
    static std::optional<std::string> decodeRateLimit(ByteSpan data);
    /// 0x6800: {?, enabled, vlan id (16-bit)}
    static std::optional<std::string> decodeIgmpSnooping(ByteSpan data);
    /// Switches such as 0x5400, 0x6C00, 0x7000, 0x9000: flag in the first byte
    static std::optional<std::string> decodeFlag(ByteSpan data);
};

} // namespace libnsdp
