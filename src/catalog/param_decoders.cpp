#include "libnsdp/catalog/param_decoders.h"
#include "libnsdp/core/endian.h"
#include <cstdio>

namespace libnsdp {

namespace {
    std::string unknown(const char* what, unsigned value, const char* fmt = "0x%02x") {
        char num[16];
        snprintf(num, sizeof(num), fmt, value);
        return std::string(what) + " (" + num + ")";
    }
} // anonymous

std::string ParamDecoders::portStatus(uint8_t status) {
    switch (status) {
        case 0x00: return "Down";
        case 0x01: return "Up (10 Mbps Half-Duplex)";
        case 0x02: return "Up (10 Mbps Full-Duplex)";
        case 0x03: return "Up (100 Mbps Half-Duplex)";
        case 0x04: return "Up (100 Mbps Full-Duplex)";
        case 0x05: return "Up (1000 Mbps)";
        default:   return unknown("Unknown Status", status);
    }
}

std::string ParamDecoders::vlanEngineMode(uint8_t mode) {
    switch (mode) {
        case 0x00: return "Disabled";
        case 0x01: return "Basic Port Based";
        case 0x02: return "Advanced Port Based";
        case 0x03: return "Basic 802.1Q";
        case 0x04: return "Advanced 802.1Q";
        default:   return unknown("Unknown Mode", mode);
    }
}

std::string ParamDecoders::qosEngineMode(uint8_t mode) {
    switch (mode) {
        case 0x01: return "Port Based";
        case 0x02: return "802.1p";
        default:   return unknown("Unknown Mode", mode);
    }
}

std::string ParamDecoders::qosPriority(uint8_t priority) {
    switch (priority) {
        case 0x01: return "High";
        case 0x02: return "Medium";
        case 0x03: return "Normal";
        case 0x04: return "Low";
        default:   return unknown("Unknown", priority);
    }
}

std::string ParamDecoders::enabledDisabled(uint8_t value) {
    switch (value) {
        case 0x00: return "Disabled";
        case 0x01:
        case 0x03: return "Enabled";
        default:   return unknown("Unknown", value);
    }
}

std::string ParamDecoders::rateLimit(uint16_t limit) {
    static const char* const kSteps[] = {
        "No Limit", "512 Kbps", "1 Mbps", "2 Mbps", "4 Mbps", "8 Mbps",
        "16 Mbps", "32 Mbps", "64 Mbps", "128 Mbps", "256 Mbps", "512 Mbps",
    };
    if (limit < sizeof(kSteps) / sizeof(kSteps[0])) return kSteps[limit];
    return unknown("Unknown", limit, "%u");
}

// ══════════════════════════════════════════════════════
//  TLV decoders
// ══════════════════════════════════════════════════════

std::optional<std::string> ParamDecoders::decodePortStatus(ByteSpan data) {
    if (data.size() < 3) return std::nullopt;

    std::string out;
    for (size_t i = 0; i + 3 <= data.size(); i += 3) {
        if (!out.empty()) out += "; ";
        out += "Port " + std::to_string(data[i]) + ": " + portStatus(data[i + 1]);
    }
    return out;
}

std::optional<std::string> ParamDecoders::decodeVlanEngine(ByteSpan data) {
    if (data.empty()) return std::nullopt;
    return vlanEngineMode(data[0]);
}

std::optional<std::string> ParamDecoders::decodeQosEngine(ByteSpan data) {
    if (data.empty()) return std::nullopt;
    return qosEngineMode(data[0]);
}

std::optional<std::string> ParamDecoders::decodeQosPriority(ByteSpan data) {
    if (data.size() < 2) return std::nullopt;

    std::string out;
    for (size_t i = 0; i + 2 <= data.size(); i += 2) {
        if (!out.empty()) out += "; ";
        out += "Port " + std::to_string(data[i]) + ": " + qosPriority(data[i + 1]);
    }
    return out;
}

std::optional<std::string> ParamDecoders::decodeRateLimit(ByteSpan data) {
    if (data.size() < 3) return std::nullopt;
    uint16_t limit = Endian::readBe16(data.data() + data.size() - 2);
    return "Port " + std::to_string(data[0]) + ": " + rateLimit(limit);
}

std::optional<std::string> ParamDecoders::decodeIgmpSnooping(ByteSpan data) {
    if (data.size() < 4) return std::nullopt;
    return enabledDisabled(data[1]) + " (VLAN " +
           std::to_string(Endian::readBe16(data.data() + 2)) + ")";
}

std::optional<std::string> ParamDecoders::decodeFlag(ByteSpan data) {
    if (data.empty()) return std::nullopt;
    return enabledDisabled(data[0]);
}

} // namespace libnsdp
