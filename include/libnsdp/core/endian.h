#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace libnsdp {

/// Network byte order helpers for NSDP header fields and TLV headers.
/// Callers check bounds before reading.
class Endian {
public:
    static uint16_t readBe16(const uint8_t* p) {
        return static_cast<uint16_t>((p[0] << 8) | p[1]);
    }

    static uint32_t readBe32(const uint8_t* p) {
        return (static_cast<uint32_t>(readBe16(p)) << 16) | readBe16(p + 2);
    }

    /// Overwrite a 16-bit field in place (e.g. patch a TLV length)
    static void writeBe16(uint8_t* p, uint16_t val) {
        p[0] = static_cast<uint8_t>(val >> 8);
        p[1] = static_cast<uint8_t>(val);
    }

    static void appendBe16(std::vector<uint8_t>& buf, uint16_t val) {
        buf.push_back(static_cast<uint8_t>(val >> 8));
        buf.push_back(static_cast<uint8_t>(val));
    }

    /// Append `count` zero bytes (reserved header fields)
    static void appendZeros(std::vector<uint8_t>& buf, size_t count) {
        buf.insert(buf.end(), count, 0);
    }
};

} // namespace libnsdp
