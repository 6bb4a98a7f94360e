#include "libnsdp/core/types.h"
#include <cctype>
#include <cstdio>

namespace libnsdp {

std::string MacAddress::toString() const {
    char buf[18];
    snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
             bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
    return std::string(buf);
}

std::optional<MacAddress> MacAddress::parse(const std::string& text) {
    // xx:xx:xx:xx:xx:xx
    if (text.size() != 17) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    };

    MacAddress mac;
    for (size_t i = 0; i < 6; ++i) {
        size_t pos = i * 3;
        int hi = nibble(text[pos]);
        int lo = nibble(text[pos + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        if (i < 5 && text[pos + 2] != ':' && text[pos + 2] != '-') return std::nullopt;
        mac.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return mac;
}

} // namespace libnsdp
