#include "libnsdp/core/hex.h"
#include <cstdio>

namespace libnsdp {

namespace {
    int nibble(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    bool isSeparator(char c) {
        return c == ' ' || c == ':' || c == '\n' || c == '\r' || c == '\t';
    }
} // anonymous

std::string Hex::encode(ByteSpan data) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (auto b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Result Hex::decode(const std::string& text, Bytes& out) {
    out.clear();
    int high = -1;
    for (char c : text) {
        if (isSeparator(c)) continue;
        int v = nibble(c);
        if (v < 0) return ErrorCode::InvalidHexValue;
        if (high < 0) {
            high = v;
        } else {
            out.push_back(static_cast<uint8_t>((high << 4) | v));
            high = -1;
        }
    }
    // Odd number of digits
    if (high >= 0) return ErrorCode::InvalidHexValue;
    return ErrorCode::Success;
}

Result Hex::parseId(const std::string& text, TlvId& out) {
    size_t pos = 0;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        pos = 2;
    }
    if (pos >= text.size()) return ErrorCode::InvalidHexValue;

    uint32_t val = 0;
    for (; pos < text.size(); ++pos) {
        int v = nibble(text[pos]);
        if (v < 0) return ErrorCode::InvalidHexValue;
        val = (val << 4) | static_cast<uint32_t>(v);
        if (val > 0xFFFF) return ErrorCode::InvalidHexValue;
    }
    out = static_cast<TlvId>(val);
    return ErrorCode::Success;
}

std::string Hex::formatId(TlvId id) {
    char buf[8];
    snprintf(buf, sizeof(buf), "0x%04X", id);
    return std::string(buf);
}

} // namespace libnsdp
