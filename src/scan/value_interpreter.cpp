#include "libnsdp/scan/value_interpreter.h"
#include "libnsdp/core/endian.h"
#include <cinttypes>
#include <cstdio>

namespace libnsdp {

bool ValueInterpreter::isPrintableAscii(ByteSpan data) {
    if (data.empty()) return false;
    for (auto b : data) {
        if (b < 32 || b > 126) return false;
    }
    return true;
}

std::vector<std::string> ValueInterpreter::interpret(ByteSpan data) {
    std::vector<std::string> out;
    if (data.empty()) return out;

    if (isPrintableAscii(data)) {
        out.push_back("String: \"" + std::string(data.begin(), data.end()) + "\"");
    }

    char buf[64];
    switch (data.size()) {
        case 1:
            snprintf(buf, sizeof(buf), "Uint8: %u", data[0]);
            out.emplace_back(buf);
            break;
        case 2:
            snprintf(buf, sizeof(buf), "Uint16: %u", Endian::readBe16(data.data()));
            out.emplace_back(buf);
            break;
        case 4:
            snprintf(buf, sizeof(buf), "Uint32: %" PRIu32, Endian::readBe32(data.data()));
            out.emplace_back(buf);
            snprintf(buf, sizeof(buf), "IP: %u.%u.%u.%u", data[0], data[1], data[2], data[3]);
            out.emplace_back(buf);
            break;
        case 6:
            snprintf(buf, sizeof(buf), "MAC: %02x:%02x:%02x:%02x:%02x:%02x",
                     data[0], data[1], data[2], data[3], data[4], data[5]);
            out.emplace_back(buf);
            break;
        default:
            break;
    }

    return out;
}

std::string ValueInterpreter::describe(ByteSpan data) {
    std::string joined;
    for (const auto& s : interpret(data)) {
        if (!joined.empty()) joined += " | ";
        joined += s;
    }
    return joined;
}

} // namespace libnsdp
