/// @file nsdp_dump.cpp
/// CLI tool: Decode NSDP messages from hex input or files

#include <libnsdp/nsdp_library.h>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <string>

using namespace libnsdp;

static const char* operationName(Operation op) {
    switch (op) {
        case Operation::ReadRequest:   return "Read Request";
        case Operation::ReadResponse:  return "Read Response";
        case Operation::WriteRequest:  return "Write Request";
        case Operation::WriteResponse: return "Write Response";
        default:                       return "Unknown";
    }
}

static void dumpMessage(const Message& msg) {
    const auto& h = msg.header;
    std::cout << "Version:    " << static_cast<int>(h.version) << "\n"
              << "Operation:  " << operationName(h.operation)
              << " (" << static_cast<int>(h.operation) << ")\n"
              << "Result:     0x" << std::hex << std::setw(4) << std::setfill('0')
              << h.result << std::dec << "\n"
              << "Host MAC:   " << h.hostMac.toString() << "\n"
              << "Device MAC: " << h.deviceMac.toString() << "\n"
              << "Sequence:   " << h.sequence << "\n"
              << "TLVs:       " << msg.tlvs.size() << "\n\n";

    const auto& catalog = ParamCatalog::builtin();
    for (const auto& t : msg.tlvs) {
        std::cout << Hex::formatId(t.type) << "  len=" << t.value.size();
        if (auto label = catalog.describe(t.type, ByteSpan(t.value))) std::cout << "  [" << *label << "]";
        std::cout << "\n";
        if (!t.value.empty()) {
            std::cout << "    " << Hex::encode(ByteSpan(t.value)) << "\n";
            auto interpretation = ValueInterpreter::describe(ByteSpan(t.value));
            if (!interpretation.empty()) std::cout << "    " << interpretation << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <hex_string>\n"
                  << "       " << argv[0] << " -f <file>\n"
                  << "\nDecodes an NSDP message (header and TLV list).\n";
        return 1;
    }

    std::string hexInput;
    if (std::string(argv[1]) == "-f" && argc > 2) {
        std::ifstream file(argv[2]);
        if (!file.is_open()) {
            std::cerr << "Cannot open file: " << argv[2] << "\n";
            return 1;
        }
        std::stringstream ss;
        ss << file.rdbuf();
        hexInput = ss.str();
    } else {
        for (int i = 1; i < argc; ++i) hexInput += argv[i];
    }

    Bytes data;
    auto r = Hex::decode(hexInput, data);
    if (r.failed()) {
        std::cerr << "Invalid hex input\n";
        return 1;
    }

    std::cout << "Input: " << data.size() << " bytes\n\n";

    Message msg;
    r = Message::decode(data, msg);
    if (r.failed()) {
        std::cerr << "Decode failed: " << r.message() << "\n";
        return 1;
    }

    dumpMessage(msg);
    return 0;
}
