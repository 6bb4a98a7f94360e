/// @file nsdp_tlv_scan.cpp
/// CLI tool: Probe the NSDP TLV space of every switch on a network segment

#include <libnsdp/nsdp_library.h>
#include <iostream>
#include <memory>
#include <string>
#include <cstdlib>
#include <cerrno>

using namespace libnsdp;

namespace {

struct ToolConfig {
    std::string interfaceName;
    std::string startHex = "0000";
    std::string endHex = "FFFF";
    std::string outputFile;
    std::string deviceFilter;
    ScanOptions options;
    uint32_t timeoutMs = 10000;
    LogLevel logLevel = LogLevel::Warn;
};

void printUsage(const char* prog) {
    std::cerr
        << "NSDP TLV Discovery Tool v" << LIBNSDP_VERSION_STRING << "\n\n"
        << "Usage: " << prog << " -i <interface> [options]\n\n"
        << "Options:\n"
        << "  -i <iface>       Network interface name (required)\n"
        << "  -t <ms>          Query timeout in milliseconds (default: 10000)\n"
        << "  --start <hex>    Starting TLV hex value (default: 0000)\n"
        << "  --end <hex>      Ending TLV hex value (default: FFFF)\n"
        << "  --batch <n>      Number of TLVs to test per batch (default: 100)\n"
        << "  --delay <ms>     Delay between batches in milliseconds (default: 100)\n"
        << "  -o <file>        Output file for results\n"
        << "  --device <mac>   Only scan the device with this MAC address\n"
        << "  -v, -vv          Debug / trace output\n";
}

bool parseUint(const char* text, uint32_t& out) {
    if (!text || !*text || *text == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long v = std::strtoul(text, &end, 10);
    if (errno != 0 || *end != '\0' || v > 0xFFFFFFFFul) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

/// @return 0 on success, otherwise the process exit code
int parseArgs(int argc, char* argv[], ToolConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 2;
        } else if (arg == "-v") {
            cfg.logLevel = LogLevel::Debug;
        } else if (arg == "-vv") {
            cfg.logLevel = LogLevel::Trace;
        } else if (!hasValue) {
            std::cerr << "Missing value for " << arg << "\n";
            return 1;
        } else if (arg == "-i") {
            cfg.interfaceName = argv[++i];
        } else if (arg == "-t") {
            if (!parseUint(argv[++i], cfg.timeoutMs)) {
                std::cerr << "Invalid timeout: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--start") {
            cfg.startHex = argv[++i];
        } else if (arg == "--end") {
            cfg.endHex = argv[++i];
        } else if (arg == "--batch") {
            if (!parseUint(argv[++i], cfg.options.batchSize) || cfg.options.batchSize == 0) {
                std::cerr << "Batch size must be a positive integer\n";
                return 1;
            }
        } else if (arg == "--delay") {
            if (!parseUint(argv[++i], cfg.options.interBatchDelayMs)) {
                std::cerr << "Invalid delay: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "-o") {
            cfg.outputFile = argv[++i];
        } else if (arg == "--device") {
            cfg.deviceFilter = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    if (cfg.interfaceName.empty()) {
        std::cerr << "Error: Network interface name is required\n";
        return 1;
    }
    cfg.options.queryTimeoutMs = cfg.timeoutMs;
    return 0;
}

} // anonymous

int main(int argc, char* argv[]) {
    ToolConfig cfg;
    int rc = parseArgs(argc, argv, cfg);
    if (rc != 0) {
        if (rc == 1) printUsage(argv[0]);
        return rc == 2 ? 0 : rc;
    }

    Logger::instance().setLevel(cfg.logLevel);

    ScanRange range;
    auto r = Hex::parseId(cfg.startHex, range.start);
    if (r.failed()) {
        std::cerr << "Invalid start hex value: " << cfg.startHex << "\n";
        return 1;
    }
    r = Hex::parseId(cfg.endHex, range.end);
    if (r.failed()) {
        std::cerr << "Invalid end hex value: " << cfg.endHex << "\n";
        return 1;
    }
    if (!range.valid()) {
        std::cerr << "Start value (" << Hex::formatId(range.start)
                  << ") must be <= end value (" << Hex::formatId(range.end) << ")\n";
        return 1;
    }

    std::optional<MacAddress> onlyDevice;
    if (!cfg.deviceFilter.empty()) {
        onlyDevice = MacAddress::parse(cfg.deviceFilter);
        if (!onlyDevice) {
            std::cerr << Result(ErrorCode::InvalidMacAddress).message() << ": " << cfg.deviceFilter << "\n";
            return 1;
        }
    }

    libnsdp::initialize();

    std::cout << "=== NSDP TLV Discovery Tool ===\n"
              << "Interface: " << cfg.interfaceName << "\n"
              << "Timeout: " << cfg.timeoutMs << " ms\n"
              << "Scanning range: " << Hex::formatId(range.start) << " to "
              << Hex::formatId(range.end) << " (" << range.size() << " TLVs)\n"
              << "Batch size: " << cfg.options.batchSize << "\n"
              << "Delay between batches: " << cfg.options.interBatchDelayMs << " ms\n\n";

    auto transport = TransportFactory::create(cfg.interfaceName);
    if (!transport) {
        std::cerr << "Failed to open interface " << cfg.interfaceName << "\n";
        return 1;
    }
    auto session = std::make_shared<Session>(transport);

    std::cout << "Discovering NSDP devices...\n";
    std::vector<DeviceInfo> devices;
    r = session->discover(cfg.timeoutMs, devices);
    if (r.failed()) {
        std::cerr << "Failed to discover devices: " << r.message() << "\n";
        return 1;
    }

    if (onlyDevice) {
        std::vector<DeviceInfo> selected;
        for (auto& d : devices) {
            if (d.mac == *onlyDevice) selected.push_back(std::move(d));
        }
        devices.swap(selected);
    }

    if (devices.empty()) {
        std::cout << Result(ErrorCode::NoDevicesFound).message() << "\n";
        return 1;
    }
    std::cout << "Found " << devices.size() << " device(s)\n\n";

    ReportWriter writer;
    for (size_t i = 0; i < devices.size(); ++i) {
        std::cout << "=== Device " << (i + 1) << " ===\n";

        NsdpDevice device(session, devices[i].mac);
        TlvScanner scanner;
        scanner.setIdentityCallback([&](const DeviceIdentity& identity) {
            writer.printIdentity(std::cout, identity);
            std::cout << "\n";
        });
        scanner.scheduler().setBatchCallback([&](const BatchProgress& p) {
            std::cout << "Scanning batch " << p.batch.index << ": "
                      << Hex::formatId(p.batch.first) << " to " << Hex::formatId(p.batch.last)
                      << "... Found " << p.found << " valid TLVs\n";
            if (Logger::instance().enabled(LogLevel::Debug) && p.findings) {
                for (const auto& f : *p.findings) {
                    std::cout << "  " << Hex::formatId(f.id) << ": " << f.length()
                              << " bytes - " << Hex::encode(ByteSpan(f.data)) << "\n";
                }
            }
        });

        ScanResult result;
        r = scanner.runScan(device, range, cfg.options, result);
        if (r.failed()) {
            std::cerr << "Scan failed: " << r.message() << "\n";
            return 1;
        }

        std::cout << "\n";
        writer.printSummary(std::cout, result);
        writer.printFindings(std::cout, result);

        if (!cfg.outputFile.empty()) {
            auto path = ReportWriter::devicePath(cfg.outputFile, i + 1, devices.size());
            auto sr = writer.saveReport(path, result);
            if (sr.ok()) {
                std::cout << "Results saved to: " << path << "\n";
            } else {
                std::cerr << "Error creating output file " << path << ": " << sr.message() << "\n";
            }
        }
        std::cout << "\n";
    }

    libnsdp::shutdown();
    return 0;
}
