#include "libnsdp/report/report_writer.h"
#include "libnsdp/scan/result_aggregator.h"
#include "libnsdp/scan/value_interpreter.h"
#include "libnsdp/core/hex.h"
#include "libnsdp/core/log.h"
#include <ctime>
#include <cstdio>
#include <fstream>

namespace libnsdp {

ReportWriter::ReportWriter(const ParamCatalog& catalog)
    : catalog_(catalog) {}

void ReportWriter::printIdentity(std::ostream& os, const DeviceIdentity& device) const {
    os << "Device MAC: " << device.mac << "\n";
    if (device.name) os << "Device Name: " << *device.name << "\n";
    if (device.model) os << "Device Model: " << *device.model << "\n";
}

void ReportWriter::printSummary(std::ostream& os, const ScanResult& result) const {
    os << "=== Scan Results ===\n"
       << "Total TLVs tested: " << result.totalTested << "\n"
       << "Valid TLVs found: " << result.totalValid << "\n"
       << "Success rate: " << ResultAggregator::formatSuccessRate(result) << "\n"
       << "Scan duration: " << ResultAggregator::formatDuration(result.duration) << "\n\n";
}

void ReportWriter::printFindings(std::ostream& os, const ScanResult& result) const {
    if (result.findings.empty()) return;

    os << "=== Valid TLVs ===\n";
    char prefix[48];
    for (const auto& f : result.findings) {
        snprintf(prefix, sizeof(prefix), "0x%04X (%5u): %3zu bytes - ",
                 f.id, static_cast<unsigned>(f.id), f.length());
        os << prefix << Hex::encode(ByteSpan(f.data));
        if (auto label = catalog_.describe(f.id, ByteSpan(f.data))) {
            os << "  [" << *label << "]";
        }
        os << "\n";

        auto interpretation = ValueInterpreter::describe(ByteSpan(f.data));
        if (!interpretation.empty()) {
            os << "                   Interpretation: " << interpretation << "\n";
        }
    }
}

void ReportWriter::writeReport(std::ostream& os, const ScanResult& result) const {
    os << "NSDP TLV Discovery Results\n"
       << "==========================\n"
       << "Scan Date: " << formatScanDate(result.scanTime) << "\n";
    printIdentity(os, result.device);
    os << "Total TLVs Tested: " << result.totalTested << "\n"
       << "Valid TLVs Found: " << result.totalValid << "\n"
       << "Success Rate: " << ResultAggregator::formatSuccessRate(result) << "\n"
       << "Scan Duration: " << ResultAggregator::formatDuration(result.duration) << "\n"
       << "\n"
       << "Valid TLVs:\n"
       << "-----------\n";

    for (const auto& f : result.findings) {
        os << "TLV: " << Hex::formatId(f.id) << " (" << f.id << ")\n";
        if (auto label = catalog_.describe(f.id, ByteSpan(f.data))) {
            os << "Parameter: " << *label << "\n";
        }
        os << "Length: " << f.length() << " bytes\n"
           << "Hex Data: " << Hex::encode(ByteSpan(f.data)) << "\n";

        auto interpretation = ValueInterpreter::describe(ByteSpan(f.data));
        if (!interpretation.empty()) {
            os << "Interpretation: " << interpretation << "\n";
        }
        os << "\n";
    }
}

Result ReportWriter::saveReport(const std::string& path, const ScanResult& result) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        LIBNSDP_ERROR("Cannot create report file %s", path.c_str());
        return ErrorCode::ReportOpenFailed;
    }

    writeReport(file, result);
    file.flush();
    if (!file) {
        LIBNSDP_ERROR("Error writing report file %s", path.c_str());
        return ErrorCode::ReportWriteFailed;
    }

    LIBNSDP_INFO("Report written to %s", path.c_str());
    return ErrorCode::Success;
}

std::string ReportWriter::devicePath(const std::string& base, size_t index, size_t deviceCount) {
    if (deviceCount <= 1) return base;

    std::string suffix = "_device" + std::to_string(index);

    // Only a dot inside the last path component starts an extension, and a
    // leading dot (".report") names a hidden file rather than an extension.
    auto slash = base.find_last_of('/');
    size_t nameStart = (slash == std::string::npos) ? 0 : slash + 1;
    auto dot = base.find_last_of('.');
    if (dot == std::string::npos || dot <= nameStart) {
        return base + suffix;
    }
    return base.substr(0, dot) + suffix + base.substr(dot);
}

std::string ReportWriter::formatScanDate(std::chrono::system_clock::time_point t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm = {};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm);
    return std::string(buf);
}

} // namespace libnsdp
