#pragma once

#include "../scan/scan_types.h"
#include "../catalog/param_catalog.h"
#include "../core/error.h"
#include <chrono>
#include <ostream>
#include <string>

namespace libnsdp {

/// @brief Renders finalized scan results for the console and report files
///
/// Interpretations are recomputed from the raw bytes every time a result
/// is rendered; nothing is cached on the findings.
class ReportWriter {
public:
    /// @param catalog labels for known codes (may be empty)
    explicit ReportWriter(const ParamCatalog& catalog = ParamCatalog::builtin());

    /// @brief Device MAC, name and model; unknown fields are omitted
    void printIdentity(std::ostream& os, const DeviceIdentity& device) const;

    /// @brief Tested/valid counts, success rate and duration
    void printSummary(std::ostream& os, const ScanResult& result) const;

    /// @brief One line per finding plus its interpretation, if any
    void printFindings(std::ostream& os, const ScanResult& result) const;

    /// @brief Full flat-text report (header, totals, one block per finding)
    void writeReport(std::ostream& os, const ScanResult& result) const;

    /// @brief Write the report to a file
    /// @return ReportOpenFailed / ReportWriteFailed on I/O errors
    Result saveReport(const std::string& path, const ScanResult& result) const;

    /// @brief Report file name for one device of a multi-device run
    ///
    /// With more than one device, "_device<index>" is inserted before the
    /// file extension, or appended when there is none.
    /// @param base         file name given by the operator
    /// @param index        1-based device position
    /// @param deviceCount  number of devices in the run
    static std::string devicePath(const std::string& base, size_t index, size_t deviceCount);

    /// @brief "2026-10-19 12:00:00 UTC"
    static std::string formatScanDate(std::chrono::system_clock::time_point t);

private:
    const ParamCatalog& catalog_;
};

} // namespace libnsdp
