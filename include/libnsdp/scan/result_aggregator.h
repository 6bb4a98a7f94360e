#pragma once

#include "scan_types.h"
#include <chrono>
#include <string>

namespace libnsdp {

/// Finalizes a ScanResult and derives its summary figures
class ResultAggregator {
public:
    /// Sort findings by id, set totalTested/totalValid, stamp the duration
    static void finalize(ScanResult& result, std::chrono::steady_clock::time_point startTime);

    /// totalValid / totalTested * 100 (0 when nothing was tested)
    static double successRate(const ScanResult& result);

    /// Success rate with two decimals, e.g. "3.00%"
    static std::string formatSuccessRate(const ScanResult& result);

    /// Duration as seconds with millisecond precision, e.g. "12.345s"
    static std::string formatDuration(std::chrono::milliseconds duration);
};

} // namespace libnsdp
