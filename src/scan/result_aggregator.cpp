#include "libnsdp/scan/result_aggregator.h"
#include <algorithm>
#include <cstdio>

namespace libnsdp {

void ResultAggregator::finalize(ScanResult& result,
                                std::chrono::steady_clock::time_point startTime) {
    std::stable_sort(result.findings.begin(), result.findings.end(),
                     [](const Finding& a, const Finding& b) { return a.id < b.id; });

    result.totalTested = result.range.size();
    result.totalValid = static_cast<uint32_t>(result.findings.size());
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
}

double ResultAggregator::successRate(const ScanResult& result) {
    if (result.totalTested == 0) return 0.0;
    return static_cast<double>(result.totalValid) /
           static_cast<double>(result.totalTested) * 100.0;
}

std::string ResultAggregator::formatSuccessRate(const ScanResult& result) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2f%%", successRate(result));
    return std::string(buf);
}

std::string ResultAggregator::formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 0) ms = 0;
    char buf[48];
    snprintf(buf, sizeof(buf), "%lld.%03llds",
             static_cast<long long>(ms / 1000), static_cast<long long>(ms % 1000));
    return std::string(buf);
}

} // namespace libnsdp
