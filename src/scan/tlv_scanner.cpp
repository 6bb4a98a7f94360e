#include "libnsdp/scan/tlv_scanner.h"
#include "libnsdp/scan/result_aggregator.h"
#include "libnsdp/core/log.h"
#include <chrono>

namespace libnsdp {

Result TlvScanner::runScan(NsdpDevice& device, const ScanRange& range,
                           const ScanOptions& options, ScanResult& result) {
    if (options.batchSize == 0) return ErrorCode::InvalidBatchSize;
    if (!range.valid()) return ErrorCode::InvalidRange;

    result = ScanResult();
    result.range = range;
    result.totalTested = range.size();
    result.scanTime = std::chrono::system_clock::now();
    auto startTime = std::chrono::steady_clock::now();

    result.device.mac = device.mac().toString();
    result.device.name = device.name(options.queryTimeoutMs);
    result.device.model = device.model(options.queryTimeoutMs);
    if (identityCallback_) identityCallback_(result.device);

    LIBNSDP_INFO("Scanning %s: 0x%04X to 0x%04X (%u TLVs), batch %u, delay %u ms",
                 result.device.mac.c_str(), range.start, range.end, range.size(),
                 options.batchSize, options.interBatchDelayMs);

    auto r = scheduler_.run(device, options, result);
    if (r.failed()) return r;

    ResultAggregator::finalize(result, startTime);

    LIBNSDP_INFO("Scan of %s complete: %u of %u valid in %s",
                 result.device.mac.c_str(), result.totalValid, result.totalTested,
                 ResultAggregator::formatDuration(result.duration).c_str());
    return ErrorCode::Success;
}

} // namespace libnsdp
