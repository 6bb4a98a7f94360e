#pragma once

#include "scan_types.h"
#include "batch_scheduler.h"
#include "../nsdp_device.h"
#include "../core/error.h"
#include <functional>

namespace libnsdp {

/// @brief Discovers which parameter codes a device answers
///
/// Looks up the device identity, walks the range through the
/// BatchScheduler and finalizes the result. The returned ScanResult is
/// complete and is not touched again by the scanner.
class TlvScanner {
public:
    /// @brief Scan one device
    /// @param device   device to probe (exclusively used for the duration)
    /// @param range    inclusive identifier range
    /// @param options  batching, pacing and timeout settings
    /// @param result   receives the finalized result
    /// @return InvalidRange / InvalidBatchSize when rejected before probing,
    ///         Success otherwise; per-identifier failures are not errors
    Result runScan(NsdpDevice& device, const ScanRange& range,
                   const ScanOptions& options, ScanResult& result);

    /// @brief Called once the identity is known, before the first batch
    void setIdentityCallback(std::function<void(const DeviceIdentity&)> cb) {
        identityCallback_ = std::move(cb);
    }

    /// @brief Scheduler, for installing progress and sleep handlers
    BatchScheduler& scheduler() { return scheduler_; }

private:
    BatchScheduler scheduler_;
    std::function<void(const DeviceIdentity&)> identityCallback_;
};

} // namespace libnsdp
