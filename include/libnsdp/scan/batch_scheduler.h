#pragma once

#include "scan_types.h"
#include "tlv_prober.h"
#include "../core/error.h"
#include <functional>
#include <vector>

namespace libnsdp {

/// @brief Walks a range batch by batch, pausing between batches
///
/// Batches are probed strictly in ascending order with a single
/// transaction outstanding at a time. The pause gives resource-constrained
/// switch firmware time to recover; it is not applied after the last batch.
class BatchScheduler {
public:
    using SleepHandler = std::function<void(uint32_t ms)>;

    BatchScheduler();

    /// @brief Split a range into ascending batches of at most batchSize ids
    /// @param range      inclusive range, start <= end
    /// @param batchSize  >= 1
    /// @return batches covering the range exactly once; empty on bad input
    static std::vector<Batch> partition(const ScanRange& range, uint32_t batchSize);

    /// @brief Probe every batch of result.range and append findings
    /// @param device   device to scan
    /// @param options  batch size, pacing delay, per-query timeout
    /// @param result   range must be set; findings are appended in probe order
    /// @return InvalidBatchSize / InvalidRange before any probing, else Success
    Result run(NsdpDevice& device, const ScanOptions& options, ScanResult& result);

    /// @brief Receive one event per completed batch
    void setBatchCallback(BatchCallback cb) { batchCallback_ = std::move(cb); }

    /// @brief Replace the pacing sleep (default: std::this_thread::sleep_for)
    void setSleepHandler(SleepHandler handler) { sleepHandler_ = std::move(handler); }

    const TlvProber& prober() const { return prober_; }

private:
    TlvProber prober_;
    BatchCallback batchCallback_;
    SleepHandler sleepHandler_;
};

} // namespace libnsdp
