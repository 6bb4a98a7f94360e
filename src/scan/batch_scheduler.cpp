#include "libnsdp/scan/batch_scheduler.h"
#include "libnsdp/core/log.h"
#include <iterator>
#include <chrono>
#include <thread>

namespace libnsdp {

BatchScheduler::BatchScheduler()
    : sleepHandler_([](uint32_t ms) {
          std::this_thread::sleep_for(std::chrono::milliseconds(ms));
      }) {}

std::vector<Batch> BatchScheduler::partition(const ScanRange& range, uint32_t batchSize) {
    std::vector<Batch> batches;
    if (batchSize == 0 || !range.valid()) return batches;

    batches.reserve((range.size() - 1) / batchSize + 1);

    // Cursor is 32 bits wide so that end == 0xFFFF terminates. The batch end
    // is clipped before adding, since batchSize may be close to 2^32.
    uint32_t cursor = range.start;
    uint32_t index = 1;
    while (cursor <= range.end) {
        uint32_t remaining = static_cast<uint32_t>(range.end) - cursor;
        uint32_t batchEnd = (remaining >= batchSize - 1) ? cursor + batchSize - 1
                                                         : static_cast<uint32_t>(range.end);

        Batch b;
        b.index = index++;
        b.first = static_cast<TlvId>(cursor);
        b.last = static_cast<TlvId>(batchEnd);
        batches.push_back(b);

        cursor = batchEnd + 1;
    }
    return batches;
}

Result BatchScheduler::run(NsdpDevice& device, const ScanOptions& options, ScanResult& result) {
    if (options.batchSize == 0) {
        LIBNSDP_ERROR("Batch size must be at least 1");
        return ErrorCode::InvalidBatchSize;
    }
    if (!result.range.valid()) {
        LIBNSDP_ERROR("Scan range start 0x%04X > end 0x%04X",
                      result.range.start, result.range.end);
        return ErrorCode::InvalidRange;
    }

    prober_.resetStats();

    auto batches = partition(result.range, options.batchSize);
    const auto total = static_cast<uint32_t>(batches.size());

    for (size_t i = 0; i < batches.size(); ++i) {
        const auto& batch = batches[i];

        auto found = prober_.probeBatch(device, batch, options.queryTimeoutMs);

        LIBNSDP_INFO("Batch %u/%u: 0x%04X to 0x%04X, %zu valid TLVs",
                     batch.index, total, batch.first, batch.last, found.size());

        if (batchCallback_) {
            BatchProgress progress;
            progress.batch = batch;
            progress.totalBatches = total;
            progress.found = found.size();
            progress.findings = &found;
            batchCallback_(progress);
        }

        result.findings.insert(result.findings.end(),
                               std::make_move_iterator(found.begin()),
                               std::make_move_iterator(found.end()));

        bool more = i + 1 < batches.size();
        if (more && options.interBatchDelayMs > 0 && sleepHandler_) {
            sleepHandler_(options.interBatchDelayMs);
        }
    }

    const auto& stats = prober_.stats();
    LIBNSDP_DEBUG("Probe stats: queried=%u found=%u empty=%u failed=%u",
                  stats.queried, stats.found, stats.empty, stats.failed);

    return ErrorCode::Success;
}

} // namespace libnsdp
