#pragma once

#include "scan_types.h"
#include "../nsdp_device.h"
#include <vector>

namespace libnsdp {

/// @brief Outcome counters accumulated across batches
struct ProbeStats {
    uint32_t queried = 0;
    uint32_t found = 0;    ///< non-empty values
    uint32_t empty = 0;    ///< successful but zero-length
    uint32_t failed = 0;   ///< timeout, rejection, absent or malformed
};

/// @brief Issues one read per identifier and keeps the non-empty answers
///
/// A failed transaction or an empty value is a negative result for that
/// identifier; it is never retried and never reported as an error.
class TlvProber {
public:
    /// @brief Probe every identifier of a batch in ascending order
    /// @param device     device to query
    /// @param batch      identifiers to probe
    /// @param timeoutMs  per-identifier transaction timeout
    /// @return findings, ascending by id
    std::vector<Finding> probeBatch(NsdpDevice& device, const Batch& batch, uint32_t timeoutMs);

    const ProbeStats& stats() const { return stats_; }
    void resetStats() { stats_ = ProbeStats(); }

    /// Identifiers divisible by this are logged as liveness at Debug level
    static constexpr uint32_t LIVENESS_INTERVAL = 1000;

private:
    ProbeStats stats_;
};

} // namespace libnsdp
