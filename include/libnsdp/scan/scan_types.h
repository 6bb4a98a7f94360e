#pragma once

#include "../core/types.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace libnsdp {

/// @brief Inclusive range of parameter codes, start <= end
struct ScanRange {
    TlvId start = 0x0000;
    TlvId end   = 0xFFFF;

    /// @brief Number of identifiers in the range (1..65536)
    uint32_t size() const { return static_cast<uint32_t>(end) - start + 1; }

    bool valid() const { return start <= end; }
};

/// @brief Contiguous sub-range probed as one pacing unit
struct Batch {
    uint32_t index = 0;  ///< 1-based position within the scan
    TlvId first = 0;
    TlvId last = 0;

    uint32_t size() const { return static_cast<uint32_t>(last) - first + 1; }
};

/// @brief Parameter code that answered with a non-empty value
struct Finding {
    TlvId id = 0;
    Bytes data;

    size_t length() const { return data.size(); }
};

/// @brief Identity of the scanned device
///
/// Name and model are best-effort: absent when the device did not answer.
struct DeviceIdentity {
    std::string mac;
    std::optional<std::string> name;
    std::optional<std::string> model;
};

/// @brief Aggregate record of one device scan
struct ScanResult {
    DeviceIdentity device;
    ScanRange range;
    std::vector<Finding> findings;             ///< Ascending by id once finalized
    uint32_t totalTested = 0;                  ///< range.size()
    uint32_t totalValid = 0;                   ///< findings.size()
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point scanTime;
};

/// @brief Tunables for one scan
struct ScanOptions {
    uint32_t batchSize = 100;           ///< identifiers per batch, >= 1
    uint32_t interBatchDelayMs = 100;   ///< pause between batches
    uint32_t queryTimeoutMs = 10000;    ///< per-transaction timeout
};

/// @brief Progress event emitted after each batch
struct BatchProgress {
    Batch batch;
    uint32_t totalBatches = 0;
    size_t found = 0;                   ///< findings in this batch
    const std::vector<Finding>* findings = nullptr;  ///< this batch's findings
};

using BatchCallback = std::function<void(const BatchProgress&)>;

} // namespace libnsdp
