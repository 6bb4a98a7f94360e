#include "libnsdp/scan/tlv_prober.h"
#include "libnsdp/core/hex.h"
#include "libnsdp/core/log.h"

namespace libnsdp {

std::vector<Finding> TlvProber::probeBatch(NsdpDevice& device, const Batch& batch,
                                           uint32_t timeoutMs) {
    std::vector<Finding> findings;

    // 32-bit loop variable: last may be 0xFFFF
    for (uint32_t id = batch.first; id <= batch.last; ++id) {
        auto tlv = static_cast<TlvId>(id);
        ++stats_.queried;

        if (id % LIVENESS_INTERVAL == 0) {
            LIBNSDP_DEBUG("Testing 0x%04X...", tlv);
        }

        Bytes value;
        auto r = device.readTlv(tlv, value, timeoutMs);
        if (r.failed()) {
            ++stats_.failed;
            LIBNSDP_TRACE("0x%04X: %s", tlv, r.message().c_str());
            continue;
        }

        if (value.empty()) {
            ++stats_.empty;
            LIBNSDP_TRACE("0x%04X: empty value", tlv);
            continue;
        }

        ++stats_.found;
        LIBNSDP_DEBUG("0x%04X: %zu bytes: %s", tlv, value.size(),
                      Hex::encode(ByteSpan(value)).c_str());

        Finding f;
        f.id = tlv;
        f.data = std::move(value);
        findings.push_back(std::move(f));
    }

    return findings;
}

} // namespace libnsdp
