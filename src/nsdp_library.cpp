#include "libnsdp/nsdp_library.h"
#include "libnsdp/core/log.h"

namespace libnsdp {

void initialize() {
    // Build the label table before any timing-sensitive work
    (void)ParamCatalog::builtin();
    LIBNSDP_DEBUG("NSDP Library %s initialized", LIBNSDP_VERSION_STRING);
}

void shutdown() {
    LIBNSDP_DEBUG("NSDP Library shutdown");
}

const char* versionString() {
    return LIBNSDP_VERSION_STRING;
}

} // namespace libnsdp
