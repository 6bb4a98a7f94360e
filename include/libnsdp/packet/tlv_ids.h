#pragma once

#include "../core/types.h"

namespace libnsdp {

/// Well-known NSDP parameter codes used by the library itself.
/// The full list of labelled codes lives in ParamCatalog.
namespace tlv {
    constexpr TlvId Model          = 0x0001;
    constexpr TlvId Name           = 0x0003;
    constexpr TlvId Mac            = 0x0004;
    constexpr TlvId Location       = 0x0005;
    constexpr TlvId IpAddress      = 0x0006;
    constexpr TlvId Netmask        = 0x0007;
    constexpr TlvId Gateway        = 0x0008;
    constexpr TlvId DhcpMode       = 0x000B;
    constexpr TlvId FirmwareSlot1  = 0x000D;
    constexpr TlvId FirmwareSlot2  = 0x000E;
    constexpr TlvId NextFirmware   = 0x000F;
} // namespace tlv

} // namespace libnsdp
