#include "libnsdp/catalog/param_catalog.h"
#include "libnsdp/catalog/param_decoders.h"
#include "libnsdp/packet/tlv_ids.h"
#include <algorithm>

namespace libnsdp {

ParamCatalog::ParamCatalog(std::vector<ParamInfo> entries) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const ParamInfo& a, const ParamInfo& b) { return a.id < b.id; });

    for (auto& e : entries) {
        if (index_.count(e.id)) continue;
        index_.emplace(e.id, entries_.size());
        entries_.push_back(std::move(e));
    }
}

const ParamCatalog& ParamCatalog::builtin() {
    static const ParamCatalog catalog({
        // Device identification
        {tlv::Model,         "Device Model"},
        {tlv::Name,          "Device Name"},
        {tlv::Mac,           "Device MAC Address"},
        {tlv::Location,      "System Location"},
        {tlv::IpAddress,     "IP Address"},
        {tlv::Netmask,       "Subnet Mask"},
        {tlv::Gateway,       "Gateway IP Address"},
        {tlv::DhcpMode,      "DHCP Mode"},
        {tlv::FirmwareSlot1, "Firmware Version (Slot 1)"},
        {tlv::FirmwareSlot2, "Firmware Version (Slot 2)"},
        {tlv::NextFirmware,  "Next Active Firmware Slot"},

        // Port status
        {0x0C00, "Port Status (Link/Speed)",       ParamDecoders::decodePortStatus},
        {0x1000, "Port Statistics"},
        {0x1C00, "Cable Tester Results"},
        {0x5C00, "Port Mirroring Configuration"},
        {0x6000, "Available Ports Count"},

        // VLAN
        {0x2000, "VLAN Engine Mode",               ParamDecoders::decodeVlanEngine},
        {0x2400, "VLAN Port Membership"},
        {0x2800, "802.1Q VLAN Membership"},
        {0x3000, "802.1Q PVID"},
        {0x6400, "Unknown VLAN Parameter (0x6400)"},

        // QoS
        {0x3400, "QoS Engine Mode",                ParamDecoders::decodeQosEngine},
        {0x3800, "QoS Port Priority",              ParamDecoders::decodeQosPriority},
        {0x4C00, "Ingress Rate Limit",             ParamDecoders::decodeRateLimit},
        {0x5000, "Egress Rate Limit",              ParamDecoders::decodeRateLimit},
        {0x5400, "Broadcast Filtering",            ParamDecoders::decodeFlag},
        {0x5800, "Storm Control Bandwidth"},

        // IGMP snooping
        {0x6800, "IGMP Snooping Status",           ParamDecoders::decodeIgmpSnooping},
        {0x6C00, "Block Unknown Multicast",        ParamDecoders::decodeFlag},
        {0x7000, "Validate IGMPv3 IP Header",      ParamDecoders::decodeFlag},
        {0x8000, "IGMP Snooping Static Router Ports"},

        // Misc
        {0x8C00, "Unknown Parameter (0x8C00)"},
        {0x9000, "Loop Detection",                 ParamDecoders::decodeFlag},
    });
    return catalog;
}

std::optional<std::string> ParamCatalog::label(TlvId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return entries_[it->second].name;
}

std::optional<std::string> ParamCatalog::decode(TlvId id, ByteSpan data) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    const auto& decoder = entries_[it->second].decoder;
    if (!decoder) return std::nullopt;
    return decoder(data);
}

std::optional<std::string> ParamCatalog::describe(TlvId id, ByteSpan data) const {
    auto name = label(id);
    if (!name) return std::nullopt;
    if (auto value = decode(id, data)) return *name + " = " + *value;
    return name;
}

} // namespace libnsdp
