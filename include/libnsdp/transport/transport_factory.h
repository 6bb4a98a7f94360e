#pragma once

#include "i_transport.h"
#include <memory>
#include <string>
#include <vector>

namespace libnsdp {

/// Factory that opens the NSDP transport for a network interface
class TransportFactory {
public:
    /// Open a UDP broadcast transport on the interface
    /// @param interfaceName  e.g. "eth0", "enp3s0"
    /// @return open transport, or nullptr (the reason is logged)
    static std::shared_ptr<ITransport> create(const std::string& interfaceName);

    /// Network interface as listed by the kernel
    struct InterfaceInfo {
        std::string name;
        std::string mac;
        bool up = false;
    };

    /// Enumerate non-loopback network interfaces
    static std::vector<InterfaceInfo> enumerateInterfaces();
};

} // namespace libnsdp
