/// @file nsdp_discover.cpp
/// CLI tool: Discover and list NSDP switches on a network segment

#include <libnsdp/nsdp_library.h>
#include <libnsdp/transport/transport_factory.h>
#include <iostream>
#include <cstdlib>
#include <cstring>

int main(int argc, char* argv[]) {
    libnsdp::initialize();

    std::string iface;
    uint32_t timeoutMs = 5000;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-i") == 0 && i + 1 < argc) {
            iface = argv[++i];
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            timeoutMs = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "-v") == 0) {
            libnsdp::Logger::instance().setLevel(libnsdp::LogLevel::Debug);
        } else {
            std::cerr << "Usage: " << argv[0] << " [-i <interface>] [-t <ms>] [-v]\n";
            return 1;
        }
    }

    if (iface.empty()) {
        // List candidate interfaces
        auto interfaces = libnsdp::TransportFactory::enumerateInterfaces();
        if (interfaces.empty()) {
            std::cout << "No network interfaces found.\n";
            return 0;
        }

        std::cout << "Network interfaces (run with -i <name> to discover switches):\n\n";
        for (const auto& itf : interfaces) {
            std::cout << "  " << itf.name;
            if (!itf.mac.empty()) std::cout << "  " << itf.mac;
            std::cout << "  [" << (itf.up ? "up" : "down") << "]\n";
        }
        return 0;
    }

    auto transport = libnsdp::TransportFactory::create(iface);
    if (!transport) {
        std::cerr << "Failed to open interface " << iface << "\n";
        return 1;
    }

    libnsdp::Session session(transport);
    std::vector<libnsdp::DeviceInfo> devices;
    auto r = session.discover(timeoutMs, devices);
    if (r.failed()) {
        std::cerr << "Discovery failed: " << r.message() << "\n";
        return 1;
    }

    if (devices.empty()) {
        std::cout << "No NSDP devices found on " << iface << ".\n\n"
                  << "Troubleshooting tips:\n"
                  << "- Ensure switches are on the same network segment\n"
                  << "- Verify switches support NSDP\n"
                  << "- Try increasing the timeout with -t\n";
        return 0;
    }

    std::cout << "Found " << devices.size() << " NSDP device(s):\n\n";
    int n = 1;
    for (const auto& dev : devices) {
        std::cout << "=== Device " << n++ << " ===\n"
                  << "MAC:      " << dev.mac.toString() << "\n";
        if (dev.name)      std::cout << "Name:     " << *dev.name << "\n";
        if (dev.model)     std::cout << "Model:    " << *dev.model << "\n";
        if (dev.ipAddress) std::cout << "IP:       " << *dev.ipAddress << "\n";
        if (dev.firmware)  std::cout << "Firmware: " << *dev.firmware << "\n";
        std::cout << "\n";
    }

    libnsdp::shutdown();
    return 0;
}
