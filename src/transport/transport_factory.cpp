#include "libnsdp/transport/transport_factory.h"
#include "libnsdp/transport/udp_transport.h"
#include "libnsdp/core/log.h"

#include <string>
#include <fstream>
#include <cctype>

#if defined(__linux__) && !defined(__ANDROID__)
#include <dirent.h>
#endif

namespace libnsdp {

namespace {
    std::string readSysfsLine(const std::string& path) {
        std::string line;
        std::ifstream file(path);
        if (file.is_open()) {
            std::getline(file, line);
            while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
                line.pop_back();
            }
        }
        return line;
    }
} // anonymous

std::shared_ptr<ITransport> TransportFactory::create(const std::string& interfaceName) {
    auto transport = std::make_shared<UdpTransport>(interfaceName);
    auto r = transport->open();
    if (r.failed()) {
        LIBNSDP_ERROR("Could not open NSDP transport on %s: %s",
                      interfaceName.c_str(), r.message().c_str());
        return nullptr;
    }
    return transport;
}

std::vector<TransportFactory::InterfaceInfo> TransportFactory::enumerateInterfaces() {
    std::vector<InterfaceInfo> interfaces;

#if defined(__linux__) && !defined(__ANDROID__)
    const std::string sysNet = "/sys/class/net";
    DIR* dir = ::opendir(sysNet.c_str());
    if (!dir) return interfaces;

    struct dirent* entry;
    while ((entry = ::readdir(dir)) != nullptr) {
        std::string name = entry->d_name;

        if (name == "." || name == ".." || name == "lo") continue;

        InterfaceInfo info;
        info.name = name;
        info.mac = readSysfsLine(sysNet + "/" + name + "/address");
        info.up = readSysfsLine(sysNet + "/" + name + "/operstate") == "up";
        interfaces.push_back(std::move(info));
    }
    ::closedir(dir);
#endif

    return interfaces;
}

} // namespace libnsdp
