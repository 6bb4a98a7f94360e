#include "libnsdp/transport/udp_transport.h"
#include "libnsdp/packet/message.h"
#include "libnsdp/core/log.h"
#include <climits>

#if defined(__linux__) && !defined(__ANDROID__)
#include <sys/socket.h>
#include <sys/ioctl.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <net/if.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#endif

namespace libnsdp {

UdpTransport::UdpTransport(const std::string& interfaceName)
    : interfaceName_(interfaceName) {}

UdpTransport::~UdpTransport() {
    close();
}

void UdpTransport::close() {
#if defined(__linux__) && !defined(__ANDROID__)
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
#endif
}

Result UdpTransport::open() {
#if defined(__linux__) && !defined(__ANDROID__)
    if (::if_nametoindex(interfaceName_.c_str()) == 0) {
        LIBNSDP_ERROR("Interface %s not found", interfaceName_.c_str());
        return ErrorCode::InterfaceNotFound;
    }

    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        LIBNSDP_ERROR("socket() failed: %s", strerror(errno));
        return ErrorCode::TransportOpenFailed;
    }

    int on = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0 ||
        ::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
        LIBNSDP_ERROR("setsockopt() failed: %s", strerror(errno));
        close();
        return ErrorCode::TransportOpenFailed;
    }

    if (::setsockopt(fd_, SOL_SOCKET, SO_BINDTODEVICE,
                     interfaceName_.c_str(),
                     static_cast<socklen_t>(interfaceName_.size())) < 0) {
        LIBNSDP_WARN("SO_BINDTODEVICE(%s) failed: %s; broadcasts follow the routing table",
                     interfaceName_.c_str(), strerror(errno));
    }

    sockaddr_in local = {};
    local.sin_family = AF_INET;
    local.sin_port = htons(Message::HOST_PORT);
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
        LIBNSDP_ERROR("bind(:%u) failed: %s", Message::HOST_PORT, strerror(errno));
        close();
        return ErrorCode::TransportOpenFailed;
    }

    auto r = readHostMac();
    if (r.failed()) {
        close();
        return r;
    }

    LIBNSDP_INFO("UDP transport open on %s (host MAC %s)",
                 interfaceName_.c_str(), hostMac_.toString().c_str());
    return ErrorCode::Success;
#else
    return ErrorCode::TransportNotAvailable;
#endif
}

Result UdpTransport::readHostMac() {
#if defined(__linux__) && !defined(__ANDROID__)
    ifreq ifr = {};
    std::strncpy(ifr.ifr_name, interfaceName_.c_str(), IFNAMSIZ - 1);
    if (::ioctl(fd_, SIOCGIFHWADDR, &ifr) < 0) {
        LIBNSDP_ERROR("SIOCGIFHWADDR(%s) failed: %s", interfaceName_.c_str(), strerror(errno));
        return ErrorCode::TransportOpenFailed;
    }
    hostMac_ = MacAddress(reinterpret_cast<const uint8_t*>(ifr.ifr_hwaddr.sa_data));
    return ErrorCode::Success;
#else
    return ErrorCode::TransportNotAvailable;
#endif
}

// ── Send ────────────────────────────────────────────

Result UdpTransport::send(ByteSpan payload) {
#if defined(__linux__) && !defined(__ANDROID__)
    if (fd_ < 0) return ErrorCode::TransportNotAvailable;

    sockaddr_in dest = {};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(Message::DEVICE_PORT);
    dest.sin_addr.s_addr = htonl(INADDR_BROADCAST);

    ssize_t n = ::sendto(fd_, payload.data(), payload.size(), 0,
                         reinterpret_cast<sockaddr*>(&dest), sizeof(dest));
    if (n < 0 || static_cast<size_t>(n) != payload.size()) {
        LIBNSDP_ERROR("sendto() failed: %s", strerror(errno));
        return ErrorCode::TransportSendFailed;
    }
    return ErrorCode::Success;
#else
    (void)payload;
    return ErrorCode::TransportNotAvailable;
#endif
}

// ── Receive ─────────────────────────────────────────

int UdpTransport::pollTimeout(uint32_t timeoutMs) {
    // poll() treats any negative timeout as infinite
    if (timeoutMs > static_cast<uint32_t>(INT_MAX)) return INT_MAX;
    return static_cast<int>(timeoutMs);
}

Result UdpTransport::recv(MutableByteSpan buffer, size_t& bytesReceived,
                          uint32_t timeoutMs) {
    bytesReceived = 0;
#if defined(__linux__) && !defined(__ANDROID__)
    if (fd_ < 0) return ErrorCode::TransportNotAvailable;

    pollfd pfd = {};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int ret = ::poll(&pfd, 1, pollTimeout(timeoutMs));
    if (ret < 0) {
        if (errno == EINTR) return ErrorCode::TransportTimeout;
        LIBNSDP_ERROR("poll() failed: %s", strerror(errno));
        return ErrorCode::TransportRecvFailed;
    }
    if (ret == 0) return ErrorCode::TransportTimeout;

    ssize_t n = ::recvfrom(fd_, buffer.data(), buffer.size(), 0, nullptr, nullptr);
    if (n < 0) {
        LIBNSDP_ERROR("recvfrom() failed: %s", strerror(errno));
        return ErrorCode::TransportRecvFailed;
    }

    bytesReceived = static_cast<size_t>(n);
    return ErrorCode::Success;
#else
    (void)buffer; (void)timeoutMs;
    return ErrorCode::TransportNotAvailable;
#endif
}

} // namespace libnsdp
