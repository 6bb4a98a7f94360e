#pragma once

#include "i_transport.h"
#include <string>

namespace libnsdp {

/// UDP broadcast transport bound to one network interface.
///
/// Listens on the NSDP host port and broadcasts requests to
/// 255.255.255.255 on the device port. Binding to the interface
/// (SO_BINDTODEVICE) needs CAP_NET_RAW; without it the socket still works
/// but may send on the default route's interface.
class UdpTransport : public ITransport {
public:
    explicit UdpTransport(const std::string& interfaceName);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    /// Create the socket; called by TransportFactory
    Result open();

    Result send(ByteSpan payload) override;
    Result recv(MutableByteSpan buffer, size_t& bytesReceived,
                uint32_t timeoutMs) override;
    using ITransport::recv;

    std::string interfaceName() const override { return interfaceName_; }
    MacAddress hostMac() const override { return hostMac_; }
    bool isOpen() const override { return fd_ >= 0; }
    void close() override;

    /// poll() timeout for a wait of timeoutMs, clamped to INT_MAX
    static int pollTimeout(uint32_t timeoutMs);

private:
    Result readHostMac();

    std::string interfaceName_;
    MacAddress hostMac_;
    int fd_ = -1;
};

} // namespace libnsdp
