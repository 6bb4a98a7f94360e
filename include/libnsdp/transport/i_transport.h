#pragma once

#include "../core/types.h"
#include "../core/error.h"
#include <cstdint>
#include <memory>
#include <string>

namespace libnsdp {

/// @brief Abstract datagram transport carrying NSDP messages
class ITransport {
public:
    virtual ~ITransport() = default;

    /// @brief Broadcast one datagram to the NSDP device port
    /// @param payload encoded message
    /// @return send result
    virtual Result send(ByteSpan payload) = 0;

    /// @brief Receive one datagram, waiting at most timeoutMs
    /// @param buffer         destination buffer
    /// @param bytesReceived  number of bytes actually received
    /// @param timeoutMs      maximum wait in milliseconds
    /// @return Success, TransportTimeout when nothing arrived, or a receive error
    virtual Result recv(MutableByteSpan buffer,
                        size_t& bytesReceived,
                        uint32_t timeoutMs) = 0;

    /// @brief Name of the network interface the transport is bound to
    virtual std::string interfaceName() const = 0;

    /// @brief Hardware address of the local interface (sent as host MAC)
    virtual MacAddress hostMac() const = 0;

    /// @brief True when the socket is open and usable
    virtual bool isOpen() const = 0;

    /// @brief Close the transport
    virtual void close() = 0;

    // ── Convenience wrappers ─────────────────────────

    /// @brief recv into an automatically sized buffer
    /// @param outBuffer  receives the datagram
    /// @param timeoutMs  maximum wait in milliseconds
    /// @param maxSize    largest datagram accepted (default: 1500)
    Result recv(Bytes& outBuffer, uint32_t timeoutMs, size_t maxSize = 1500) {
        outBuffer.resize(maxSize);
        size_t received = 0;
        auto result = recv(MutableByteSpan(outBuffer.data(), outBuffer.size()),
                           received, timeoutMs);
        if (result.ok()) {
            outBuffer.resize(received);
        } else {
            outBuffer.clear();
        }
        return result;
    }
};

} // namespace libnsdp
