#pragma once

#include "../core/types.h"
#include "../core/error.h"
#include "../transport/i_transport.h"
#include "../packet/message.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace libnsdp {

/// @brief Device as seen in a discovery reply
struct DeviceInfo {
    MacAddress mac;                         ///< Device MAC from the reply header
    std::optional<std::string> model;       ///< 0x0001
    std::optional<std::string> name;        ///< 0x0003
    std::optional<std::string> ipAddress;   ///< 0x0006, dotted quad
    std::optional<std::string> firmware;    ///< 0x000D
};

/// @brief Request/response exchanges with NSDP devices over one transport
///
/// One request is outstanding at a time. Replies that do not match the
/// outstanding request (other sequence number, other device, not a read
/// response) are discarded while waiting.
class Session {
public:
    /// @brief Create a session on an open transport
    /// @param transport transport shared with the caller
    explicit Session(std::shared_ptr<ITransport> transport);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// @brief Broadcast an identity request and collect every reply
    /// @param timeoutMs  collection window
    /// @param devices    receives one entry per distinct device MAC
    /// @return Success (possibly with no devices) or a transport error
    Result discover(uint32_t timeoutMs, std::vector<DeviceInfo>& devices);

    /// @brief Read one parameter from one device
    ///
    /// Sends a read request carrying `tlv` with an empty value and waits for
    /// the matching reply.
    /// @param device     target device MAC
    /// @param tlv        parameter code
    /// @param value      receives the payload (may be empty)
    /// @param timeoutMs  maximum wait for the reply
    /// @return Success, TransportTimeout, DeviceRejected, TlvNotPresent,
    ///         MalformedResponse or a transport error
    Result query(const MacAddress& device, TlvId tlv, Bytes& value, uint32_t timeoutMs);

    /// @brief Send a request and wait for its reply
    /// @param request    message to send (sequence number must be set)
    /// @param response   receives the matching reply
    /// @param timeoutMs  maximum wait
    Result transact(const Message& request, Message& response, uint32_t timeoutMs);

    /// @brief Sequence number for the next request
    uint16_t nextSequence() { return ++sequence_; }

    const std::shared_ptr<ITransport>& transport() const { return transport_; }

private:
    Result sendRequest(const Message& request);
    bool matches(const MessageHeader& request, const MessageHeader& reply) const;

    std::shared_ptr<ITransport> transport_;
    uint16_t sequence_ = 0;
};

} // namespace libnsdp
