#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace libnsdp {

/// Error codes for the NSDP library
enum class ErrorCode : int {
    Success = 0,

    // Transport errors (100-199)
    TransportNotAvailable = 100,
    TransportOpenFailed   = 101,
    TransportSendFailed   = 102,
    TransportRecvFailed   = 103,
    TransportTimeout      = 104,
    InterfaceNotFound     = 105,

    // Protocol errors (200-299)
    InvalidMessage        = 200,
    BufferTooSmall        = 201,
    MalformedResponse     = 202,
    DeviceRejected        = 204,
    TlvNotPresent         = 205,

    // Scan errors (300-399)
    InvalidRange          = 300,
    InvalidBatchSize      = 301,
    NoDevicesFound        = 302,

    // Report errors (400-499)
    ReportOpenFailed      = 400,
    ReportWriteFailed     = 401,

    // Configuration errors (500-599)
    InvalidHexValue       = 500,
    InvalidMacAddress     = 501,
};

/// Error category for NSDP
class NsdpErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "libnsdp"; }

    std::string message(int ev) const override {
        switch (static_cast<ErrorCode>(ev)) {
            case ErrorCode::Success:               return "Success";
            case ErrorCode::TransportNotAvailable: return "Transport not available";
            case ErrorCode::TransportOpenFailed:   return "Failed to open transport";
            case ErrorCode::TransportSendFailed:   return "Send failed";
            case ErrorCode::TransportRecvFailed:   return "Receive failed";
            case ErrorCode::TransportTimeout:      return "Transport timeout";
            case ErrorCode::InterfaceNotFound:     return "Network interface not found";
            case ErrorCode::InvalidMessage:        return "Invalid NSDP message";
            case ErrorCode::BufferTooSmall:        return "Buffer too small";
            case ErrorCode::MalformedResponse:     return "Malformed response";
            case ErrorCode::DeviceRejected:        return "Device rejected request";
            case ErrorCode::TlvNotPresent:         return "TLV not in response";
            case ErrorCode::InvalidRange:          return "Invalid scan range";
            case ErrorCode::InvalidBatchSize:      return "Invalid batch size";
            case ErrorCode::NoDevicesFound:        return "No NSDP devices found";
            case ErrorCode::ReportOpenFailed:      return "Failed to create report file";
            case ErrorCode::ReportWriteFailed:     return "Failed to write report file";
            case ErrorCode::InvalidHexValue:       return "Invalid hex value";
            case ErrorCode::InvalidMacAddress:     return "Invalid MAC address";
            default:                               return "Unknown error";
        }
    }

    static const NsdpErrorCategory& instance() {
        static NsdpErrorCategory cat;
        return cat;
    }
};

inline std::error_code make_error_code(ErrorCode e) {
    return {static_cast<int>(e), NsdpErrorCategory::instance()};
}

/// Result type wrapping an error code
class Result {
public:
    Result() : code_(ErrorCode::Success) {}
    Result(ErrorCode code) : code_(code) {}

    bool ok() const { return code_ == ErrorCode::Success; }
    bool failed() const { return code_ != ErrorCode::Success; }
    explicit operator bool() const { return ok(); }

    ErrorCode code() const { return code_; }
    std::string message() const { return NsdpErrorCategory::instance().message(static_cast<int>(code_)); }

    static Result success() { return Result(ErrorCode::Success); }

private:
    ErrorCode code_;
};

} // namespace libnsdp

// Register as std::error_code compatible
template<>
struct std::is_error_code_enum<libnsdp::ErrorCode> : std::true_type {};
