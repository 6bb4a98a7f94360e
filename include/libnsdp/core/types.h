#pragma once

#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <vector>
#include <string>
#include <optional>
#include <array>

namespace libnsdp {

/// @brief Raw byte buffer (alias of std::vector<uint8_t>)
using Bytes = std::vector<uint8_t>;

/// @brief 16-bit NSDP parameter code (the "T" of a TLV)
using TlvId = uint16_t;

/// @brief Read-only non-owning view over contiguous bytes
///
/// Lightweight wrapper that refers to an existing byte array without copying.
/// The referenced data must outlive the ByteSpan.
class ByteSpan {
public:
    /// @brief Construct an empty span
    constexpr ByteSpan() noexcept : data_(nullptr), size_(0) {}

    /// @brief Construct from a raw pointer and size
    /// @param data pointer to the first byte
    /// @param size number of bytes
    constexpr ByteSpan(const uint8_t* data, size_t size) noexcept : data_(data), size_(size) {}

    /// @brief Construct from a Bytes vector
    /// @param v vector to refer to
    ByteSpan(const Bytes& v) noexcept : data_(v.data()), size_(v.size()) {}

    constexpr const uint8_t* data() const noexcept { return data_; }
    constexpr size_t size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr const uint8_t* begin() const noexcept { return data_; }
    constexpr const uint8_t* end()   const noexcept { return data_ + size_; }

    /// @brief Index access (no bounds check)
    constexpr const uint8_t& operator[](size_t i) const { return data_[i]; }

private:
    const uint8_t* data_;
    size_t size_;
};

/// @brief Writable non-owning view over contiguous bytes
///
/// Same as ByteSpan but the referenced data may be modified.
class MutableByteSpan {
public:
    constexpr MutableByteSpan() noexcept : data_(nullptr), size_(0) {}
    constexpr MutableByteSpan(uint8_t* data, size_t size) noexcept : data_(data), size_(size) {}
    MutableByteSpan(Bytes& v) noexcept : data_(v.data()), size_(v.size()) {}

    constexpr uint8_t* data() const noexcept { return data_; }
    constexpr size_t size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr uint8_t* begin() const noexcept { return data_; }
    constexpr uint8_t* end()   const noexcept { return data_ + size_; }

    constexpr uint8_t& operator[](size_t i) const { return data_[i]; }

private:
    uint8_t* data_;
    size_t size_;
};

/// @brief 48-bit Ethernet MAC address
///
/// NSDP addresses devices by MAC in the message header. The all-zero
/// address means "any device" in a broadcast request.
struct MacAddress {
    std::array<uint8_t, 6> bytes{};  ///< Octets in transmission order

    MacAddress() = default;

    /// @brief Construct from 6 raw octets
    explicit MacAddress(const uint8_t* p) {
        std::copy(p, p + 6, bytes.begin());
    }

    /// @brief Format as lowercase colon-separated hex ("00:11:22:33:44:55")
    std::string toString() const;

    /// @brief Parse "00:11:22:33:44:55" or "00-11-22-33-44-55" (case-insensitive)
    /// @return parsed address, or nullopt on malformed input
    static std::optional<MacAddress> parse(const std::string& text);

    bool isZero() const {
        for (auto b : bytes) if (b != 0) return false;
        return true;
    }

    bool operator==(const MacAddress& other) const { return bytes == other.bytes; }
    bool operator!=(const MacAddress& other) const { return bytes != other.bytes; }
    bool operator<(const MacAddress& other) const { return bytes < other.bytes; }
};

} // namespace libnsdp
