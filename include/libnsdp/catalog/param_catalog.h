#pragma once

#include "../core/types.h"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace libnsdp {

/// @brief Turns a payload into a readable value (nullopt: layout not matched)
using ParamDecoder = std::function<std::optional<std::string>(ByteSpan)>;

/// @brief Parameter code with a human-readable label and optional decoder
struct ParamInfo {
    TlvId id;
    std::string name;
    ParamDecoder decoder;
};

/// @brief Immutable table of known NSDP parameter labels and decoders
///
/// Used only to decorate reports. Scanning never consults it, and an empty
/// catalog is valid: unknown codes are still reported, just unlabelled.
class ParamCatalog {
public:
    /// @brief Build a catalog from a list of entries (later duplicates ignored)
    explicit ParamCatalog(std::vector<ParamInfo> entries = {});

    /// @brief Built-in table, constructed on first use
    static const ParamCatalog& builtin();

    /// @brief Label for a code
    /// @return label, or nullopt for unknown codes
    std::optional<std::string> label(TlvId id) const;

    /// @brief Decoded value for a code with a known layout
    /// @return nullopt for unknown codes, codes without a decoder, or a
    ///         payload the decoder does not accept
    std::optional<std::string> decode(TlvId id, ByteSpan data) const;

    /// @brief "label" or "label = decoded value"; nullopt for unknown codes
    std::optional<std::string> describe(TlvId id, ByteSpan data) const;

    bool contains(TlvId id) const { return index_.count(id) != 0; }

    /// @brief All entries, ascending by code
    const std::vector<ParamInfo>& entries() const { return entries_; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<ParamInfo> entries_;
    std::unordered_map<TlvId, size_t> index_;
};

} // namespace libnsdp
