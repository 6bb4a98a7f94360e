#pragma once

#include "types.h"
#include "error.h"
#include <string>

namespace libnsdp {

/// Hex helpers shared by the report writer and the CLI tools
class Hex {
public:
    /// Lowercase hex without separators ("c0a80164")
    static std::string encode(ByteSpan data);

    /// Parse a byte string, ignoring spaces, ':' and newlines
    static Result decode(const std::string& text, Bytes& out);

    /// Parse a 16-bit identifier such as "0C00", "0x0c00" or "ffff"
    static Result parseId(const std::string& text, TlvId& out);

    /// "0x0C00"
    static std::string formatId(TlvId id);
};

} // namespace libnsdp
