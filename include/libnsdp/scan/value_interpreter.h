#pragma once

#include "../core/types.h"
#include <string>
#include <vector>

namespace libnsdp {

/// Schema-less guesses at what a TLV payload holds.
///
/// Candidates are advisory: a 4-byte value yields both an integer and an
/// IPv4 reading and the operator decides. The same bytes always yield the
/// same candidates.
class ValueInterpreter {
public:
    /// All plausible readings, in order: string, integer, address
    static std::vector<std::string> interpret(ByteSpan data);

    /// Readings joined with " | ", or an empty string when there are none
    static std::string describe(ByteSpan data);

    /// True when data is non-empty and every byte is in [32, 126]
    static bool isPrintableAscii(ByteSpan data);
};

} // namespace libnsdp
