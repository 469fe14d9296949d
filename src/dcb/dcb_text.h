/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace darkcfg::dcb {
// "0x" followed by eight upper-case hex digits.
std::string to_hex_u32(std::uint32_t v);

// Container text is a raw byte string. Each byte maps to the code point of the same value, so
// ASCII is unchanged and bytes 0x80-0xFF become two-byte UTF-8 sequences. The mapping is
// reversible, which keeps every input byte recoverable from the JSON output.
std::string latin1_to_utf8(std::string_view bytes);
}  // namespace darkcfg::dcb
