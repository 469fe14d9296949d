/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dcb/dcb_text.h"

namespace darkcfg::dcb {
std::string to_hex_u32(std::uint32_t v) {
    static const char hexdig[] = "0123456789ABCDEF";
    std::string out = "0x";
    for (int i = 0; i < 8; i++) {
        const int shift = 28 - (i * 4);
        out.push_back(hexdig[(v >> shift) & 0xFu]);
    }
    return out;
}

std::string latin1_to_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (const char c : bytes) {
        const auto b = static_cast<std::uint8_t>(c);
        if (b < 0x80u) {
            out.push_back(c);
        } else {
            out.push_back(static_cast<char>(0xC0u | (b >> 6)));
            out.push_back(static_cast<char>(0x80u | (b & 0x3Fu)));
        }
    }
    return out;
}
}  // namespace darkcfg::dcb
