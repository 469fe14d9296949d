/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dcb_byte_reader.h"

#include <cstdint>
#include <string>

namespace darkcfg::dcb {
// 7-bit groups, low group first, high bit set on every byte but the last. At most five groups;
// the fifth group's upper bits wrap into the sign of the 32-bit result.
std::int32_t read_packed_int(ByteReader& reader);

// Packed length followed by that many bytes, passed through as-is.
std::string read_string(ByteReader& reader);
}  // namespace darkcfg::dcb
