/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dcb/dcb_packed.h"

namespace darkcfg::dcb {
namespace {
constexpr int max_shift = 28;
}  // namespace

std::int32_t read_packed_int(ByteReader& reader) {
    const std::size_t start = reader.position();
    std::uint32_t value = 0;
    int shift = 0;
    std::uint8_t b = 0;
    do {
        if (shift > max_shift) {
            throw FormatError(
                "Packed integer at offset " + std::to_string(start) + " exceeds 5 groups"
            );
        }
        b = reader.read_u8();
        value |= static_cast<std::uint32_t>(b & 0x7Fu) << shift;
        shift += 7;
    } while ((b & 0x80u) != 0);
    return static_cast<std::int32_t>(value);
}

std::string read_string(ByteReader& reader) {
    const std::size_t start = reader.position();
    const std::int32_t length = read_packed_int(reader);
    if (length < 0) {
        throw FormatError(
            "Negative string length " + std::to_string(length) + " at offset "
            + std::to_string(start)
        );
    }
    const auto bytes = reader.read_bytes(static_cast<std::size_t>(length));
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}
}  // namespace darkcfg::dcb
