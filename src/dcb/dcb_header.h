/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dcb_byte_reader.h"

#include <cstdint>

namespace darkcfg::dcb {
constexpr std::uint32_t kSignature = 0x334D4DE3u;
constexpr std::uint8_t kSupportedVersion = 1;
constexpr std::uint8_t kMaxCompressionMethod = 3;
constexpr std::uint8_t kMaxEncryptionMethod = 1;

struct ContainerHeader {
    std::uint32_t magic = 0;
    Endian endian = Endian::Little;
    std::uint8_t version = 0;
    std::uint8_t compression_method = 0;
    std::uint8_t encryption_method = 0;
};

std::uint32_t byte_swap32(std::uint32_t v);

// Validates the 7-byte preamble and switches `reader` to the container's byte order.
// Throws FormatError for anything that is not this format and UnsupportedFeatureError for
// compressed or encrypted containers.
ContainerHeader read_header(ByteReader& reader);
}  // namespace darkcfg::dcb
