/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dcb/dcb_header.h"
#include "dcb/dcb_text.h"

#include <string>

namespace darkcfg::dcb {
std::uint32_t byte_swap32(std::uint32_t v) {
    return ((v & 0x000000FFu) << 24) | ((v & 0x0000FF00u) << 8) | ((v & 0x00FF0000u) >> 8)
           | ((v & 0xFF000000u) >> 24);
}

ContainerHeader read_header(ByteReader& reader) {
    ContainerHeader hdr{};

    reader.set_endian(Endian::Little);
    hdr.magic = reader.read_u32();
    if (hdr.magic == kSignature) {
        hdr.endian = Endian::Little;
    } else if (byte_swap32(hdr.magic) == kSignature) {
        hdr.endian = Endian::Big;
    } else {
        throw FormatError("Not a packed config container (bad magic " + to_hex_u32(hdr.magic) + ")");
    }

    hdr.version = reader.read_u8();
    if (hdr.version != kSupportedVersion) {
        throw FormatError("Unsupported container version " + std::to_string(hdr.version));
    }

    hdr.compression_method = reader.read_u8();
    if (hdr.compression_method > kMaxCompressionMethod) {
        throw FormatError(
            "Invalid compression method " + std::to_string(hdr.compression_method)
        );
    }

    hdr.encryption_method = reader.read_u8();
    if (hdr.encryption_method > kMaxEncryptionMethod) {
        throw FormatError("Invalid encryption method " + std::to_string(hdr.encryption_method));
    }

    if (hdr.compression_method != 0) {
        throw UnsupportedFeatureError(
            "Compression method " + std::to_string(hdr.compression_method) + " not implemented"
        );
    }
    if (hdr.encryption_method != 0) {
        throw UnsupportedFeatureError(
            "Encryption method " + std::to_string(hdr.encryption_method) + " not implemented"
        );
    }

    reader.set_endian(hdr.endian);
    return hdr;
}
}  // namespace darkcfg::dcb
