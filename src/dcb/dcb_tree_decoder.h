/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dcb_byte_reader.h"
#include "dcb_event_sink.h"
#include "dcb_string_table.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace darkcfg::dcb {
enum class ItemType : std::uint8_t {
    Mapping = 1,
    Sequence = 2,
    Scalar = 3,
};

enum class ScalarType : std::uint8_t {
    Value = 0xF0,
    Id = 0xFF,
};

std::string read_scalar(ByteReader& reader, const StringTable& strings);

// Decodes exactly one item starting at the reader position and streams it into `sink`.
// Nesting is walked with an explicit work stack, so depth is limited by input size only.
// Returns the number of bytes consumed.
std::size_t decode_tree(ByteReader& reader, const StringTable& strings, EventSink& sink);
}  // namespace darkcfg::dcb
