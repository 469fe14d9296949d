/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dcb/dcb_string_table.h"
#include "dcb/dcb_packed.h"

namespace darkcfg::dcb {
void StringTable::insert(std::int32_t id, std::string value) {
    if (contains(id)) {
        throw FormatError("Duplicate string table id " + std::to_string(id));
    }
    _index.emplace(id, _entries.size());
    _entries.emplace_back(id, std::move(value));
}

const std::string& StringTable::lookup(std::int32_t id) const {
    const std::string* value = find(id);
    if (value == nullptr) {
        throw DecodeError("Unknown string table id " + std::to_string(id));
    }
    return *value;
}

StringTable read_string_table(ByteReader& reader) {
    const std::size_t start = reader.position();
    const std::int32_t count = reader.read_s32();
    if (count < 0) {
        throw FormatError(
            "Negative string count " + std::to_string(count) + " at offset "
            + std::to_string(start)
        );
    }

    StringTable table;
    for (std::int32_t i = 0; i < count; i++) {
        const std::int32_t id = read_packed_int(reader);
        table.insert(id, read_string(reader));
    }
    return table;
}
}  // namespace darkcfg::dcb
