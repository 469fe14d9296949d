/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dcb_byte_reader.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace darkcfg::dcb {

class StringTable {
   public:
    // Throws FormatError if the id is already present.
    void insert(std::int32_t id, std::string value);

    // Throws DecodeError for ids the container never declared.
    const std::string& lookup(std::int32_t id) const;

    // Null for unknown ids.
    const std::string* find(std::int32_t id) const {
        const auto it = _index.find(id);
        return it == _index.end() ? nullptr : &_entries[it->second].second;
    }

    bool contains(std::int32_t id) const { return _index.find(id) != _index.end(); }
    std::size_t size() const { return _entries.size(); }
    bool empty() const { return _entries.empty(); }

    // File order.
    const std::vector<std::pair<std::int32_t, std::string>>& entries() const { return _entries; }

   private:
    std::vector<std::pair<std::int32_t, std::string>> _entries;
    std::unordered_map<std::int32_t, std::size_t> _index;
};

// Reads the i32 count (reader byte order) and that many (packed id, string) pairs.
StringTable read_string_table(ByteReader& reader);

}  // namespace darkcfg::dcb
