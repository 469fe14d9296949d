/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dcb/dcb_container.h"
#include "dcb/dcb_packed.h"
#include "dcb/dcb_tree_decoder.h"

#include <stdexcept>

namespace fs = std::filesystem;

namespace darkcfg::dcb {
fs::path normalize_entry_path(std::string_view raw) {
    std::string s(raw);
    for (auto& c : s) {
        if (c == '/' || c == '\\') {
            c = static_cast<char>(fs::path::preferred_separator);
        }
    }

    const fs::path rel = fs::path(s).relative_path().lexically_normal();
    if (rel.empty() || !rel.has_filename() || rel == ".") {
        throw FormatError("Entry path '" + std::string(raw) + "' has no file name");
    }
    const auto it = rel.begin();
    if (it != rel.end() && *it == "..") {
        throw FormatError("Entry path '" + std::string(raw) + "' escapes the output directory");
    }
    return rel;
}

ContainerReader::ContainerReader(std::span<const std::uint8_t> bytes) : _reader(bytes) {
    _header = read_header(_reader);
    _strings = read_string_table(_reader);
    _file_count = _reader.read_u16();
}

FileEntry ContainerReader::next_entry(EventSink& sink) {
    if (!has_next()) {
        throw std::logic_error("No entries left in container");
    }

    FileEntry entry{};
    entry.raw_path = read_string(_reader);
    entry.checksum = _reader.read_u32();
    entry.declared_size = _reader.read_s32();
    entry.modified_raw = _reader.read_s64();
    entry.modified = timestamp_from_binary(entry.modified_raw);
    entry.path = normalize_entry_path(entry.raw_path);

    entry.payload_offset = _reader.position();
    entry.payload_size = decode_tree(_reader, _strings, sink);
    _entries_read++;
    return entry;
}
}  // namespace darkcfg::dcb
