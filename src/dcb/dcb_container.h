/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dcb_byte_reader.h"
#include "dcb_event_sink.h"
#include "dcb_header.h"
#include "dcb_string_table.h"
#include "dcb_timestamp.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace darkcfg::dcb {

struct FileEntry {
    std::string raw_path;
    std::filesystem::path path;
    std::uint32_t checksum = 0;
    std::int32_t declared_size = 0;
    std::int64_t modified_raw = 0;
    Timestamp modified{};
    std::size_t payload_offset = 0;
    std::size_t payload_size = 0;
};

// Host separators, no root, no "..". Throws FormatError if nothing usable is left or the path
// would leave the output directory.
std::filesystem::path normalize_entry_path(std::string_view raw);

// Walks a container held in memory. Construction parses the header, the string table and the
// entry count; each next_entry() call consumes exactly one entry.
class ContainerReader {
   public:
    explicit ContainerReader(std::span<const std::uint8_t> bytes);

    const ContainerHeader& header() const { return _header; }
    const StringTable& strings() const { return _strings; }
    std::uint16_t file_count() const { return _file_count; }
    std::uint16_t entries_read() const { return _entries_read; }
    bool has_next() const { return _entries_read < _file_count; }

    // Reads the next entry's metadata and streams its value tree into `sink`.
    FileEntry next_entry(EventSink& sink);

    // Bytes left after the last entry; only meaningful once has_next() is false.
    std::size_t trailing_bytes() const { return _reader.remaining(); }

   private:
    ByteReader _reader;
    ContainerHeader _header{};
    StringTable _strings;
    std::uint16_t _file_count = 0;
    std::uint16_t _entries_read = 0;
};

}  // namespace darkcfg::dcb
