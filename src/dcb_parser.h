/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "dcb/dcb_container.h"
#include "dcb/dcb_header.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace darkcfg::dcb {

struct ParserDecodeOptions {
    bool check_size = false;
    bool keep_strings = false;
    bool verbose = false;
    bool debug = false;
};

struct ParserWriteOptions {
    bool write_manifest = false;
    bool debug = false;
};

struct DecodedEntry {
    FileEntry entry;
    nlohmann::ordered_json document;
    std::size_t duplicate_keys = 0;
};

struct DecodeResult {
    ContainerHeader header{};
    std::vector<DecodedEntry> entries;
    std::size_t trailing_bytes = 0;
    nlohmann::ordered_json manifest = nlohmann::ordered_json::object();
};

class DcbParser {
   public:
    static DecodeResult
    DecodeFile(const std::filesystem::path& path, const ParserDecodeOptions& opt = {});
    static DecodeResult DecodeBytes(
        std::span<const std::uint8_t> bytes,
        const ParserDecodeOptions& opt = {},
        std::string_view label = {}
    );

    // One <out_dir>/<entry path>.json per entry with the entry time applied, plus
    // _manifest.json when requested. Returns the written paths in entry order.
    static std::vector<std::filesystem::path> WriteOutputs(
        const DecodeResult& result,
        const std::filesystem::path& out_dir,
        const ParserWriteOptions& opt = {}
    );

    static std::filesystem::path OutputPathFor(
        const std::filesystem::path& out_dir,
        const FileEntry& entry
    );
};

}  // namespace darkcfg::dcb
