/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "dcb_parser.h"

#include "dcb/dcb_errors.h"
#include "dcb/dcb_json_sink.h"
#include "dcb/dcb_text.h"
#include "dcb/dcb_timestamp.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace darkcfg::dcb {

static const char* kind_name(TimestampKind kind) {
    switch (kind) {
        case TimestampKind::Utc:
            return "utc";
        case TimestampKind::Local:
            return "local";
        case TimestampKind::Unspecified:
            break;
    }
    return "unspecified";
}

static nlohmann::ordered_json build_manifest(
    const DecodeResult& result,
    const StringTable& strings,
    std::uint16_t file_count,
    bool keep_strings,
    std::string_view label
) {
    nlohmann::ordered_json meta = nlohmann::ordered_json::object();
    if (!label.empty()) {
        meta["source"] = std::string(label);
    }
    meta["magic"] = to_hex_u32(result.header.magic);
    meta["endian"] = result.header.endian == Endian::Little ? "little" : "big";
    meta["version"] = result.header.version;
    meta["compressionMethod"] = result.header.compression_method;
    meta["encryptionMethod"] = result.header.encryption_method;
    meta["stringCount"] = strings.size();
    meta["fileCount"] = file_count;
    meta["trailingBytes"] = result.trailing_bytes;

    auto entries = nlohmann::ordered_json::array();
    for (const auto& decoded : result.entries) {
        const auto& e = decoded.entry;
        nlohmann::ordered_json j = nlohmann::ordered_json::object();
        j["path"] = latin1_to_utf8(e.raw_path);
        j["output"] = latin1_to_utf8(e.path.generic_string() + ".json");
        j["checksum"] = to_hex_u32(e.checksum);
        j["declaredSize"] = e.declared_size;
        j["payloadOffset"] = e.payload_offset;
        j["payloadSize"] = e.payload_size;
        j["modified"] = format_iso8601(e.modified);
        j["modifiedKind"] = kind_name(e.modified.kind);
        if (decoded.duplicate_keys > 0) {
            j["duplicateKeys"] = decoded.duplicate_keys;
        }
        entries.push_back(std::move(j));
    }
    meta["entries"] = std::move(entries);

    if (keep_strings) {
        auto table = nlohmann::ordered_json::array();
        for (const auto& [id, value] : strings.entries()) {
            table.push_back({{"id", id}, {"value", latin1_to_utf8(value)}});
        }
        meta["strings"] = std::move(table);
    }
    return meta;
}

DecodeResult
DcbParser::DecodeFile(const std::filesystem::path& path, const ParserDecodeOptions& opt) {
    const auto t0 = std::chrono::steady_clock::now();
    const auto bytes = darkcfg::fs_utils::read_file(path);
    if (bytes.empty()) {
        throw FormatError("Container file is empty: " + path.string());
    }
    if (opt.debug) {
        const auto read_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - t0
        )
                                 .count();
        DARKCFG_LOG_INFO(
            "Read %s: bytes=%zu read=%lldms", path.string().c_str(), bytes.size(),
            static_cast<long long>(read_ms)
        );
    }
    return DecodeBytes(bytes, opt, path.filename().string());
}

DecodeResult DcbParser::DecodeBytes(
    std::span<const std::uint8_t> bytes,
    const ParserDecodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    ContainerReader reader(bytes);

    DecodeResult result{};
    result.header = reader.header();
    result.entries.reserve(reader.file_count());
    if (opt.debug) {
        DARKCFG_LOG_INFO(
            "Container %s: endian=%s strings=%zu files=%u", std::string(label).c_str(),
            reader.header().endian == Endian::Little ? "little" : "big", reader.strings().size(),
            static_cast<unsigned>(reader.file_count())
        );
    }

    while (reader.has_next()) {
        JsonDocumentBuilder builder;
        DecodedEntry decoded{};
        decoded.entry = reader.next_entry(builder);
        decoded.document = builder.take_document();
        decoded.duplicate_keys = builder.duplicate_keys();

        const auto& e = decoded.entry;
        if (opt.verbose) {
            DARKCFG_LOG_INFO("Emitting '%s'...", e.path.string().c_str());
        }
        if (decoded.duplicate_keys > 0) {
            DARKCFG_LOG_WARN(
                "%s: %zu duplicate mapping key(s), written as key/value pairs",
                e.path.string().c_str(),
                decoded.duplicate_keys
            );
        }
        if (e.declared_size >= 0 && static_cast<std::size_t>(e.declared_size) != e.payload_size) {
            if (opt.check_size) {
                throw FormatError(
                    "Entry '" + e.raw_path + "' declares " + std::to_string(e.declared_size)
                    + " bytes but its payload is " + std::to_string(e.payload_size) + " bytes"
                );
            }
            if (opt.debug) {
                DARKCFG_LOG_INFO(
                    "Size mismatch %s: declared=%d payload=%zu", e.path.string().c_str(),
                    e.declared_size, e.payload_size
                );
            }
        } else if (e.declared_size < 0 && opt.check_size) {
            throw FormatError(
                "Entry '" + e.raw_path + "' declares negative size "
                + std::to_string(e.declared_size)
            );
        }
        result.entries.push_back(std::move(decoded));
    }

    result.trailing_bytes = reader.trailing_bytes();
    if (result.trailing_bytes > 0 && (opt.verbose || opt.debug)) {
        DARKCFG_LOG_WARN(
            "%zu trailing byte(s) after last entry in %s", result.trailing_bytes,
            std::string(label).c_str()
        );
    }

    result.manifest =
        build_manifest(result, reader.strings(), reader.file_count(), opt.keep_strings, label);

    if (opt.debug) {
        const auto decode_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - t0
        )
                                   .count();
        DARKCFG_LOG_INFO(
            "Decode %s: entries=%zu decode=%lldms", std::string(label).c_str(),
            result.entries.size(), static_cast<long long>(decode_ms)
        );
    }
    return result;
}

fs::path DcbParser::OutputPathFor(const fs::path& out_dir, const FileEntry& entry) {
    fs::path out = out_dir / entry.path;
    out += ".json";
    return out;
}

std::vector<fs::path> DcbParser::WriteOutputs(
    const DecodeResult& result,
    const fs::path& out_dir,
    const ParserWriteOptions& opt
) {
    const auto t0 = std::chrono::steady_clock::now();
    std::vector<fs::path> written;
    written.reserve(result.entries.size());

    for (const auto& decoded : result.entries) {
        const fs::path out = OutputPathFor(out_dir, decoded.entry);
        darkcfg::fs_utils::write_text_file(out, decoded.document.dump(2) + "\n");
        fs::last_write_time(out, to_file_time(decoded.entry.modified));
        written.push_back(out);
    }

    if (opt.write_manifest) {
        const fs::path meta_path = out_dir / "_manifest.json";
        darkcfg::fs_utils::write_text_file(meta_path, result.manifest.dump(2) + "\n");
    }

    if (opt.debug) {
        const auto write_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - t0
        )
                                  .count();
        DARKCFG_LOG_INFO(
            "Write %s: files=%zu write=%lldms", out_dir.string().c_str(), written.size(),
            static_cast<long long>(write_ms)
        );
    }
    return written;
}

}  // namespace darkcfg::dcb
