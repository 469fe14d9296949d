/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "fs_utils.h"

#include "log.h"

#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace darkcfg::fs_utils {
std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error(std::string("Failed to open file for reading: ") + path.string());
    }
    f.seekg(0, std::ios::end);
    const auto len = f.tellg();
    f.seekg(0, std::ios::beg);
    if (len < 0) {
        throw std::runtime_error(std::string("Failed to get file size: ") + path.string());
    }
    std::vector<std::uint8_t> buf(static_cast<std::size_t>(len));
    if (!buf.empty()) {
        f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        if (!f) {
            throw std::runtime_error(std::string("Failed to read file: ") + path.string());
        }
    }
    return buf;
}

void write_text_file(const fs::path& path, const std::string& text) {
    ensure_dir(path.parent_path());
    std::ofstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error(std::string("Failed to open file for writing: ") + path.string());
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    f.close();
    if (!f) {
        throw std::runtime_error(std::string("Failed to write file: ") + path.string());
    }
}

void ensure_dir(const fs::path& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        DARKCFG_LOG_ERROR(
            "Failed to create directory: %s (%s)", dir.string().c_str(), ec.message().c_str()
        );
    }
}

std::string display_path(const fs::path& path, const fs::path& base_dir) {
    if (base_dir.empty()) {
        return path.string();
    }

    std::error_code ec;
    fs::path abs_base = fs::weakly_canonical(base_dir, ec);
    if (ec) {
        abs_base = base_dir;
        ec.clear();
    }

    fs::path abs_path = fs::weakly_canonical(path, ec);
    if (ec) {
        abs_path = path;
        ec.clear();
    }

    const fs::path rel = abs_path.lexically_relative(abs_base);
    if (rel.empty()) {
        return abs_path.string();
    }
    const auto it = rel.begin();
    if (it != rel.end() && *it == "..") {
        return abs_path.string();
    }
    return rel.string();
}

fs::path default_output_dir(const fs::path& input) {
    fs::path out = input;
    out.replace_extension();
    out += "_unpack";
    return out;
}
}  // namespace darkcfg::fs_utils
