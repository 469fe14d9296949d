/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace darkcfg::fs_utils {
std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& text);
void ensure_dir(const std::filesystem::path& dir);
std::string display_path(const std::filesystem::path& path, const std::filesystem::path& base_dir);
// "<dir>/<stem>_unpack" next to the input.
std::filesystem::path default_output_dir(const std::filesystem::path& input);
}  // namespace darkcfg::fs_utils
