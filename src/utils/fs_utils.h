/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ykr::fs_utils {
std::filesystem::path executable_dir();
// <executable_dir>/output
std::filesystem::path output_root();
bool is_metadata_json(const std::filesystem::path& path);
std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path& root);
std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& text);
void ensure_dir(const std::filesystem::path& dir);
}  // namespace ykr::fs_utils
