/**
 * Copyright (c) 2026 rid2name authors
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace r2n::fs_utils {
bool is_arsc_file(const std::filesystem::path& path);
std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& text);
void ensure_dir(const std::filesystem::path& dir);
}  // namespace r2n::fs_utils
