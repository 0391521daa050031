/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace nbt2dict::fs_utils {
// Directory holding the running binary, falling back to argv0's directory.
std::filesystem::path executable_dir(const char* argv0);
bool is_nbt_file(const std::filesystem::path& path);
std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path& root);
std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& text);
// Creates dir and its parents; throws std::runtime_error on failure.
void ensure_dir(const std::filesystem::path& dir);
}  // namespace nbt2dict::fs_utils
