/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "fs_utils.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace nbt2dict::fs_utils {
bool is_nbt_file(const fs::path& path) {
    const auto ext = path.extension();
    return ext == ".nbt" || ext == ".dat";
}

fs::path executable_dir(const char* argv0) {
    std::error_code ec;
    const fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (!ec && !self.empty()) {
        return self.parent_path();
    }
    if (argv0 == nullptr) {
        return fs::current_path();
    }
    return fs::absolute(fs::path(argv0)).parent_path();
}

std::vector<fs::path> collect_inputs(const fs::path& root) {
    std::vector<fs::path> out;
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && is_nbt_file(entry.path())) {
            out.push_back(entry.path());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    std::vector<std::uint8_t> out(
        (std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>()
    );
    if (in.bad()) {
        throw std::runtime_error("Error while reading " + path.string());
    }
    return out;
}

void write_text_file(const fs::path& path, const std::string& text) {
    ensure_dir(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
    out.flush();
    if (!out) {
        throw std::runtime_error("Cannot write " + path.string());
    }
}

void ensure_dir(const fs::path& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create directory " + dir.string() + ": " + ec.message());
    }
}
}  // namespace nbt2dict::fs_utils
