/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nbt/nbt_mutf8.h"

#include <cstdint>

namespace nbt2dict::nbt {
static bool is_cont(std::uint8_t b) {
    return (b & 0xC0u) == 0x80u;
}

// 3-byte sequence encoding a UTF-16 surrogate (ED A0..BF xx).
static bool read_surrogate(std::string_view in, std::size_t pos, std::uint32_t& unit) {
    if (pos + 3 > in.size()) {
        return false;
    }
    const auto b0 = static_cast<std::uint8_t>(in[pos]);
    const auto b1 = static_cast<std::uint8_t>(in[pos + 1]);
    const auto b2 = static_cast<std::uint8_t>(in[pos + 2]);
    if (b0 != 0xEDu || (b1 & 0xE0u) != 0xA0u || !is_cont(b2)) {
        return false;
    }
    unit = 0xD000u | ((b1 & 0x3Fu) << 6) | (b2 & 0x3Fu);
    return true;
}

static void append_utf8_4(std::string& out, std::uint32_t cp) {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
}

std::string mutf8_to_utf8(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    std::size_t pos = 0;
    while (pos < in.size()) {
        const auto b0 = static_cast<std::uint8_t>(in[pos]);
        if (b0 == 0xC0u && pos + 1 < in.size() && static_cast<std::uint8_t>(in[pos + 1]) == 0x80u) {
            out.push_back('\0');
            pos += 2;
            continue;
        }
        std::uint32_t hi = 0;
        std::uint32_t lo = 0;
        if (read_surrogate(in, pos, hi) && hi >= 0xD800u && hi <= 0xDBFFu
            && read_surrogate(in, pos + 3, lo) && lo >= 0xDC00u && lo <= 0xDFFFu) {
            append_utf8_4(out, 0x10000u + ((hi - 0xD800u) << 10) + (lo - 0xDC00u));
            pos += 6;
            continue;
        }
        out.push_back(in[pos]);
        pos++;
    }
    return out;
}
}  // namespace nbt2dict::nbt
