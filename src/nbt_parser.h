/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nbt/nbt_decoder.h"
#include "nbt/nbt_tag.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

namespace nbt2dict {

struct ParserDecodeOptions {
    int max_depth = nbt::kDefaultMaxDepth;
    bool allow_trailing_bytes = true;
    bool typed_json = false;
    // Logs size, timing and trailing-byte details for each decode.
    bool debug = false;
};

struct DecodeResult {
    nbt::NamedTag root;
    nlohmann::ordered_json json = nlohmann::ordered_json::object();
    std::size_t consumed_bytes = 0;
    std::size_t trailing_bytes = 0;
};

class NbtParser {
   public:
    static DecodeResult
    DecodeNbtFile(const std::filesystem::path& path, const ParserDecodeOptions& opt = {});
    // label names the input in log messages; DecodeNbtFile passes the path.
    static DecodeResult DecodeNbtBytes(
        std::span<const std::uint8_t> bytes,
        const ParserDecodeOptions& opt = {},
        std::string_view label = "<memory>"
    );
};

}  // namespace nbt2dict
