/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nbt_parser.h"

#include "nbt/nbt_json.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <string>
#include <utility>

namespace nbt2dict {

DecodeResult
NbtParser::DecodeNbtFile(const std::filesystem::path& path, const ParserDecodeOptions& opt) {
    const auto bytes = fs_utils::read_file(path);
    return DecodeNbtBytes(bytes, opt, path.string());
}

DecodeResult
NbtParser::DecodeNbtBytes(
    std::span<const std::uint8_t> bytes, const ParserDecodeOptions& opt, std::string_view label
) {
    nbt::DecodeOptions decode_opt{};
    decode_opt.max_depth = opt.max_depth;
    decode_opt.allow_trailing_bytes = opt.allow_trailing_bytes;

    const std::string name(label);
    if (opt.debug) {
        NBT2DICT_LOG_INFO("Decoding %s (%zu bytes)", name.c_str(), bytes.size());
    }
    const auto t0 = std::chrono::steady_clock::now();
    auto info = nbt::parse_with_info(bytes, decode_opt);
    const auto t1 = std::chrono::steady_clock::now();
    if (opt.debug) {
        const auto decode_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        NBT2DICT_LOG_INFO(
            "Decoded %s: root='%s' children=%zu consumed=%zu decode=%lldms", name.c_str(),
            info.root.name.c_str(), info.root.compound().size(), info.consumed_bytes,
            static_cast<long long>(decode_ms)
        );
        if (info.trailing_bytes > 0) {
            NBT2DICT_LOG_INFO(
                "Ignored %zu trailing bytes after root compound in %s", info.trailing_bytes,
                name.c_str()
            );
        }
    }

    nbt::JsonOptions json_opt{};
    json_opt.typed = opt.typed_json;

    DecodeResult result{};
    result.json = nbt::to_json(info.root, json_opt);
    result.root = std::move(info.root);
    result.consumed_bytes = info.consumed_bytes;
    result.trailing_bytes = info.trailing_bytes;
    return result;
}

}  // namespace nbt2dict
