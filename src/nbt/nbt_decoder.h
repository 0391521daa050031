/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nbt/nbt_cursor.h"
#include "nbt/nbt_error.h"
#include "nbt/nbt_tag.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace nbt2dict::nbt {

inline constexpr int kDefaultMaxDepth = 512;
// Hard ceiling on nesting. Larger max_depth values are clamped to it so the
// recursive decoder stays within the stack.
inline constexpr int kMaxDepthLimit = 2048;

struct DecodeOptions {
    // Deepest List/Compound allowed; the root compound sits at depth 0.
    // Clamped to kMaxDepthLimit.
    int max_depth = kDefaultMaxDepth;
    bool allow_trailing_bytes = true;
};

struct ParseInfo {
    NamedTag root;
    std::size_t consumed_bytes = 0;
    std::size_t trailing_bytes = 0;
};

/**
 * Decodes one complete named tag (type byte, name, payload). An End byte
 * yields a nameless End tag with no payload.
 */
NamedTag decode_named_tag(Cursor& cursor, int depth, const DecodeOptions& options = {});

// Payload only, as used for list elements.
Tag decode_payload(Cursor& cursor, TagType type, int depth, const DecodeOptions& options = {});

NamedTag parse(std::span<const std::uint8_t> buffer, const DecodeOptions& options = {});
ParseInfo parse_with_info(std::span<const std::uint8_t> buffer, const DecodeOptions& options = {});

}  // namespace nbt2dict::nbt
