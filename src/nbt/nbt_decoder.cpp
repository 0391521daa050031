/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nbt/nbt_decoder.h"

#include "nbt/nbt_mutf8.h"

#include <algorithm>
#include <string>
#include <utility>

namespace nbt2dict::nbt {

// Smallest number of bytes a payload of this type can occupy.
static std::size_t min_payload_size(TagType type) {
    switch (type) {
        case TagType::End:
            return 0;
        case TagType::Byte:
        case TagType::Compound:
            return 1;
        case TagType::Short:
        case TagType::String:
            return 2;
        case TagType::Int:
        case TagType::Float:
        case TagType::ByteArray:
        case TagType::IntArray:
        case TagType::LongArray:
            return 4;
        case TagType::List:
            return 5;
        case TagType::Long:
        case TagType::Double:
            return 8;
    }
    return 0;
}

static TagType read_tag_type(Cursor& cursor) {
    const std::size_t at = cursor.position();
    const std::uint8_t raw = cursor.read_u8();
    const auto type = tag_type_from_byte(raw);
    if (!type.has_value()) {
        throw NbtError(ErrorKind::InvalidTagType, at, "unknown tag type " + std::to_string(raw));
    }
    return *type;
}

static std::string read_text(Cursor& cursor) {
    return mutf8_to_utf8(cursor.read_string());
}

// Type byte, name and payload. The undecoded name bytes are left in raw_name.
static NamedTag read_named_tag(
    Cursor& cursor, int depth, const DecodeOptions& options, std::string& raw_name
);

// Signed 32-bit element count, checked against what the rest of the buffer can hold.
static std::size_t read_count(Cursor& cursor, TagType element_type, TagType container) {
    const std::size_t at = cursor.position();
    const std::int32_t count = cursor.read_i32();
    if (count < 0) {
        throw NbtError(
            ErrorKind::NegativeLength, at,
            std::string(tag_type_name(container)) + " count " + std::to_string(count)
        );
    }
    const auto n = static_cast<std::size_t>(count);
    const std::size_t width = min_payload_size(element_type);
    if (width > 0 && n > cursor.remaining() / width) {
        throw NbtError(
            ErrorKind::UnexpectedEndOfInput, cursor.position(),
            std::string(tag_type_name(container)) + " declares " + std::to_string(n)
                + " elements but only " + std::to_string(cursor.remaining()) + " bytes remain"
        );
    }
    return n;
}

template <class T, class ReadFn>
static std::vector<T>
read_array(Cursor& cursor, TagType element_type, TagType container, ReadFn read) {
    const std::size_t n = read_count(cursor, element_type, container);
    std::vector<T> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; i++) {
        out.push_back(read(cursor));
    }
    return out;
}

static void check_depth(const Cursor& cursor, int depth, const DecodeOptions& options) {
    const int limit = std::min(options.max_depth, kMaxDepthLimit);
    if (depth > limit) {
        throw NbtError(
            ErrorKind::MaxDepthExceeded, cursor.position(),
            "depth " + std::to_string(depth) + " exceeds maximum " + std::to_string(limit)
        );
    }
}

static TagList decode_list(Cursor& cursor, int depth, const DecodeOptions& options) {
    check_depth(cursor, depth, options);
    const TagType element_type = read_tag_type(cursor);
    const std::size_t count_at = cursor.position();
    const std::size_t n = read_count(cursor, element_type, TagType::List);
    if (element_type == TagType::End && n > 0) {
        throw NbtError(
            ErrorKind::InvalidTagType, count_at,
            "List of End declares " + std::to_string(n) + " elements"
        );
    }

    TagList list(element_type);
    list.reserve(n);
    for (std::size_t i = 0; i < n; i++) {
        try {
            list.push_back(decode_payload(cursor, element_type, depth + 1, options));
        } catch (NbtError& e) {
            e.prepend_index(i);
            throw;
        }
    }
    return list;
}

static TagCompound decode_compound(Cursor& cursor, int depth, const DecodeOptions& options) {
    check_depth(cursor, depth, options);
    TagCompound compound;
    std::string raw_name;
    while (true) {
        const std::size_t child_at = cursor.position();
        NamedTag child = read_named_tag(cursor, depth + 1, options, raw_name);
        if (child.tag.type() == TagType::End) {
            break;
        }
        // Names are unique as written; two spellings may convert to the same text.
        if (!compound.insert(child.name, std::move(child.tag), raw_name)) {
            throw NbtError(
                ErrorKind::DuplicateName, child_at, "duplicate name '" + child.name + "'"
            );
        }
    }
    return compound;
}

Tag decode_payload(Cursor& cursor, TagType type, int depth, const DecodeOptions& options) {
    switch (type) {
        case TagType::End:
            return make_tag<TagType::End>();
        case TagType::Byte:
            return make_tag<TagType::Byte>(cursor.read_i8());
        case TagType::Short:
            return make_tag<TagType::Short>(cursor.read_i16());
        case TagType::Int:
            return make_tag<TagType::Int>(cursor.read_i32());
        case TagType::Long:
            return make_tag<TagType::Long>(cursor.read_i64());
        case TagType::Float:
            return make_tag<TagType::Float>(cursor.read_f32());
        case TagType::Double:
            return make_tag<TagType::Double>(cursor.read_f64());
        case TagType::ByteArray:
            return make_tag<TagType::ByteArray>(read_array<std::int8_t>(
                cursor, TagType::Byte, type, [](Cursor& c) { return c.read_i8(); }
            ));
        case TagType::String:
            return make_tag<TagType::String>(read_text(cursor));
        case TagType::List:
            return make_tag<TagType::List>(decode_list(cursor, depth, options));
        case TagType::Compound:
            return make_tag<TagType::Compound>(decode_compound(cursor, depth, options));
        case TagType::IntArray:
            return make_tag<TagType::IntArray>(read_array<std::int32_t>(
                cursor, TagType::Int, type, [](Cursor& c) { return c.read_i32(); }
            ));
        case TagType::LongArray:
            return make_tag<TagType::LongArray>(read_array<std::int64_t>(
                cursor, TagType::Long, type, [](Cursor& c) { return c.read_i64(); }
            ));
    }
    throw NbtError(
        ErrorKind::InvalidTagType, cursor.position(),
        "unknown tag type " + std::to_string(static_cast<int>(type))
    );
}

static NamedTag read_named_tag(
    Cursor& cursor, int depth, const DecodeOptions& options, std::string& raw_name
) {
    raw_name.clear();
    const TagType type = read_tag_type(cursor);
    if (type == TagType::End) {
        return NamedTag{std::string(), make_tag<TagType::End>()};
    }

    NamedTag out;
    raw_name = cursor.read_string();
    out.name = mutf8_to_utf8(raw_name);
    try {
        out.tag = decode_payload(cursor, type, depth, options);
    } catch (NbtError& e) {
        e.prepend_name(out.name);
        throw;
    }
    return out;
}

NamedTag decode_named_tag(Cursor& cursor, int depth, const DecodeOptions& options) {
    std::string raw_name;
    return read_named_tag(cursor, depth, options, raw_name);
}

ParseInfo parse_with_info(std::span<const std::uint8_t> buffer, const DecodeOptions& options) {
    Cursor cursor(buffer);

    const std::uint8_t root_type = cursor.peek_u8();
    if (root_type != static_cast<std::uint8_t>(TagType::Compound) && root_type <= kMaxTagType) {
        throw NbtError(
            ErrorKind::InvalidRootTag, 0,
            "root tag is " + std::string(tag_type_name(static_cast<TagType>(root_type)))
                + ", expected Compound"
        );
    }

    ParseInfo info;
    info.root = decode_named_tag(cursor, 0, options);
    info.consumed_bytes = cursor.position();
    info.trailing_bytes = cursor.remaining();
    if (!options.allow_trailing_bytes && info.trailing_bytes > 0) {
        throw NbtError(
            ErrorKind::TrailingBytes, info.consumed_bytes,
            std::to_string(info.trailing_bytes) + " bytes after root compound"
        );
    }
    return info;
}

NamedTag parse(std::span<const std::uint8_t> buffer, const DecodeOptions& options) {
    return parse_with_info(buffer, options).root;
}

}  // namespace nbt2dict::nbt
