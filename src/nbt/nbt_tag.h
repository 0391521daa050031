/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace nbt2dict::nbt {

enum class TagType : std::uint8_t {
    End = 0,
    Byte = 1,
    Short = 2,
    Int = 3,
    Long = 4,
    Float = 5,
    Double = 6,
    ByteArray = 7,
    String = 8,
    List = 9,
    Compound = 10,
    IntArray = 11,
    LongArray = 12,
};

inline constexpr std::uint8_t kMaxTagType = static_cast<std::uint8_t>(TagType::LongArray);

std::optional<TagType> tag_type_from_byte(std::uint8_t raw);
std::string_view tag_type_name(TagType type);

struct Tag;

struct TagEnd {
    bool operator==(const TagEnd&) const { return true; }
};

class TagList {
   public:
    TagList() = default;
    explicit TagList(TagType element_type) : _element_type(element_type) {}

    TagType element_type() const { return _element_type; }
    const std::vector<Tag>& items() const { return _items; }
    std::size_t size() const;
    bool empty() const;
    const Tag& operator[](std::size_t i) const;

    void reserve(std::size_t n);
    void push_back(Tag tag);

    bool operator==(const TagList& other) const;

   private:
    TagType _element_type = TagType::End;
    std::vector<Tag> _items;
};

// Insertion-ordered name -> Tag mapping with unique names.
class TagCompound {
   public:
    using Entry = std::pair<std::string, Tag>;

    const std::vector<Entry>& entries() const { return _entries; }
    std::size_t size() const;
    bool empty() const;

    bool contains(std::string_view name) const;
    const Tag* find(std::string_view name) const;
    const Tag& at(std::string_view name) const;

    // Returns false and leaves the compound unchanged if the name is taken.
    bool insert(std::string name, Tag tag);
    // Uniqueness is decided on key (the name bytes as written when decoding).
    // Lookups by name return the first entry carrying it.
    bool insert(std::string name, Tag tag, std::string key);

    bool operator==(const TagCompound& other) const;

   private:
    std::vector<Entry> _entries;
    std::unordered_map<std::string, std::size_t> _index;
    std::unordered_set<std::string> _keys;
};

using ByteArray = std::vector<std::int8_t>;
using IntArray = std::vector<std::int32_t>;
using LongArray = std::vector<std::int64_t>;

// Alternative index matches the TagType byte value.
using TagValue = std::variant<
    TagEnd,
    std::int8_t,
    std::int16_t,
    std::int32_t,
    std::int64_t,
    float,
    double,
    ByteArray,
    std::string,
    TagList,
    TagCompound,
    IntArray,
    LongArray>;

struct Tag {
    TagValue value;

    TagType type() const { return static_cast<TagType>(value.index()); }

    template <TagType T>
    const auto& get() const {
        return std::get<static_cast<std::size_t>(T)>(value);
    }

    template <TagType T>
    const auto* get_if() const {
        return std::get_if<static_cast<std::size_t>(T)>(&value);
    }

    bool operator==(const Tag& other) const { return value == other.value; }
};

template <TagType T, class... Args>
Tag make_tag(Args&&... args) {
    return Tag{
        TagValue(std::in_place_index<static_cast<std::size_t>(T)>, std::forward<Args>(args)...)
    };
}

struct NamedTag {
    std::string name;
    Tag tag;

    const TagCompound& compound() const { return tag.get<TagType::Compound>(); }
};

}  // namespace nbt2dict::nbt
