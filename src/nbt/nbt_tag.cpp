/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nbt/nbt_tag.h"

#include <array>
#include <stdexcept>
#include <utility>

namespace nbt2dict::nbt {

static const std::array<std::string_view, kMaxTagType + 1> kTagTypeNames = {{
    "End",
    "Byte",
    "Short",
    "Int",
    "Long",
    "Float",
    "Double",
    "ByteArray",
    "String",
    "List",
    "Compound",
    "IntArray",
    "LongArray",
}};

std::optional<TagType> tag_type_from_byte(std::uint8_t raw) {
    if (raw > kMaxTagType) {
        return std::nullopt;
    }
    return static_cast<TagType>(raw);
}

std::string_view tag_type_name(TagType type) {
    const auto idx = static_cast<std::size_t>(type);
    if (idx >= kTagTypeNames.size()) {
        return "Unknown";
    }
    return kTagTypeNames[idx];
}

std::size_t TagList::size() const {
    return _items.size();
}

bool TagList::empty() const {
    return _items.empty();
}

void TagList::reserve(std::size_t n) {
    _items.reserve(n);
}

const Tag& TagList::operator[](std::size_t i) const {
    return _items[i];
}

void TagList::push_back(Tag tag) {
    _items.push_back(std::move(tag));
}

bool TagList::operator==(const TagList& other) const {
    return _element_type == other._element_type && _items == other._items;
}

std::size_t TagCompound::size() const {
    return _entries.size();
}

bool TagCompound::empty() const {
    return _entries.empty();
}

bool TagCompound::contains(std::string_view name) const {
    return find(name) != nullptr;
}

const Tag* TagCompound::find(std::string_view name) const {
    const auto it = _index.find(std::string(name));
    if (it == _index.end()) {
        return nullptr;
    }
    return &_entries[it->second].second;
}

const Tag& TagCompound::at(std::string_view name) const {
    const Tag* tag = find(name);
    if (tag == nullptr) {
        throw std::out_of_range("No tag named '" + std::string(name) + "' in compound");
    }
    return *tag;
}

bool TagCompound::insert(std::string name, Tag tag) {
    std::string key = name;
    return insert(std::move(name), std::move(tag), std::move(key));
}

bool TagCompound::insert(std::string name, Tag tag, std::string key) {
    if (!_keys.insert(std::move(key)).second) {
        return false;
    }
    _index.emplace(name, _entries.size());
    _entries.emplace_back(std::move(name), std::move(tag));
    return true;
}

bool TagCompound::operator==(const TagCompound& other) const {
    return _entries == other._entries;
}

}  // namespace nbt2dict::nbt
