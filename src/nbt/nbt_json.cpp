/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nbt/nbt_json.h"

#include <string>

namespace nbt2dict::nbt {

template <class T>
static nlohmann::ordered_json int_array_json(const std::vector<T>& values) {
    auto arr = nlohmann::ordered_json::array();
    for (const auto v : values) {
        arr.push_back(static_cast<std::int64_t>(v));
    }
    return arr;
}

static nlohmann::ordered_json value_json(const Tag& tag, const JsonOptions& options) {
    switch (tag.type()) {
        case TagType::End:
            return nullptr;
        case TagType::Byte:
            return static_cast<std::int64_t>(tag.get<TagType::Byte>());
        case TagType::Short:
            return static_cast<std::int64_t>(tag.get<TagType::Short>());
        case TagType::Int:
            return static_cast<std::int64_t>(tag.get<TagType::Int>());
        case TagType::Long:
            return tag.get<TagType::Long>();
        case TagType::Float:
            return static_cast<double>(tag.get<TagType::Float>());
        case TagType::Double:
            return tag.get<TagType::Double>();
        case TagType::ByteArray:
            return int_array_json(tag.get<TagType::ByteArray>());
        case TagType::String:
            return tag.get<TagType::String>();
        case TagType::List: {
            auto arr = nlohmann::ordered_json::array();
            for (const auto& item : tag.get<TagType::List>().items()) {
                arr.push_back(to_json(item, options));
            }
            return arr;
        }
        case TagType::Compound: {
            auto obj = nlohmann::ordered_json::object();
            for (const auto& [name, child] : tag.get<TagType::Compound>().entries()) {
                // First wins when two written names convert to the same text.
                if (!obj.contains(name)) {
                    obj[name] = to_json(child, options);
                }
            }
            return obj;
        }
        case TagType::IntArray:
            return int_array_json(tag.get<TagType::IntArray>());
        case TagType::LongArray:
            return int_array_json(tag.get<TagType::LongArray>());
    }
    return nullptr;
}

nlohmann::ordered_json to_json(const Tag& tag, const JsonOptions& options) {
    if (!options.typed) {
        return value_json(tag, options);
    }
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    out["__type"] = std::string(tag_type_name(tag.type()));
    if (const auto* list = tag.get_if<TagType::List>()) {
        out["__elementType"] = std::string(tag_type_name(list->element_type()));
    }
    out["value"] = value_json(tag, options);
    return out;
}

nlohmann::ordered_json to_json(const NamedTag& root, const JsonOptions& options) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    out[root.name] = to_json(root.tag, options);
    return out;
}

}  // namespace nbt2dict::nbt
