/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nbt/nbt_tag.h"

#include <nlohmann/json.hpp>

namespace nbt2dict::nbt {

struct JsonOptions {
    // Wraps every value as {"__type": ..., "value": ...} so tag kinds survive.
    bool typed = false;
};

nlohmann::ordered_json to_json(const Tag& tag, const JsonOptions& options = {});

// { root_name: <root compound> }
nlohmann::ordered_json to_json(const NamedTag& root, const JsonOptions& options = {});

}  // namespace nbt2dict::nbt
