/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <string>
#include <string_view>

namespace nbt2dict::nbt {
// Java modified UTF-8 (C0 80 for NUL, surrogate pairs as two 3-byte sequences)
// to standard UTF-8. Ill-formed sequences are copied through unchanged.
std::string mutf8_to_utf8(std::string_view in);
}  // namespace nbt2dict::nbt
