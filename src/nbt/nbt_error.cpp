/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nbt/nbt_error.h"

#include <utility>

namespace nbt2dict::nbt {

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnexpectedEndOfInput:
            return "UnexpectedEndOfInput";
        case ErrorKind::InvalidTagType:
            return "InvalidTagType";
        case ErrorKind::InvalidRootTag:
            return "InvalidRootTag";
        case ErrorKind::NegativeLength:
            return "NegativeLength";
        case ErrorKind::DuplicateName:
            return "DuplicateName";
        case ErrorKind::MaxDepthExceeded:
            return "MaxDepthExceeded";
        case ErrorKind::TrailingBytes:
            return "TrailingBytes";
    }
    return "Unknown";
}

NbtError::NbtError(ErrorKind kind, std::size_t offset, std::string detail)
    : std::runtime_error(std::string(error_kind_name(kind))),
      _kind(kind),
      _offset(offset),
      _detail(std::move(detail)) {
    rebuild_message();
}

void NbtError::prepend_name(std::string_view name) {
    _segments.insert(_segments.begin(), PathSegment{std::string(name), false});
    rebuild_message();
}

void NbtError::prepend_index(std::size_t index) {
    _segments.insert(_segments.begin(), PathSegment{"[" + std::to_string(index) + "]", true});
    rebuild_message();
}

// The outermost segment is the root compound, which is usually unnamed.
std::string NbtError::path() const {
    std::string out;
    for (std::size_t i = 0; i < _segments.size(); i++) {
        const auto& seg = _segments[i];
        if (i == 0 && !seg.is_index) {
            out += seg.text.empty() ? std::string("<root>") : seg.text;
        } else if (seg.is_index) {
            out += seg.text;
        } else {
            out += "." + seg.text;
        }
    }
    return out;
}

void NbtError::rebuild_message() {
    _message = std::string(error_kind_name(_kind)) + " at offset " + std::to_string(_offset);
    const auto p = path();
    if (!p.empty()) {
        _message += " in " + p;
    }
    if (!_detail.empty()) {
        _message += ": " + _detail;
    }
}

}  // namespace nbt2dict::nbt
