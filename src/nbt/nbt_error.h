/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace nbt2dict::nbt {

enum class ErrorKind {
    UnexpectedEndOfInput,
    InvalidTagType,
    InvalidRootTag,
    NegativeLength,
    DuplicateName,
    MaxDepthExceeded,
    TrailingBytes,
};

std::string_view error_kind_name(ErrorKind kind);

/**
 * Decode failure. The tag path is filled in while the error unwinds through
 * the enclosing tags, so what() is rebuilt on every prepend.
 */
class NbtError : public std::runtime_error {
   public:
    NbtError(ErrorKind kind, std::size_t offset, std::string detail);

    ErrorKind kind() const { return _kind; }
    std::size_t offset() const { return _offset; }
    std::string path() const;
    const std::string& detail() const { return _detail; }

    const char* what() const noexcept override { return _message.c_str(); }

    void prepend_name(std::string_view name);
    void prepend_index(std::size_t index);

   private:
    struct PathSegment {
        std::string text;
        bool is_index = false;
    };

    void rebuild_message();

    ErrorKind _kind;
    std::size_t _offset;
    std::string _detail;
    std::vector<PathSegment> _segments;
    std::string _message;
};

}  // namespace nbt2dict::nbt
