/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "nbt/nbt_error.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace nbt2dict::nbt {
// Big-endian forward reader. Reads past the end throw UnexpectedEndOfInput.
class Cursor {
   public:
    explicit Cursor(std::span<const std::uint8_t> data) : _data(data), _pos(0) {}

    std::size_t position() const { return _pos; }
    std::size_t size() const { return _data.size(); }
    std::size_t remaining() const { return _data.size() - _pos; }
    bool at_end() const { return _pos >= _data.size(); }

    std::uint8_t peek_u8() const {
        require(1);
        return _data[_pos];
    }

    std::uint8_t read_u8() {
        require(1);
        return _data[_pos++];
    }

    std::int8_t read_i8() { return static_cast<std::int8_t>(read_u8()); }

    std::uint16_t read_u16() { return static_cast<std::uint16_t>(read_be(2)); }
    std::int16_t read_i16() { return static_cast<std::int16_t>(read_u16()); }

    std::uint32_t read_u32() { return static_cast<std::uint32_t>(read_be(4)); }
    std::int32_t read_i32() { return static_cast<std::int32_t>(read_u32()); }

    std::int64_t read_i64() { return static_cast<std::int64_t>(read_be(8)); }

    float read_f32() {
        const std::uint32_t bits = read_u32();
        float out;
        std::memcpy(&out, &bits, sizeof(out));
        return out;
    }

    double read_f64() {
        const std::uint64_t bits = read_be(8);
        double out;
        std::memcpy(&out, &bits, sizeof(out));
        return out;
    }

    std::vector<std::uint8_t> read_bytes(std::size_t n) {
        require(n);
        std::vector<std::uint8_t> out(_data.data() + _pos, _data.data() + _pos + n);
        _pos += n;
        return out;
    }

    // u16 byte count followed by that many raw bytes.
    std::string read_string() {
        const std::uint16_t len = read_u16();
        require(len);
        std::string out(reinterpret_cast<const char*>(_data.data() + _pos), len);
        _pos += len;
        return out;
    }

   private:
    void require(std::size_t n) const {
        if (n > remaining()) {
            fail(n);
        }
    }

    [[noreturn]] void fail(std::size_t wanted) const {
        throw NbtError(
            ErrorKind::UnexpectedEndOfInput, _pos,
            "needed " + std::to_string(wanted) + " bytes, " + std::to_string(remaining())
                + " remaining"
        );
    }

    std::uint64_t read_be(std::size_t width) {
        require(width);
        std::uint64_t v = 0;
        for (std::size_t i = 0; i < width; i++) {
            v = (v << 8) | _data[_pos + i];
        }
        _pos += width;
        return v;
    }

    std::span<const std::uint8_t> _data;
    std::size_t _pos;
};
}  // namespace nbt2dict::nbt
