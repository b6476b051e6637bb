/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jos/jos_errors.h"
#include "jos/jos_utf8.h"

#include <bit>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ykr::jos {
// Big-endian cursor over one stream buffer.
class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data) : _data(data), _pos(0) {}

    std::size_t position() const { return _pos; }
    std::size_t size() const { return _data.size(); }
    std::size_t remaining() const { return _data.size() - _pos; }
    bool eof() const { return _pos >= _data.size(); }

    std::uint8_t peek_u8() const {
        require(1);
        return _data[_pos];
    }

    std::uint8_t read_u8() {
        require(1);
        return _data[_pos++];
    }

    std::int8_t read_i8() { return static_cast<std::int8_t>(read_u8()); }

    std::vector<std::uint8_t> read_bytes(std::size_t count) {
        require(count);
        const auto first = _data.begin() + static_cast<std::ptrdiff_t>(_pos);
        std::vector<std::uint8_t> out(first, first + static_cast<std::ptrdiff_t>(count));
        _pos += count;
        return out;
    }

    std::uint16_t read_u16() { return static_cast<std::uint16_t>(read_be(2)); }
    std::int16_t read_i16() { return static_cast<std::int16_t>(read_u16()); }
    std::uint32_t read_u32() { return static_cast<std::uint32_t>(read_be(4)); }
    std::int32_t read_i32() { return static_cast<std::int32_t>(read_u32()); }
    std::uint64_t read_u64() { return read_be(8); }
    std::int64_t read_i64() { return static_cast<std::int64_t>(read_u64()); }

    float read_f32() { return std::bit_cast<float>(read_u32()); }
    double read_f64() { return std::bit_cast<double>(read_u64()); }

    // u16 byte length followed by that many bytes of modified UTF-8; returns standard UTF-8.
    std::string read_utf() {
        const std::uint16_t len = read_u16();
        require(len);
        std::string out = decode_modified_utf8(_data.subspan(_pos, len));
        _pos += len;
        return out;
    }

   private:
    void require(std::size_t count) const {
        if (count > remaining()) {
            throw BoundsError(
                "Unexpected EOF at offset " + to_hex(_pos, 4) + ": need " + std::to_string(count)
                + " byte(s), " + std::to_string(remaining()) + " left"
            );
        }
    }

    std::uint64_t read_be(int width) {
        require(static_cast<std::size_t>(width));
        std::uint64_t v = 0;
        for (int i = 0; i < width; i++) {
            v = (v << 8) | static_cast<std::uint64_t>(_data[_pos++]);
        }
        return v;
    }

    std::span<const std::uint8_t> _data;
    std::size_t _pos;
};
}  // namespace ykr::jos
