#pragma once

#include "jos/jos_constants.h"
#include "jos/jos_model.h"

#include <bit>
#include <cstdint>
#include <string_view>
#include <vector>

namespace ykr::test {
// Assembles serialization streams byte by byte for the decoder tests.
class StreamBuilder {
   public:
    StreamBuilder& header(
        std::uint16_t magic = jos::kStreamMagic,
        std::uint16_t version = jos::kStreamVersion
    ) {
        return u16(magic).u16(version);
    }

    StreamBuilder& u8(std::uint8_t v) {
        _out.push_back(v);
        return *this;
    }
    StreamBuilder& u16(std::uint16_t v) { return be(v, 2); }
    StreamBuilder& u32(std::uint32_t v) { return be(v, 4); }
    StreamBuilder& u64(std::uint64_t v) { return be(v, 8); }
    StreamBuilder& i32(std::int32_t v) { return u32(static_cast<std::uint32_t>(v)); }
    StreamBuilder& i64(std::int64_t v) { return u64(static_cast<std::uint64_t>(v)); }
    StreamBuilder& f32(float v) { return u32(std::bit_cast<std::uint32_t>(v)); }
    StreamBuilder& f64(double v) { return u64(std::bit_cast<std::uint64_t>(v)); }

    StreamBuilder& utf(std::string_view s) {
        u16(static_cast<std::uint16_t>(s.size()));
        _out.insert(_out.end(), s.begin(), s.end());
        return *this;
    }

    StreamBuilder& raw(const std::vector<std::uint8_t>& bytes) {
        _out.insert(_out.end(), bytes.begin(), bytes.end());
        return *this;
    }

    StreamBuilder& tag(jos::Tag t) { return u8(jos::tag_byte(t)); }
    StreamBuilder& null() { return tag(jos::Tag::Null); }
    StreamBuilder& end_block() { return tag(jos::Tag::EndBlockData); }
    StreamBuilder& string(std::string_view s) { return tag(jos::Tag::String).utf(s); }
    StreamBuilder& ref(jos::Handle h) { return tag(jos::Tag::Reference).i32(h); }

    StreamBuilder& block(const std::vector<std::uint8_t>& bytes) {
        return tag(jos::Tag::BlockData).u8(static_cast<std::uint8_t>(bytes.size())).raw(bytes);
    }

    StreamBuilder& block_long(const std::vector<std::uint8_t>& bytes) {
        return tag(jos::Tag::BlockDataLong).i32(static_cast<std::int32_t>(bytes.size())).raw(bytes);
    }

    // TC_CLASSDESC up to and including the field count; fields follow.
    StreamBuilder& class_desc(
        std::string_view name,
        std::int64_t uid,
        std::uint8_t flags,
        std::uint16_t field_count
    ) {
        return tag(jos::Tag::ClassDesc).utf(name).i64(uid).u8(flags).u16(field_count);
    }

    StreamBuilder& primitive_field(char type_code, std::string_view name) {
        return u8(static_cast<std::uint8_t>(type_code)).utf(name);
    }

    // Object or array field whose type name is written as a new TC_STRING.
    StreamBuilder& object_field(char type_code, std::string_view name, std::string_view type_name) {
        return u8(static_cast<std::uint8_t>(type_code)).utf(name).string(type_name);
    }

    const std::vector<std::uint8_t>& data() const { return _out; }

   private:
    StreamBuilder& be(std::uint64_t v, int width) {
        for (int i = width - 1; i >= 0; i--) {
            _out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
        }
        return *this;
    }

    std::vector<std::uint8_t> _out;
};

constexpr jos::Handle handle(int n) {
    return jos::kBaseWireHandle + n;
}
}  // namespace ykr::test
