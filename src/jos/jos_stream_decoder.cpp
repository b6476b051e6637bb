/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jos/jos_stream_decoder.h"
#include "jos/jos_errors.h"
#include "jos/jos_simplify.h"
#include "jos/jos_timestamp.h"
#include "utils/log.h"

#include <string>

namespace ykr::jos {
namespace {
std::string at_offset(std::size_t offset) {
    return " at offset " + to_hex(offset, 4);
}

[[noreturn]] void throw_unsupported(std::uint8_t tag, std::size_t offset) {
    throw UnsupportedError(std::string(tag_name(tag)) + at_offset(offset) + " is not supported");
}
}  // namespace

StreamDecoder::NestingGuard::NestingGuard(StreamDecoder& decoder) : _decoder(decoder) {
    if (_decoder._depth >= _decoder._options.max_depth) {
        throw ProtocolError(
            "Nesting deeper than " + std::to_string(_decoder._options.max_depth) + " levels"
            + at_offset(_decoder._reader.position())
        );
    }
    _decoder._depth++;
}

StreamDecoder::NestingGuard::~NestingGuard() {
    _decoder._depth--;
}

StreamDecoder::StreamDecoder(std::span<const std::uint8_t> bytes, DecodeOptions options)
    : _options(options), _reader(bytes), _registry(), _resolver(_reader, _registry, *this) {}

void StreamDecoder::read_header() {
    const std::uint16_t magic = _reader.read_u16();
    if (magic != kStreamMagic) {
        throw FormatError(
            "Not a serialization stream (magic " + to_hex(magic, 4) + ", expected "
            + to_hex(kStreamMagic, 4) + ")"
        );
    }
    _version = _reader.read_u16();
    YKR_LOG_DEBUG(
        _version != kStreamVersion && _options.debug, "    stream version %u (expected %u)",
        _version, kStreamVersion
    );
}

nlohmann::ordered_json StreamDecoder::decode() {
    read_header();
    nlohmann::ordered_json contents = nlohmann::ordered_json::array();
    while (!_reader.eof()) {
        YKR_LOG_DEBUG(
            _options.debug, "    content=%zu tag=%s offset=%zu", contents.size(),
            std::string(tag_name(_reader.peek_u8())).c_str(), _reader.position()
        );
        contents.push_back(simplify_content(_registry, decode_content(), _options.max_depth));
    }
    return contents;
}

Content StreamDecoder::decode_content() {
    switch (static_cast<Tag>(_reader.peek_u8())) {
        case Tag::BlockData: {
            _reader.read_u8();
            const std::uint8_t size = _reader.read_u8();
            return _reader.read_bytes(size);
        }
        case Tag::BlockDataLong: {
            const std::size_t offset = _reader.position();
            _reader.read_u8();
            const std::int32_t size = _reader.read_i32();
            if (size < 0) {
                throw ProtocolError(
                    "Negative TC_BLOCKDATALONG size " + std::to_string(size) + at_offset(offset)
                );
            }
            return _reader.read_bytes(static_cast<std::size_t>(size));
        }
        default: {
            const auto handle = decode_object();
            if (handle.has_value()) {
                return *handle;
            }
            return std::monostate{};
        }
    }
}

std::optional<Handle> StreamDecoder::decode_object() {
    const NestingGuard guard(*this);
    const std::size_t offset = _reader.position();
    const std::uint8_t tag = _reader.read_u8();
    switch (static_cast<Tag>(tag)) {
        case Tag::Null:
            return std::nullopt;
        case Tag::Reference: {
            const Handle handle = _reader.read_i32();
            return handle_of(_registry.resolve(handle));
        }
        case Tag::ClassDesc:
        case Tag::ProxyClassDesc:
            return _resolver.resolve(tag);
        case Tag::String:
            return decode_new_string();
        case Tag::Array:
            return decode_new_array();
        case Tag::Object:
            return decode_new_object();
        case Tag::LongString:
        case Tag::Class:
        case Tag::Exception:
        case Tag::Enum:
        case Tag::Reset:
            throw_unsupported(tag, offset);
        case Tag::BlockData:
        case Tag::BlockDataLong:
        case Tag::EndBlockData:
            throw ProtocolError(
                "Unexpected " + std::string(tag_name(tag)) + " where an object was expected"
                + at_offset(offset)
            );
        default:
            throw ProtocolError("Unknown tc " + to_hex(tag, 2) + at_offset(offset));
    }
}

std::vector<Content> StreamDecoder::decode_annotations() {
    std::vector<Content> out;
    while (_reader.peek_u8() != tag_byte(Tag::EndBlockData)) {
        out.push_back(decode_content());
    }
    _reader.read_u8();  // TC_ENDBLOCKDATA
    return out;
}

Handle StreamDecoder::decode_new_string() {
    const Handle handle = _registry.allocate();
    std::string value = _reader.read_utf();
    _registry.store(handle, StringRecord{handle, std::move(value)});
    return handle;
}

Handle StreamDecoder::decode_new_array() {
    const std::size_t offset = _reader.position() - 1;
    const auto desc_handle = _resolver.resolve();
    if (!desc_handle.has_value()) {
        throw ProtocolError("TC_ARRAY with a null classDesc" + at_offset(offset));
    }
    const Handle handle = _registry.allocate();
    const std::int32_t size = _reader.read_i32();
    if (size < 0) {
        throw ProtocolError("Negative array size " + std::to_string(size) + at_offset(offset));
    }

    ArrayRecord array{};
    array.handle = handle;
    array.class_desc = *desc_handle;
    // Elements are full tagged records, even for primitive component types.
    for (std::int32_t i = 0; i < size; i++) {
        array.elements.push_back(decode_object());
    }
    _registry.store(handle, std::move(array));
    return handle;
}

Handle StreamDecoder::decode_new_object() {
    const std::size_t offset = _reader.position() - 1;
    const auto desc_handle = _resolver.resolve();
    if (!desc_handle.has_value()) {
        throw ProtocolError("TC_OBJECT with a null classDesc" + at_offset(offset));
    }
    const Handle handle = _registry.allocate();
    const ClassDesc& desc = _registry.resolve_class_desc(*desc_handle).desc;

    ObjectRecord object{};
    object.handle = handle;
    object.class_desc = *desc_handle;
    if (desc.has_flag(kScSerializable)) {
        for (const auto& field : flatten_fields(_registry, desc)) {
            object.fields[field.name] = decode_field_value(field);
        }
        if (desc.has_flag(kScWriteMethod)) {
            object.annotations = decode_annotations();
        }
    } else if (desc.has_flag(kScExternalizable)) {
        throw UnsupportedError(
            "Externalizable class " + desc.class_name + at_offset(offset) + " is not supported"
        );
    }

    if (desc.class_name == kDateClassName) {
        object.timestamp = decode_date(object.annotations);
    }
    object.depth = object.timestamp.has_value() ? 0 : json_depth(object.fields);
    YKR_LOG_DEBUG(
        _options.debug, "    object handle=%s class=%s fields=%zu",
        to_hex(static_cast<std::uint32_t>(handle), 8).c_str(), desc.class_name.c_str(),
        object.fields.size()
    );
    _registry.store(handle, std::move(object));
    return handle;
}

nlohmann::ordered_json StreamDecoder::decode_field_value(const FieldDesc& field) {
    switch (field.kind) {
        case FieldDesc::Kind::Primitive:
            return decode_primitive(field.type_code);
        case FieldDesc::Kind::Array:
        case FieldDesc::Kind::Object:
            // The owning object accounts for one level.
            return simplify(_registry, decode_object(), _options.max_depth - 1);
    }
    throw ProtocolError("Invalid descriptor for field '" + field.name + "'");
}

nlohmann::ordered_json StreamDecoder::decode_primitive(char type_code) {
    switch (type_code) {
        case kTypeByte:
            return _reader.read_i8();
        case kTypeChar:
            return _reader.read_u16();
        case kTypeDouble:
            return _reader.read_f64();
        case kTypeFloat:
            return _reader.read_f32();
        case kTypeInteger:
            return _reader.read_i32();
        case kTypeLong: {
            const std::int64_t v = _reader.read_i64();
            if (_options.longs_as_strings) {
                return std::to_string(v);
            }
            return v;
        }
        case kTypeShort:
            return _reader.read_i16();
        case kTypeBoolean:
            return _reader.read_u8() == 1;
        default:
            throw ProtocolError(
                "Unknown typecode " + to_hex(static_cast<std::uint8_t>(type_code), 2)
                + at_offset(_reader.position())
            );
    }
}

nlohmann::ordered_json StreamDecoder::decode_date(const std::vector<Content>& annotations) const {
    const BlockData* block = nullptr;
    if (annotations.size() == 1) {
        block = std::get_if<BlockData>(&annotations.front());
    }
    if (block == nullptr || block->size() < 8) {
        throw ProtocolError(
            std::string(kDateClassName) + " must carry one block of at least 8 bytes, got "
            + std::to_string(annotations.size()) + " annotation(s)"
        );
    }
    ByteReader br(*block);
    const std::uint64_t ms = br.read_u64();
    if (ms > static_cast<std::uint64_t>(kMaxTimestampMs)) {
        return nullptr;
    }
    const auto iso = format_iso8601_ms(static_cast<std::int64_t>(ms));
    if (!iso.has_value()) {
        return nullptr;
    }
    return *iso;
}

nlohmann::ordered_json
decode_stream(std::span<const std::uint8_t> bytes, const DecodeOptions& options) {
    StreamDecoder decoder(bytes, options);
    return decoder.decode();
}

}  // namespace ykr::jos
