/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jos/jos_class_desc.h"
#include "jos/jos_errors.h"
#include "jos/jos_stream_decoder.h"

#include <string>

namespace ykr::jos {
std::optional<Handle> ClassDescResolver::resolve() {
    return resolve(_reader.read_u8());
}

std::optional<Handle> ClassDescResolver::resolve(std::uint8_t tag) {
    switch (static_cast<Tag>(tag)) {
        case Tag::Null:
            return std::nullopt;
        case Tag::Reference: {
            const Handle handle = _reader.read_i32();
            return _registry.resolve_class_desc(handle).handle;
        }
        case Tag::ClassDesc:
            return read_new_class_desc();
        case Tag::ProxyClassDesc:
            throw UnsupportedError(
                "TC_PROXYCLASSDESC at offset " + to_hex(_reader.position() - 1, 4)
                + " is not supported"
            );
        default:
            throw ProtocolError(
                "Unexpected " + std::string(tag_name(tag)) + " tag " + to_hex(tag, 2)
                + " for classDesc at offset " + to_hex(_reader.position() - 1, 4)
            );
    }
}

Handle ClassDescResolver::read_new_class_desc() {
    // Superclass descriptors follow inline, one level deeper each.
    const StreamDecoder::NestingGuard guard(_decoder);
    ClassDesc desc{};
    desc.class_name = _reader.read_utf();
    desc.serial_version_uid = _reader.read_i64();
    const Handle handle = _registry.allocate();

    // classDescInfo
    desc.flags = _reader.read_u8();
    const std::uint16_t field_count = _reader.read_u16();
    desc.fields.reserve(field_count);
    for (std::uint16_t i = 0; i < field_count; i++) {
        desc.fields.push_back(read_field_desc());
    }
    desc.annotations = _decoder.decode_annotations();
    desc.super_class = resolve();

    _registry.store(handle, ClassDescRecord{handle, std::move(desc)});
    return handle;
}

FieldDesc ClassDescResolver::read_field_desc() {
    const std::size_t offset = _reader.position();
    FieldDesc field{};
    field.type_code = static_cast<char>(_reader.read_u8());
    switch (field.type_code) {
        case kTypeByte:
        case kTypeChar:
        case kTypeDouble:
        case kTypeFloat:
        case kTypeInteger:
        case kTypeLong:
        case kTypeShort:
        case kTypeBoolean:
            field.kind = FieldDesc::Kind::Primitive;
            field.name = _reader.read_utf();
            return field;
        case kTypeArray:
        case kTypeObject: {
            field.kind = field.type_code == kTypeArray ? FieldDesc::Kind::Array
                                                       : FieldDesc::Kind::Object;
            field.name = _reader.read_utf();
            const auto name_handle = _decoder.decode_object();
            if (!name_handle.has_value()) {
                throw ProtocolError("Field '" + field.name + "' has a null type name");
            }
            field.class_name = _registry.resolve_string(*name_handle).value;
            field.class_name_handle = name_handle;
            return field;
        }
        default:
            throw ProtocolError(
                "Unknown field typecode " + to_hex(static_cast<std::uint8_t>(field.type_code), 2)
                + " at offset " + to_hex(offset, 4)
            );
    }
}

std::vector<FieldDesc> flatten_fields(const HandleRegistry& registry, const ClassDesc& desc) {
    // Superclass chains built from back-references can be arbitrarily long.
    std::vector<const ClassDesc*> chain;
    for (const ClassDesc* d = &desc; d != nullptr;) {
        chain.push_back(d);
        d = d->super_class.has_value() ? &registry.resolve_class_desc(*d->super_class).desc
                                       : nullptr;
    }

    std::vector<FieldDesc> out;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        out.insert(out.end(), (*it)->fields.begin(), (*it)->fields.end());
    }
    return out;
}
}  // namespace ykr::jos
