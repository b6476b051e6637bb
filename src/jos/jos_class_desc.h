/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jos/jos_byte_reader.h"
#include "jos/jos_handle_registry.h"
#include "jos/jos_model.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace ykr::jos {
class StreamDecoder;

/**
 * Decodes classDesc productions (TC_CLASSDESC, TC_REFERENCE, TC_NULL). Field type names
 * and class annotations are full stream contents, so those parts are read back through
 * the owning StreamDecoder.
 */
class ClassDescResolver {
   public:
    ClassDescResolver(ByteReader& reader, HandleRegistry& registry, StreamDecoder& decoder)
        : _reader(reader), _registry(registry), _decoder(decoder) {}

    // Returns the handle of the resolved descriptor, or nullopt for TC_NULL.
    std::optional<Handle> resolve();
    std::optional<Handle> resolve(std::uint8_t tag);

   private:
    Handle read_new_class_desc();
    FieldDesc read_field_desc();

    ByteReader& _reader;
    HandleRegistry& _registry;
    StreamDecoder& _decoder;
};

// Every serializable field of the class, most distant ancestor first.
std::vector<FieldDesc> flatten_fields(const HandleRegistry& registry, const ClassDesc& desc);
}  // namespace ykr::jos
