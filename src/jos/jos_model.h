/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jos/jos_constants.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace ykr::jos {
using Handle = std::int32_t;
using BlockData = std::vector<std::uint8_t>;

// One top-level stream item: TC_NULL, a record handle, or a run of block data.
using Content = std::variant<std::monostate, Handle, BlockData>;

struct FieldDesc {
    enum class Kind { Primitive, Array, Object };

    Kind kind = Kind::Primitive;
    char type_code = 0;
    std::string name;
    // Field type signature ("[I", "Ljava/lang/String;") for array and object fields.
    std::string class_name;
    std::optional<Handle> class_name_handle;
};

struct ClassDesc {
    std::string class_name;
    std::int64_t serial_version_uid = 0;
    std::uint8_t flags = 0;
    std::vector<FieldDesc> fields;
    std::vector<Content> annotations;
    std::optional<Handle> super_class;

    bool has_flag(std::uint8_t flag) const { return (flags & flag) != 0; }
};

struct StringRecord {
    Handle handle = 0;
    std::string value;
};

struct ClassDescRecord {
    Handle handle = 0;
    ClassDesc desc;
};

struct ObjectRecord {
    Handle handle = 0;
    Handle class_desc = 0;
    nlohmann::ordered_json fields = nlohmann::ordered_json::object();
    std::vector<Content> annotations;
    // Set for java.util.Date; exported instead of the field map.
    std::optional<nlohmann::ordered_json> timestamp;
    // Nesting depth of the exported value.
    std::size_t depth = 0;
};

struct ArrayRecord {
    Handle handle = 0;
    Handle class_desc = 0;
    std::vector<std::optional<Handle>> elements;
};

using Reference = std::variant<StringRecord, ClassDescRecord, ObjectRecord, ArrayRecord>;

inline Handle handle_of(const Reference& ref) {
    return std::visit([](const auto& r) { return r.handle; }, ref);
}

const char* reference_kind(const Reference& ref);
}  // namespace ykr::jos
