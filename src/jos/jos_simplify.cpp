/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jos/jos_simplify.h"
#include "jos/jos_errors.h"

#include <algorithm>
#include <string>

namespace ykr::jos {
namespace {
[[noreturn]] void throw_too_deep(Handle handle, std::size_t max_depth) {
    throw ProtocolError(
        "Value of handle " + to_hex(static_cast<std::uint32_t>(handle), 8) + " nests deeper than "
        + std::to_string(max_depth) + " levels"
    );
}
}  // namespace

nlohmann::ordered_json
simplify(const HandleRegistry& registry, const Reference& ref, std::size_t max_depth) {
    if (const auto* s = std::get_if<StringRecord>(&ref)) {
        return s->value;
    }
    if (const auto* a = std::get_if<ArrayRecord>(&ref)) {
        if (max_depth == 0) {
            throw_too_deep(a->handle, max_depth);
        }
        nlohmann::ordered_json out = nlohmann::ordered_json::array();
        for (const auto& element : a->elements) {
            out.push_back(simplify(registry, element, max_depth - 1));
        }
        return out;
    }
    if (const auto* o = std::get_if<ObjectRecord>(&ref)) {
        if (o->depth > max_depth) {
            throw_too_deep(o->handle, max_depth);
        }
        if (o->timestamp.has_value()) {
            return *o->timestamp;
        }
        return o->fields;
    }
    const auto& record = std::get<ClassDescRecord>(ref);
    if (max_depth == 0) {
        throw_too_deep(record.handle, max_depth);
    }
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    out["className"] = record.desc.class_name;
    out["serialVersionUID"] = std::to_string(record.desc.serial_version_uid);
    return out;
}

nlohmann::ordered_json
simplify(const HandleRegistry& registry, std::optional<Handle> handle, std::size_t max_depth) {
    if (!handle.has_value()) {
        return nullptr;
    }
    return simplify(registry, registry.resolve(*handle), max_depth);
}

nlohmann::ordered_json
simplify_content(const HandleRegistry& registry, const Content& content, std::size_t max_depth) {
    if (const auto* block = std::get_if<BlockData>(&content)) {
        return nlohmann::ordered_json::binary(*block);
    }
    if (const auto* handle = std::get_if<Handle>(&content)) {
        return simplify(registry, registry.resolve(*handle), max_depth);
    }
    return nullptr;
}

std::size_t json_depth(const nlohmann::ordered_json& value) {
    if (!value.is_array() && !value.is_object()) {
        return 0;
    }
    std::size_t deepest = 0;
    for (const auto& child : value) {
        deepest = std::max(deepest, json_depth(child));
    }
    return deepest + 1;
}
}  // namespace ykr::jos
