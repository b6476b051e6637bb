/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jos/jos_handle_registry.h"
#include "jos/jos_errors.h"

#include <limits>
#include <stdexcept>
#include <string>

namespace ykr::jos {
namespace {
std::string handle_hex(Handle handle) {
    return to_hex(static_cast<std::uint32_t>(handle), 8);
}
}  // namespace

const char* reference_kind(const Reference& ref) {
    switch (ref.index()) {
        case 0:
            return "string";
        case 1:
            return "class descriptor";
        case 2:
            return "object";
        case 3:
            return "array";
        default:
            return "unknown";
    }
}

Handle HandleRegistry::allocate() {
    if (_next == std::numeric_limits<Handle>::max()) {
        throw std::logic_error("Wire handle space exhausted");
    }
    return _next++;
}

void HandleRegistry::store(Handle handle, Reference ref) {
    if (handle < kBaseWireHandle || handle >= _next) {
        throw std::logic_error("Storing unallocated handle " + handle_hex(handle));
    }
    if (handle_of(ref) != handle) {
        throw std::logic_error("Record handle does not match slot " + handle_hex(handle));
    }
    const auto [it, inserted] = _records.emplace(handle, std::move(ref));
    if (!inserted) {
        throw std::logic_error("Handle stored twice: " + handle_hex(handle));
    }
}

bool HandleRegistry::is_pending(Handle handle) const {
    return handle >= kBaseWireHandle && handle < _next && !contains(handle);
}

const Reference& HandleRegistry::resolve(Handle handle) const {
    const auto it = _records.find(handle);
    if (it != _records.end()) {
        return it->second;
    }
    const std::string hex = handle_hex(handle);
    if (is_pending(handle)) {
        throw DanglingReferenceError(
            "Back-reference to handle " + hex + " whose record is still being decoded"
        );
    }
    throw DanglingReferenceError("Back-reference to unknown handle " + hex);
}

const StringRecord& HandleRegistry::resolve_string(Handle handle) const {
    const Reference& ref = resolve(handle);
    if (const auto* s = std::get_if<StringRecord>(&ref)) {
        return *s;
    }
    throw ProtocolError(
        "Handle " + handle_hex(handle) + " is a "
        + reference_kind(ref) + ", expected a string"
    );
}

const ClassDescRecord& HandleRegistry::resolve_class_desc(Handle handle) const {
    const Reference& ref = resolve(handle);
    if (const auto* c = std::get_if<ClassDescRecord>(&ref)) {
        return *c;
    }
    throw ProtocolError(
        "Handle " + handle_hex(handle) + " is a "
        + reference_kind(ref) + ", expected a class descriptor"
    );
}
}  // namespace ykr::jos
