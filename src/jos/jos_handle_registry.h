/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jos/jos_model.h"

#include <cstddef>
#include <unordered_map>

namespace ykr::jos {
/**
 * Per-stream table of wire handles. Handles are handed out in order starting at
 * kBaseWireHandle and each one is written exactly once, after its record has been fully
 * decoded. Between allocate() and store() the handle is pending and cannot be resolved.
 */
class HandleRegistry {
   public:
    Handle allocate();
    void store(Handle handle, Reference ref);

    const Reference& resolve(Handle handle) const;
    const StringRecord& resolve_string(Handle handle) const;
    const ClassDescRecord& resolve_class_desc(Handle handle) const;

    bool contains(Handle handle) const { return _records.find(handle) != _records.end(); }
    bool is_pending(Handle handle) const;
    Handle next_handle() const { return _next; }
    std::size_t size() const { return _records.size(); }

   private:
    Handle _next = kBaseWireHandle;
    std::unordered_map<Handle, Reference> _records;
};
}  // namespace ykr::jos
