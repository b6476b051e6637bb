/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jos/jos_constants.h"
#include "jos/jos_handle_registry.h"
#include "jos/jos_model.h"

#include <cstddef>
#include <optional>

#include <nlohmann/json.hpp>

namespace ykr::jos {
// Results nest at most max_depth levels; deeper values throw ProtocolError.
nlohmann::ordered_json simplify(
    const HandleRegistry& registry,
    const Reference& ref,
    std::size_t max_depth = kDefaultMaxDepth
);
nlohmann::ordered_json simplify(
    const HandleRegistry& registry,
    std::optional<Handle> handle,
    std::size_t max_depth = kDefaultMaxDepth
);
// Block data passes through as a binary value.
nlohmann::ordered_json simplify_content(
    const HandleRegistry& registry,
    const Content& content,
    std::size_t max_depth = kDefaultMaxDepth
);

// Array and object levels; scalars are 0.
std::size_t json_depth(const nlohmann::ordered_json& value);
}  // namespace ykr::jos
