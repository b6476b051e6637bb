/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ykr::jos {
// +-100,000,000 days around the epoch, the range of an ECMAScript time value.
constexpr std::int64_t kMaxTimestampMs = 8'640'000'000'000'000;

/**
 * Milliseconds since 1970-01-01T00:00:00Z as "YYYY-MM-DDTHH:MM:SS.sssZ". Years outside
 * 0000..9999 use the expanded "+YYYYYY" / "-YYYYYY" form. Returns nullopt when the value
 * is beyond kMaxTimestampMs in either direction.
 */
std::optional<std::string> format_iso8601_ms(std::int64_t ms);
}  // namespace ykr::jos
