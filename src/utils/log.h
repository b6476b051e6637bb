/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace ykr::log {
// Progress lines. stdout unless redirected.
void info(const char* fmt, ...);
// Recoverable problems ("[WARN] ", stderr), e.g. records skipped under --keep-going.
void warn(const char* fmt, ...);
// Failures that abort a file or the run ("[ERROR] ", stderr).
void error(const char* fmt, ...);

// --stdout reserves stdout for the decoded document.
void set_info_to_stderr(bool enabled);
}  // namespace ykr::log

#define YKR_LOG_INFO(fmt, ...) ::ykr::log::info(fmt, ##__VA_ARGS__)
#define YKR_LOG_WARN(fmt, ...) ::ykr::log::warn(fmt, ##__VA_ARGS__)
#define YKR_LOG_ERROR(fmt, ...) ::ykr::log::error(fmt, ##__VA_ARGS__)
// Decoder traces; arguments are only evaluated when `enabled` (a --debug option) is set.
#define YKR_LOG_DEBUG(enabled, fmt, ...)                  \
    do {                                                  \
        if (enabled) {                                    \
            ::ykr::log::info(fmt, ##__VA_ARGS__);         \
        }                                                 \
    } while (0)
