/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jos/jos_timestamp.h"

#include <cstdio>

namespace ykr::jos {
namespace {
constexpr std::int64_t kMsPerDay = 86'400'000;

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        q--;
    }
    return q;
}

// Proleptic Gregorian date from days since 1970-01-01 (H. Hinnant's civil_from_days).
void civil_from_days(std::int64_t days, std::int64_t& y, int& m, int& d) {
    const std::int64_t z = days + 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = yoe + era * 400 + (m <= 2 ? 1 : 0);
}
}  // namespace

std::optional<std::string> format_iso8601_ms(std::int64_t ms) {
    if (ms > kMaxTimestampMs || ms < -kMaxTimestampMs) {
        return std::nullopt;
    }
    const std::int64_t days = floor_div(ms, kMsPerDay);
    const std::int64_t ms_of_day = ms - days * kMsPerDay;

    std::int64_t year = 0;
    int month = 0;
    int day = 0;
    civil_from_days(days, year, month, day);

    const int hour = static_cast<int>(ms_of_day / 3'600'000);
    const int minute = static_cast<int>((ms_of_day / 60'000) % 60);
    const int second = static_cast<int>((ms_of_day / 1000) % 60);
    const int millis = static_cast<int>(ms_of_day % 1000);

    char year_buf[16];
    if (year >= 0 && year <= 9999) {
        std::snprintf(year_buf, sizeof(year_buf), "%04lld", static_cast<long long>(year));
    } else {
        std::snprintf(
            year_buf, sizeof(year_buf), "%c%06lld", year < 0 ? '-' : '+',
            static_cast<long long>(year < 0 ? -year : year)
        );
    }

    char buf[48];
    std::snprintf(
        buf, sizeof(buf), "%s-%02d-%02dT%02d:%02d:%02d.%03dZ", year_buf, month, day, hour, minute,
        second, millis
    );
    return std::string(buf);
}
}  // namespace ykr::jos
