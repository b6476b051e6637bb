/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jos/jos_errors.h"

namespace ykr::jos {
std::string to_hex(std::uint64_t v, int digits) {
    static const char hexdig[] = "0123456789ABCDEF";
    if (digits < 1) {
        digits = 1;
    }
    if (digits > 16) {
        digits = 16;
    }
    std::string out;
    out.resize(static_cast<std::size_t>(digits) + 2);
    out[0] = '0';
    out[1] = 'x';
    for (int i = 0; i < digits; i++) {
        const int shift = (digits - 1 - i) * 4;
        out[2 + static_cast<std::size_t>(i)] = hexdig[(v >> shift) & 0xFu];
    }
    return out;
}
}  // namespace ykr::jos
