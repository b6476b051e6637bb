/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jos/jos_utf8.h"

namespace ykr::jos {
namespace {
constexpr std::uint32_t kReplacementChar = 0xFFFD;

bool is_cont(std::uint8_t b) {
    return (b & 0xC0u) == 0x80u;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else {
        out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
}

// Reads one 3-byte unit at i; returns false if the bytes are not a 3-byte form.
bool read_unit3(std::span<const std::uint8_t> in, std::size_t i, std::uint32_t& unit) {
    if (i + 2 >= in.size() || (in[i] & 0xF0u) != 0xE0u || !is_cont(in[i + 1])
        || !is_cont(in[i + 2])) {
        return false;
    }
    unit = ((in[i] & 0x0Fu) << 12) | ((in[i + 1] & 0x3Fu) << 6) | (in[i + 2] & 0x3Fu);
    return true;
}
}  // namespace

std::string decode_modified_utf8(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        const std::uint8_t b = bytes[i];
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
            i++;
            continue;
        }

        // 2-byte form, including C0 80 for NUL.
        if ((b & 0xE0u) == 0xC0u) {
            if (i + 1 < bytes.size() && is_cont(bytes[i + 1])) {
                append_utf8(out, ((b & 0x1Fu) << 6) | (bytes[i + 1] & 0x3Fu));
                i += 2;
            } else {
                append_utf8(out, kReplacementChar);
                i++;
            }
            continue;
        }

        std::uint32_t unit = 0;
        if (read_unit3(bytes, i, unit)) {
            if (unit >= 0xD800 && unit <= 0xDBFF) {
                std::uint32_t low = 0;
                if (read_unit3(bytes, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
                    append_utf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                    i += 6;
                    continue;
                }
                append_utf8(out, kReplacementChar);
            } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
                append_utf8(out, kReplacementChar);
            } else {
                append_utf8(out, unit);
            }
            i += 3;
            continue;
        }

        if ((b & 0xF8u) == 0xF0u && i + 3 < bytes.size() && is_cont(bytes[i + 1])
            && is_cont(bytes[i + 2]) && is_cont(bytes[i + 3])) {
            const std::uint32_t cp = ((b & 0x07u) << 18) | ((bytes[i + 1] & 0x3Fu) << 12)
                                     | ((bytes[i + 2] & 0x3Fu) << 6) | (bytes[i + 3] & 0x3Fu);
            append_utf8(out, cp >= 0x10000 && cp <= 0x10FFFF ? cp : kReplacementChar);
            i += 4;
            continue;
        }

        append_utf8(out, kReplacementChar);
        i++;
    }
    return out;
}
}  // namespace ykr::jos
