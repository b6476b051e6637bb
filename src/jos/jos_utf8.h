/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace ykr::jos {
/**
 * Converts Java's modified UTF-8 to standard UTF-8:
 *   C0 80                      -> U+0000
 *   3-byte surrogate pair      -> one 4-byte sequence
 * Lone surrogates and malformed or truncated sequences become U+FFFD, one per bad
 * lead byte. Standard 4-byte sequences are passed through.
 */
std::string decode_modified_utf8(std::span<const std::uint8_t> bytes);
}  // namespace ykr::jos
