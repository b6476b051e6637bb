/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ykr::jos {
/**
 * Base of every failure raised while decoding one stream. A decode never recovers from
 * one of these; the whole buffer is rejected.
 */
class DecodeError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// Stream header magic mismatch.
class FormatError : public DecodeError {
   public:
    using DecodeError::DecodeError;
};

// Unrecognized tag or type code, or a back-reference of the wrong record kind.
class ProtocolError : public DecodeError {
   public:
    using DecodeError::DecodeError;
};

class DanglingReferenceError : public DecodeError {
   public:
    using DecodeError::DecodeError;
};

// Recognized by the decoder but not implemented.
class UnsupportedError : public DecodeError {
   public:
    using DecodeError::DecodeError;
};

class BoundsError : public DecodeError {
   public:
    using DecodeError::DecodeError;
};

std::string to_hex(std::uint64_t v, int digits);
}  // namespace ykr::jos
