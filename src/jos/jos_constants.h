/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ykr::jos {
// Java Object Serialization Stream Protocol, section 6.4.2.
constexpr std::uint16_t kStreamMagic = 0xACED;
constexpr std::uint16_t kStreamVersion = 5;
constexpr std::int32_t kBaseWireHandle = 0x7E0000;

// Nesting limit; keeps recursion well inside a default thread stack.
constexpr std::size_t kDefaultMaxDepth = 512;

enum class Tag : std::uint8_t {
    Null = 0x70,
    Reference = 0x71,
    ClassDesc = 0x72,
    Object = 0x73,
    String = 0x74,
    Array = 0x75,
    Class = 0x76,
    BlockData = 0x77,
    EndBlockData = 0x78,
    Reset = 0x79,
    BlockDataLong = 0x7A,
    Exception = 0x7B,
    LongString = 0x7C,
    ProxyClassDesc = 0x7D,
    Enum = 0x7E,
};

constexpr std::uint8_t kScWriteMethod = 0x01;  // if SC_SERIALIZABLE
constexpr std::uint8_t kScSerializable = 0x02;
constexpr std::uint8_t kScExternalizable = 0x04;
constexpr std::uint8_t kScBlockData = 0x08;  // if SC_EXTERNALIZABLE
constexpr std::uint8_t kScEnum = 0x10;

constexpr char kTypeByte = 'B';
constexpr char kTypeChar = 'C';
constexpr char kTypeDouble = 'D';
constexpr char kTypeFloat = 'F';
constexpr char kTypeInteger = 'I';
constexpr char kTypeLong = 'J';
constexpr char kTypeShort = 'S';
constexpr char kTypeBoolean = 'Z';
constexpr char kTypeArray = '[';
constexpr char kTypeObject = 'L';

constexpr std::string_view kDateClassName = "java.util.Date";

constexpr std::uint8_t tag_byte(Tag tag) { return static_cast<std::uint8_t>(tag); }

std::string_view tag_name(std::uint8_t tag);
}  // namespace ykr::jos
