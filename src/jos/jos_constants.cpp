/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "jos/jos_constants.h"

namespace ykr::jos {
std::string_view tag_name(std::uint8_t tag) {
    switch (static_cast<Tag>(tag)) {
        case Tag::Null:
            return "TC_NULL";
        case Tag::Reference:
            return "TC_REFERENCE";
        case Tag::ClassDesc:
            return "TC_CLASSDESC";
        case Tag::Object:
            return "TC_OBJECT";
        case Tag::String:
            return "TC_STRING";
        case Tag::Array:
            return "TC_ARRAY";
        case Tag::Class:
            return "TC_CLASS";
        case Tag::BlockData:
            return "TC_BLOCKDATA";
        case Tag::EndBlockData:
            return "TC_ENDBLOCKDATA";
        case Tag::Reset:
            return "TC_RESET";
        case Tag::BlockDataLong:
            return "TC_BLOCKDATALONG";
        case Tag::Exception:
            return "TC_EXCEPTION";
        case Tag::LongString:
            return "TC_LONGSTRING";
        case Tag::ProxyClassDesc:
            return "TC_PROXYCLASSDESC";
        case Tag::Enum:
            return "TC_ENUM";
        default:
            return "unknown";
    }
}
}  // namespace ykr::jos
