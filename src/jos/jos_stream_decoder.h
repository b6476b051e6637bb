/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "jos/jos_byte_reader.h"
#include "jos/jos_class_desc.h"
#include "jos/jos_handle_registry.h"
#include "jos/jos_model.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace ykr::jos {

struct DecodeOptions {
    // Emit 'J' fields as decimal strings so JSON consumers keep all 64 bits.
    bool longs_as_strings = true;
    bool debug = false;
    // Deepest nesting of objects, arrays and class descriptors, both on the wire and in
    // the exported JSON.
    std::size_t max_depth = kDefaultMaxDepth;
};

/**
 * One decode session over one serialized stream. Owns the cursor and the handle
 * registry; neither outlives the decoder.
 */
class StreamDecoder {
   public:
    explicit StreamDecoder(std::span<const std::uint8_t> bytes, DecodeOptions options = {});

    StreamDecoder(const StreamDecoder&) = delete;
    StreamDecoder& operator=(const StreamDecoder&) = delete;

    // Header, then every top-level content, simplified.
    nlohmann::ordered_json decode();

    void read_header();
    Content decode_content();
    std::optional<Handle> decode_object();
    // Contents up to and including TC_ENDBLOCKDATA.
    std::vector<Content> decode_annotations();

    // Scoped nesting level; throws ProtocolError past DecodeOptions::max_depth.
    class NestingGuard {
       public:
        explicit NestingGuard(StreamDecoder& decoder);
        ~NestingGuard();

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

       private:
        StreamDecoder& _decoder;
    };

    const HandleRegistry& registry() const { return _registry; }
    const ByteReader& reader() const { return _reader; }
    std::uint16_t stream_version() const { return _version; }

   private:
    Handle decode_new_string();
    Handle decode_new_array();
    Handle decode_new_object();
    nlohmann::ordered_json decode_field_value(const FieldDesc& field);
    nlohmann::ordered_json decode_primitive(char type_code);
    nlohmann::ordered_json decode_date(const std::vector<Content>& annotations) const;

    DecodeOptions _options;
    ByteReader _reader;
    HandleRegistry _registry;
    ClassDescResolver _resolver;
    std::uint16_t _version = 0;
    std::size_t _depth = 0;
};

nlohmann::ordered_json
decode_stream(std::span<const std::uint8_t> bytes, const DecodeOptions& options = {});

}  // namespace ykr::jos
