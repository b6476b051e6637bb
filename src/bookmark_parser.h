/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ykr::bookmarks {

struct ParserDecodeOptions {
    bool all_contents = false;
    bool keep_going = false;
    bool longs_as_strings = true;
    bool collect_metadata = true;
    bool debug = false;
};

struct DecodeResult {
    nlohmann::ordered_json records = nlohmann::ordered_json::array();
    nlohmann::ordered_json metadata = nlohmann::ordered_json::object();
    std::size_t failed_records = 0;
};

/**
 * Reads a Yukari bookmarks.json export:
 *   { "version": n, "SerializeEntity": [ { "_id", "Blob", "ReceiverId", "SaveDate" } ] }
 * and decodes each entity's Blob as a Java serialization stream.
 */
class BookmarkParser {
   public:
    static DecodeResult
    DecodeExportFile(const std::filesystem::path& path, const ParserDecodeOptions& opt = {});
    static DecodeResult DecodeExportJson(
        const nlohmann::json& doc,
        const ParserDecodeOptions& opt = {},
        std::string_view label = {}
    );

    // All top-level contents of one blob.
    static nlohmann::ordered_json
    DecodeBlob(std::span<const std::uint8_t> blob, const ParserDecodeOptions& opt = {});
};

// "Blob" is a JSON array of byte values, either signed (-128..127) or unsigned (0..255).
std::vector<std::uint8_t> blob_from_json(const nlohmann::json& blob, std::size_t record_index);

std::string blake3_hex(std::span<const std::uint8_t> bytes);

}  // namespace ykr::bookmarks
