/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bookmark_parser.h"

#include "jos/jos_stream_decoder.h"
#include "jos/jos_timestamp.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <blake3.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <stdexcept>
#include <string>

namespace ykr::bookmarks {

static bool is_truthy(const nlohmann::json& j) {
    if (j.is_null()) {
        return false;
    }
    if (j.is_boolean()) {
        return j.get<bool>();
    }
    if (j.is_number()) {
        return j.get<double>() != 0.0;
    }
    if (j.is_string()) {
        return !j.get_ref<const std::string&>().empty();
    }
    return true;
}

static nlohmann::json field_or_null(const nlohmann::json& entity, const char* key) {
    const auto it = entity.find(key);
    if (it == entity.end()) {
        return nullptr;
    }
    return *it;
}

static std::string record_label(std::size_t index, const nlohmann::json& entity) {
    std::string out = "record " + std::to_string(index);
    const auto it = entity.find("_id");
    if (it != entity.end() && !it->is_null()) {
        out += " (_id=" + it->dump() + ")";
    }
    return out;
}

std::string blake3_hex(std::span<const std::uint8_t> bytes) {
    static const char hexdig[] = "0123456789abcdef";
    std::array<std::uint8_t, BLAKE3_OUT_LEN> digest{};
    blake3_hasher h{};
    blake3_hasher_init(&h);
    if (!bytes.empty()) {
        blake3_hasher_update(&h, bytes.data(), bytes.size());
    }
    blake3_hasher_finalize(&h, digest.data(), digest.size());

    std::string out;
    out.reserve(digest.size() * 2);
    for (const auto b : digest) {
        out.push_back(hexdig[(b >> 4) & 0xFu]);
        out.push_back(hexdig[b & 0xFu]);
    }
    return out;
}

std::vector<std::uint8_t> blob_from_json(const nlohmann::json& blob, std::size_t record_index) {
    if (!blob.is_array()) {
        throw std::runtime_error(
            "Blob of record " + std::to_string(record_index) + " is not an array"
        );
    }
    std::vector<std::uint8_t> out;
    out.reserve(blob.size());
    for (std::size_t i = 0; i < blob.size(); i++) {
        const auto& v = blob[i];
        if (!v.is_number_integer()) {
            throw std::runtime_error(
                "Blob of record " + std::to_string(record_index) + ": element " + std::to_string(i)
                + " is not an integer"
            );
        }
        const std::int64_t b = v.is_number_unsigned()
                                   ? static_cast<std::int64_t>(std::min<std::uint64_t>(
                                       v.get<std::uint64_t>(), 0xFFFFu
                                   ))
                                   : v.get<std::int64_t>();
        if (b < -128 || b > 255) {
            throw std::runtime_error(
                "Blob of record " + std::to_string(record_index) + ": element " + std::to_string(i)
                + " out of byte range (" + std::to_string(b) + ")"
            );
        }
        out.push_back(static_cast<std::uint8_t>(b & 0xFF));
    }
    return out;
}

nlohmann::ordered_json
BookmarkParser::DecodeBlob(std::span<const std::uint8_t> blob, const ParserDecodeOptions& opt) {
    jos::DecodeOptions dopt{};
    dopt.longs_as_strings = opt.longs_as_strings;
    dopt.debug = opt.debug;
    return jos::decode_stream(blob, dopt);
}

static nlohmann::ordered_json build_record_metadata(
    const nlohmann::json& entity,
    std::span<const std::uint8_t> blob
) {
    nlohmann::ordered_json meta = nlohmann::ordered_json::object();
    meta["id"] = field_or_null(entity, "_id");
    meta["receiverId"] = field_or_null(entity, "ReceiverId");
    const nlohmann::json save_date = field_or_null(entity, "SaveDate");
    meta["saveDate"] = save_date;
    if (save_date.is_number_integer()) {
        const auto iso = jos::format_iso8601_ms(save_date.get<std::int64_t>());
        if (iso.has_value()) {
            meta["saveDateIso"] = *iso;
        }
    }
    meta["blobSize"] = blob.size();
    meta["blobBlake3"] = blake3_hex(blob);
    return meta;
}

DecodeResult BookmarkParser::DecodeExportJson(
    const nlohmann::json& doc,
    const ParserDecodeOptions& opt,
    std::string_view label
) {
    if (!doc.is_object()) {
        throw std::runtime_error("Unsupported file (not a JSON object): " + std::string(label));
    }
    const auto version_it = doc.find("version");
    const auto entities_it = doc.find("SerializeEntity");
    if (version_it == doc.end() || !is_truthy(*version_it) || entities_it == doc.end()
        || !entities_it->is_array()) {
        throw std::runtime_error("Unsupported file: " + std::string(label));
    }

    DecodeResult result{};
    nlohmann::ordered_json record_meta = nlohmann::ordered_json::array();
    const auto& entities = *entities_it;
    for (std::size_t i = 0; i < entities.size(); i++) {
        const auto& entity = entities[i];
        if (!entity.is_object()) {
            throw std::runtime_error("Entity " + std::to_string(i) + " is not an object");
        }
        const auto blob_it = entity.find("Blob");
        if (blob_it == entity.end()) {
            throw std::runtime_error("Missing Blob in " + record_label(i, entity));
        }
        const std::vector<std::uint8_t> blob = blob_from_json(*blob_it, i);

        nlohmann::ordered_json meta;
        if (opt.collect_metadata) {
            meta = build_record_metadata(entity, blob);
        }

        try {
            nlohmann::ordered_json contents = DecodeBlob(blob, opt);
            if (opt.collect_metadata) {
                meta["contentCount"] = contents.size();
            }
            if (opt.all_contents) {
                result.records.push_back(std::move(contents));
            } else if (contents.empty()) {
                result.records.push_back(nullptr);
            } else {
                result.records.push_back(std::move(contents.front()));
            }
        } catch (const std::exception& e) {
            if (!opt.keep_going) {
                throw std::runtime_error(record_label(i, entity) + ": " + e.what());
            }
            YKR_LOG_WARN("%s: %s", record_label(i, entity).c_str(), e.what());
            result.failed_records++;
            result.records.push_back(nullptr);
            if (opt.collect_metadata) {
                meta["error"] = e.what();
            }
        }

        if (opt.collect_metadata) {
            record_meta.push_back(std::move(meta));
        }
    }

    if (opt.collect_metadata) {
        result.metadata["version"] = *version_it;
        result.metadata["recordCount"] = entities.size();
        if (result.failed_records != 0) {
            result.metadata["failedRecords"] = result.failed_records;
        }
        result.metadata["records"] = std::move(record_meta);
    }
    YKR_LOG_DEBUG(
        opt.debug, "Decoded %s: records=%zu failed=%zu", std::string(label).c_str(),
        entities.size(), result.failed_records
    );
    return result;
}

DecodeResult
BookmarkParser::DecodeExportFile(const std::filesystem::path& path, const ParserDecodeOptions& opt) {
    const auto t0 = std::chrono::steady_clock::now();
    const auto bytes = fs_utils::read_file(path);
    if (bytes.empty()) {
        throw std::runtime_error("JSON file is empty: " + path.string());
    }
    const auto t1 = std::chrono::steady_clock::now();
    const auto doc = nlohmann::json::parse(bytes.begin(), bytes.end());
    const auto t2 = std::chrono::steady_clock::now();
    if (opt.debug) {
        const auto read_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        const auto parse_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count();
        YKR_LOG_INFO(
            "JSON read %s: bytes=%zu read=%lldms parse=%lldms", path.string().c_str(),
            bytes.size(), static_cast<long long>(read_ms), static_cast<long long>(parse_ms)
        );
    }
    return DecodeExportJson(doc, opt, path.filename().string());
}

}  // namespace ykr::bookmarks
