#include "bookmark_parser.h"
#include "stream_builder.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using ykr::bookmarks::BookmarkParser;
using ykr::bookmarks::ParserDecodeOptions;
using ykr::bookmarks::blake3_hex;
using ykr::bookmarks::blob_from_json;
using ykr::test::StreamBuilder;

namespace {
std::vector<std::uint8_t> hello_blob() {
    StreamBuilder b;
    b.header().string("hello");
    return b.data();
}

// Yukari writes Blob as signed Java bytes.
nlohmann::json signed_blob(const std::vector<std::uint8_t>& bytes) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto b : bytes) {
        out.push_back(static_cast<std::int8_t>(b));
    }
    return out;
}

nlohmann::json export_doc(const std::vector<nlohmann::json>& blobs) {
    nlohmann::json doc;
    doc["version"] = 1;
    doc["SerializeEntity"] = nlohmann::json::array();
    std::int64_t id = 1;
    for (const auto& blob : blobs) {
        nlohmann::json entity;
        entity["_id"] = id++;
        entity["Blob"] = blob;
        entity["ReceiverId"] = "receiver-1";
        entity["SaveDate"] = 1700000000000;
        doc["SerializeEntity"].push_back(entity);
    }
    return doc;
}
}  // namespace

TEST(BookmarkParserTest, DecodesFirstContentOfEachRecord) {
    StreamBuilder two;
    two.header().string("first").string("second");
    const auto doc = export_doc({signed_blob(hello_blob()), signed_blob(two.data())});

    const auto res = BookmarkParser::DecodeExportJson(doc, {}, "bookmarks.json");
    EXPECT_EQ(res.records, nlohmann::ordered_json::parse(R"(["hello", "first"])"));
    EXPECT_EQ(res.failed_records, 0u);
}

TEST(BookmarkParserTest, AllContentsKeepsEveryContent) {
    StreamBuilder two;
    two.header().string("first").string("second");
    const auto doc = export_doc({signed_blob(two.data())});

    ParserDecodeOptions opt{};
    opt.all_contents = true;
    const auto res = BookmarkParser::DecodeExportJson(doc, opt);
    EXPECT_EQ(res.records, nlohmann::ordered_json::parse(R"([["first", "second"]])"));
}

TEST(BookmarkParserTest, EmptyStreamRecordIsNull) {
    StreamBuilder empty;
    empty.header();
    const auto res = BookmarkParser::DecodeExportJson(export_doc({signed_blob(empty.data())}));
    EXPECT_EQ(res.records, nlohmann::ordered_json::parse("[null]"));
}

TEST(BookmarkParserTest, CollectsRecordMetadata) {
    const auto blob = hello_blob();
    const auto res = BookmarkParser::DecodeExportJson(export_doc({signed_blob(blob)}));

    const auto& meta = res.metadata;
    EXPECT_EQ(meta["version"], 1);
    EXPECT_EQ(meta["recordCount"], 1);
    EXPECT_FALSE(meta.contains("failedRecords"));
    ASSERT_EQ(meta["records"].size(), 1u);

    const auto& rec = meta["records"][0];
    EXPECT_EQ(rec["id"], 1);
    EXPECT_EQ(rec["receiverId"], "receiver-1");
    EXPECT_EQ(rec["saveDate"], 1700000000000);
    EXPECT_EQ(rec["saveDateIso"], "2023-11-14T22:13:20.000Z");
    EXPECT_EQ(rec["blobSize"], blob.size());
    EXPECT_EQ(rec["blobBlake3"], blake3_hex(blob));
    EXPECT_EQ(rec["blobBlake3"].get<std::string>().size(), 64u);
    EXPECT_EQ(rec["contentCount"], 1);
}

TEST(BookmarkParserTest, MetadataCanBeSkipped) {
    ParserDecodeOptions opt{};
    opt.collect_metadata = false;
    const auto res = BookmarkParser::DecodeExportJson(export_doc({signed_blob(hello_blob())}), opt);
    EXPECT_TRUE(res.metadata.empty());
    EXPECT_EQ(res.records.size(), 1u);
}

TEST(BookmarkParserTest, SignedAndUnsignedBlobsMatch) {
    const auto blob = hello_blob();
    nlohmann::json unsigned_blob = nlohmann::json::array();
    for (const auto b : blob) {
        unsigned_blob.push_back(b);
    }
    EXPECT_EQ(blob_from_json(signed_blob(blob), 0), blob);
    EXPECT_EQ(blob_from_json(unsigned_blob, 0), blob);
}

TEST(BookmarkParserTest, RejectsBytesOutOfRange) {
    EXPECT_THROW(blob_from_json(nlohmann::json::parse("[300]"), 0), std::runtime_error);
    EXPECT_THROW(blob_from_json(nlohmann::json::parse("[-129]"), 0), std::runtime_error);
    EXPECT_THROW(blob_from_json(nlohmann::json::parse("[1.5]"), 0), std::runtime_error);
    EXPECT_THROW(blob_from_json(nlohmann::json::parse(R"("AQI=")"), 0), std::runtime_error);
}

TEST(BookmarkParserTest, UnsupportedDocuments) {
    nlohmann::json no_version;
    no_version["SerializeEntity"] = nlohmann::json::array();
    EXPECT_THROW(BookmarkParser::DecodeExportJson(no_version), std::runtime_error);

    nlohmann::json zero_version;
    zero_version["version"] = 0;
    zero_version["SerializeEntity"] = nlohmann::json::array();
    EXPECT_THROW(BookmarkParser::DecodeExportJson(zero_version), std::runtime_error);

    nlohmann::json no_entities;
    no_entities["version"] = 1;
    EXPECT_THROW(BookmarkParser::DecodeExportJson(no_entities), std::runtime_error);

    EXPECT_THROW(BookmarkParser::DecodeExportJson(nlohmann::json::array()), std::runtime_error);
}

TEST(BookmarkParserTest, FailingRecordAbortsByDefault) {
    const std::vector<std::uint8_t> bad = {0xCA, 0xFE, 0x00, 0x05};
    const auto doc = export_doc({signed_blob(hello_blob()), signed_blob(bad)});
    try {
        BookmarkParser::DecodeExportJson(doc);
        FAIL() << "expected a decode failure";
    } catch (const std::runtime_error& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("record 1"), std::string::npos) << msg;
        EXPECT_NE(msg.find("_id=2"), std::string::npos) << msg;
    }
}

TEST(BookmarkParserTest, KeepGoingRecordsFailures) {
    const std::vector<std::uint8_t> bad = {0xCA, 0xFE, 0x00, 0x05};
    const auto doc = export_doc({signed_blob(bad), signed_blob(hello_blob())});

    ParserDecodeOptions opt{};
    opt.keep_going = true;
    const auto res = BookmarkParser::DecodeExportJson(doc, opt);
    EXPECT_EQ(res.records, nlohmann::ordered_json::parse(R"([null, "hello"])"));
    EXPECT_EQ(res.failed_records, 1u);
    EXPECT_EQ(res.metadata["failedRecords"], 1);
    EXPECT_TRUE(res.metadata["records"][0].contains("error"));
    EXPECT_FALSE(res.metadata["records"][1].contains("error"));
}

TEST(BookmarkParserTest, NumericLongsOption) {
    StreamBuilder b;
    b.header()
        .tag(ykr::jos::Tag::Object)
        .class_desc("Stamp", 1, ykr::jos::kScSerializable, 1)
        .primitive_field('J', "at")
        .end_block()
        .null()
        .i64(-42);

    ParserDecodeOptions opt{};
    EXPECT_EQ(BookmarkParser::DecodeBlob(b.data(), opt)[0]["at"], "-42");
    opt.longs_as_strings = false;
    EXPECT_EQ(BookmarkParser::DecodeBlob(b.data(), opt)[0]["at"], -42);
}

TEST(BookmarkParserTest, Blake3OfEmptyInput) {
    EXPECT_EQ(
        blake3_hex({}), "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262"
    );
}

TEST(BookmarkParserTest, RecordsWithSupplementaryCharactersSerialize) {
    StreamBuilder b;
    b.header().string("title \xED\xA0\xBD\xED\xB8\x80");
    const auto res = BookmarkParser::DecodeExportJson(export_doc({signed_blob(b.data())}));
    EXPECT_EQ(res.records[0], "title \xF0\x9F\x98\x80");
    EXPECT_NO_THROW(res.records.dump(2));
}
