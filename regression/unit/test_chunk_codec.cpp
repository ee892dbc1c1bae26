/*-------------------------------------------------------------------------
 *
 * test_chunk_codec.cpp
 *      Chunk and file document mapping plus chunk arithmetic.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestSupport.hpp"
#include "bucket/CChunkCodec.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace DocBucket
{
namespace Regression
{

using namespace DocBucket::Testing;

TEST(ChunkCodecTest, ChunkCountIsTheCeiling)
{
    EXPECT_EQ(CChunkCodec::chunkCount(0, 4), 0);
    EXPECT_EQ(CChunkCodec::chunkCount(1, 4), 1);
    EXPECT_EQ(CChunkCodec::chunkCount(4, 4), 1);
    EXPECT_EQ(CChunkCodec::chunkCount(8, 4), 2);
    EXPECT_EQ(CChunkCodec::chunkCount(9, 4), 3);
    EXPECT_EQ(CChunkCodec::chunkCount(int64_t(1) << 40, 255 * 1024),
              ((int64_t(1) << 40) + 255 * 1024 - 1) / (255 * 1024));
}

TEST(ChunkCodecTest, ChunkArithmeticAtTheLargestLength)
{
    const int64_t largest = std::numeric_limits<int64_t>::max();

    EXPECT_EQ(CChunkCodec::chunkCount(largest, 1), largest);
    EXPECT_EQ(CChunkCodec::chunkCount(largest, 261120), largest / 261120 + 1);
    EXPECT_EQ(CChunkCodec::lastChunkIndex(largest, 261120), largest / 261120);
    EXPECT_EQ(CChunkCodec::expectedChunkLength(largest, 261120, 0), 261120);
    EXPECT_EQ(CChunkCodec::expectedChunkLength(largest, 261120, largest / 261120),
              largest % 261120);
}

TEST(ChunkCodecTest, LastIndexOfAnExactMultipleIsNotPastTheEnd)
{
    EXPECT_EQ(CChunkCodec::lastChunkIndex(0, 4), -1);
    EXPECT_EQ(CChunkCodec::lastChunkIndex(3, 4), 0);
    EXPECT_EQ(CChunkCodec::lastChunkIndex(8, 4), 1);
    EXPECT_EQ(CChunkCodec::lastChunkIndex(9, 4), 2);
}

TEST(ChunkCodecTest, ExpectedLengthOfEachChunk)
{
    EXPECT_EQ(CChunkCodec::expectedChunkLength(9, 4, 0), 4);
    EXPECT_EQ(CChunkCodec::expectedChunkLength(9, 4, 1), 4);
    EXPECT_EQ(CChunkCodec::expectedChunkLength(9, 4, 2), 1);
    EXPECT_EQ(CChunkCodec::expectedChunkLength(8, 4, 1), 4);
    EXPECT_EQ(CChunkCodec::expectedChunkLength(8, 4, 2), 0);
    EXPECT_EQ(CChunkCodec::expectedChunkLength(8, 4, -1), 0);
}

TEST(ChunkCodecTest, ChunkDocumentLayout)
{
    CDocumentId filesId = CDocumentId::generate();
    auto document = CChunkCodec::encodeChunk(filesId, 7, asBytes("payload"));
    ASSERT_TRUE(document.has_value());

    std::vector<std::string> expected = {"_id", "files_id", "n", "data"};
    EXPECT_EQ(document->fieldNames(), expected);

    bson_iter_t iter;
    ASSERT_TRUE(document->findField("n", &iter));
    EXPECT_TRUE(BSON_ITER_HOLDS_INT32(&iter));
    ASSERT_TRUE(document->findField("data", &iter));
    EXPECT_TRUE(BSON_ITER_HOLDS_BINARY(&iter));
    ASSERT_TRUE(document->findField("_id", &iter));
    EXPECT_TRUE(BSON_ITER_HOLDS_OID(&iter));

    auto record = CChunkCodec::decodeChunk(*document);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->filesId, filesId);
    EXPECT_EQ(record->n, 7);
    EXPECT_EQ(toString(ByteSpan(record->data)), "payload");
}

TEST(ChunkCodecTest, ChunkWithoutFilesIdIsRejected)
{
    auto document = CChunkCodec::encodeChunk(CDocumentId(), 0, asBytes("x"));
    ASSERT_FALSE(document.has_value());
    EXPECT_TRUE(document.error().is<BucketErrors::InvalidArgument>());
}

TEST(ChunkCodecTest, MalformedChunksAreCorrupt)
{
    const char* cases[] = {
        R"({"n": 0, "data": {"$binary": {"base64": "", "subType": "00"}}})",
        R"({"files_id": 1, "data": {"$binary": {"base64": "", "subType": "00"}}})",
        R"({"files_id": 1, "n": "zero", "data": {"$binary": {"base64": "", "subType": "00"}}})",
        R"({"files_id": 1, "n": 0})",
        R"({"files_id": 1, "n": 0, "data": "not binary"})",
    };

    for (const char* json : cases)
    {
        auto record = CChunkCodec::decodeChunk(parseJson(json));
        ASSERT_FALSE(record.has_value()) << json;
        EXPECT_TRUE(record.error().is<BucketErrors::CorruptDocument>()) << json;
    }
}

TEST(ChunkCodecTest, FileDocumentLayout)
{
    CFileRecord file;
    file.id = CDocumentId::fromString("doc-1");
    file.filename = "notes.txt";
    file.length = 300;
    file.chunkSize = 128;
    file.uploadDate = 1700000000123;
    file.md5 = "d41d8cd98f00b204e9800998ecf8427e";
    file.contentType = "text/plain";

    auto document = CChunkCodec::encodeFile(file);
    ASSERT_TRUE(document.has_value());

    std::vector<std::string> expected = {"_id",  "length",   "chunkSize",  "uploadDate",
                                         "md5",  "filename", "contentType"};
    EXPECT_EQ(document->fieldNames(), expected);

    bson_iter_t iter;
    ASSERT_TRUE(document->findField("length", &iter));
    EXPECT_TRUE(BSON_ITER_HOLDS_INT64(&iter));
    ASSERT_TRUE(document->findField("uploadDate", &iter));
    EXPECT_TRUE(BSON_ITER_HOLDS_DATE_TIME(&iter));

    auto decoded = CChunkCodec::decodeFile(*document);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->id, file.id);
    EXPECT_EQ(decoded->filename, "notes.txt");
    EXPECT_EQ(decoded->length, 300);
    EXPECT_EQ(decoded->chunkSize, 128);
    EXPECT_EQ(decoded->uploadDate, 1700000000123);
    EXPECT_EQ(decoded->md5, file.md5);
    EXPECT_EQ(decoded->contentType, file.contentType);
    EXPECT_FALSE(decoded->metadata.has_value());
    EXPECT_FALSE(decoded->aliases.has_value());
}

TEST(ChunkCodecTest, FileDocumentsFromOtherWritersDecode)
{
    /* int32 length and a double chunkSize, no optional fields */
    auto decoded = CChunkCodec::decodeFile(
        parseJson(R"({"_id": "legacy", "length": 10, "chunkSize": 4.0})"));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message();
    EXPECT_EQ(decoded->length, 10);
    EXPECT_EQ(decoded->chunkSize, 4);
    EXPECT_EQ(decoded->filename, "");
    EXPECT_EQ(decoded->uploadDate, 0);
    EXPECT_FALSE(decoded->md5.has_value());
}

TEST(ChunkCodecTest, InvalidFileDocumentsAreCorrupt)
{
    const char* cases[] = {
        R"({"length": 1, "chunkSize": 4})",
        R"({"_id": 1, "chunkSize": 4})",
        R"({"_id": 1, "length": -1, "chunkSize": 4})",
        R"({"_id": 1, "length": 1})",
        R"({"_id": 1, "length": 1, "chunkSize": 0})",
        R"({"_id": 1, "length": 1.5, "chunkSize": 4})",
        R"({"_id": 1, "length": 1e19, "chunkSize": 4})",
    };

    for (const char* json : cases)
    {
        auto record = CChunkCodec::decodeFile(parseJson(json));
        ASSERT_FALSE(record.has_value()) << json;
        EXPECT_TRUE(record.error().is<BucketErrors::CorruptDocument>()) << json;
    }
}

TEST(ChunkCodecTest, FiltersAndIndexKeys)
{
    CDocumentId id = CDocumentId::fromInt64(5);

    EXPECT_EQ(CChunkCodec::idFilter(id).fieldNames(), std::vector<std::string>{"_id"});
    EXPECT_EQ(CChunkCodec::filesIdFilter(id).fieldNames(),
              std::vector<std::string>{"files_id"});
    EXPECT_EQ(CChunkCodec::chunkSort().getInt32("n"), 1);

    std::vector<std::string> filesKeys = {"filename", "uploadDate"};
    std::vector<std::string> chunksKeys = {"files_id", "n"};
    EXPECT_EQ(CChunkCodec::filesIndexKeys().fieldNames(), filesKeys);
    EXPECT_EQ(CChunkCodec::chunksIndexKeys().fieldNames(), chunksKeys);
    EXPECT_EQ(indexNameForKeys(CChunkCodec::chunksIndexKeys()), "files_id_1_n_1");
}

} /* namespace Regression */
} /* namespace DocBucket */
