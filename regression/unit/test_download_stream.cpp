/*-------------------------------------------------------------------------
 *
 * test_download_stream.cpp
 *      Chunk validation, partial reads and sinks of the download stream.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestSupport.hpp"
#include "bucket/CDownloadStream.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>

namespace DocBucket
{
namespace Regression
{

using namespace DocBucket::Testing;

class DownloadStreamTest : public ::testing::Test
{
  protected:
    std::shared_ptr<CMemoryCollection> chunks;
    std::shared_ptr<CFaultyCollection> faultyChunks;

    void SetUp() override
    {
        chunks = std::make_shared<CMemoryCollection>("fs.chunks");
        faultyChunks = std::make_shared<CFaultyCollection>(chunks);
    }

    /* Stores content as chunks and returns the matching file record */
    CFileRecord store(const std::string& content, int32_t chunkSize)
    {
        CFileRecord file;
        file.id = CDocumentId::generate();
        file.filename = "stored";
        file.length = static_cast<int64_t>(content.size());
        file.chunkSize = chunkSize;

        ByteSpan bytes = asBytes(content);
        for (int32_t n = 0; bytes.size() > 0; ++n)
        {
            size_t take = std::min(bytes.size(), static_cast<size_t>(chunkSize));
            insertChunk(file.id, n, bytes.first(take));
            bytes = bytes.subspan(take);
        }
        return file;
    }

    void insertChunk(const CDocumentId& id, int32_t n, ByteSpan data)
    {
        auto chunk = CChunkCodec::encodeChunk(id, n, data);
        ASSERT_TRUE(chunk.has_value());
        ASSERT_TRUE(chunks->insertOne(*chunk).has_value());
    }

    std::unique_ptr<CDownloadStream> open(const CFileRecord& file)
    {
        return std::make_unique<CDownloadStream>(faultyChunks, file, nullptr);
    }
};

TEST_F(DownloadStreamTest, NextChunkYieldsEachChunkInOrder)
{
    auto stream = open(store("ABCDEFGHI", 4));

    std::vector<std::string> seen;
    while (true)
    {
        auto chunk = stream->nextChunk();
        ASSERT_TRUE(chunk.has_value()) << chunk.error().message();
        if (!*chunk)
            break;
        seen.push_back(toString(**chunk));
    }

    std::vector<std::string> expected = {"ABCD", "EFGH", "I"};
    EXPECT_EQ(seen, expected);
    EXPECT_TRUE(stream->finished());
    EXPECT_EQ(stream->bytesRead(), 9);
    EXPECT_EQ(faultyChunks->findCalls, 1);
}

TEST_F(DownloadStreamTest, ChunksAreReadInIndexOrderRegardlessOfInsertion)
{
    CFileRecord file;
    file.id = CDocumentId::generate();
    file.length = 6;
    file.chunkSize = 2;
    insertChunk(file.id, 2, asBytes("ef"));
    insertChunk(file.id, 0, asBytes("ab"));
    insertChunk(file.id, 1, asBytes("cd"));

    auto all = open(file)->readAll();
    ASSERT_TRUE(all.has_value()) << all.error().message();
    EXPECT_EQ(toString(ByteSpan(*all)), "abcdef");
}

TEST_F(DownloadStreamTest, ReadSpansChunkBoundaries)
{
    auto stream = open(store("ABCDEFGHIJ", 4));
    uint8_t buffer[6];

    auto first = stream->read(buffer, sizeof(buffer));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 6u);
    EXPECT_EQ(std::string(reinterpret_cast<char*>(buffer), 6), "ABCDEF");

    auto second = stream->read(buffer, sizeof(buffer));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, 4u);
    EXPECT_EQ(std::string(reinterpret_cast<char*>(buffer), 4), "GHIJ");

    auto end = stream->read(buffer, sizeof(buffer));
    ASSERT_TRUE(end.has_value());
    EXPECT_EQ(*end, 0u);
    EXPECT_EQ(stream->bytesRead(), 10);
}

TEST_F(DownloadStreamTest, NextChunkAfterReadReturnsTheRemainder)
{
    auto stream = open(store("ABCDEFGH", 4));
    uint8_t buffer[1];

    ASSERT_EQ(stream->read(buffer, 1).value(), 1u);
    auto rest = stream->nextChunk();
    ASSERT_TRUE(rest.has_value());
    ASSERT_TRUE(rest->has_value());
    EXPECT_EQ(toString(**rest), "BCD");

    auto next = stream->nextChunk();
    ASSERT_TRUE(next.has_value());
    ASSERT_TRUE(next->has_value());
    EXPECT_EQ(toString(**next), "EFGH");
}

TEST_F(DownloadStreamTest, ReadReturnsPartialBytesBeforeTheError)
{
    CFileRecord file = store("ABCDEFGHIJ", 4);
    ASSERT_EQ(chunks->deleteOne(parseJson(R"({"n": 1})")).value(), 1);

    auto stream = open(file);
    uint8_t buffer[8];

    auto partial = stream->read(buffer, sizeof(buffer));
    ASSERT_TRUE(partial.has_value());
    EXPECT_EQ(*partial, 4u);

    auto failed = stream->read(buffer, sizeof(buffer));
    ASSERT_FALSE(failed.has_value());
    ASSERT_TRUE(failed.error().is<BucketErrors::MissingChunk>());
    EXPECT_EQ(failed.error().as<BucketErrors::MissingChunk>()->n, 1);
}

TEST_F(DownloadStreamTest, FailuresAreSticky)
{
    CFileRecord file = store("ABCDEFGH", 4);
    insertChunk(file.id, 2, asBytes("IJKL"));

    auto stream = open(file);
    auto all = stream->readAll();
    ASSERT_FALSE(all.has_value());
    EXPECT_TRUE(all.error().is<BucketErrors::ExtraChunks>());

    ASSERT_TRUE(chunks->deleteOne(parseJson(R"({"n": 2})")).has_value());
    int findsBefore = faultyChunks->findCalls;

    auto again = stream->nextChunk();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().message(), all.error().message());
    EXPECT_EQ(faultyChunks->findCalls, findsBefore);
    EXPECT_FALSE(stream->finished());
}

TEST_F(DownloadStreamTest, CorruptChunkDocumentFails)
{
    CFileRecord file;
    file.id = CDocumentId::fromString("broken");
    file.length = 3;
    file.chunkSize = 4;
    ASSERT_TRUE(chunks->insertOne(parseJson(R"({"files_id": "broken", "n": 0, "data": "abc"})"))
                    .has_value());

    auto all = open(file)->readAll();
    ASSERT_FALSE(all.has_value());
    EXPECT_TRUE(all.error().is<BucketErrors::CorruptDocument>());
}

TEST_F(DownloadStreamTest, CollectionErrorsPropagateUnchanged)
{
    CFileRecord file = store("ABCD", 4);
    faultyChunks->failFind = true;

    auto all = open(file)->readAll();
    ASSERT_FALSE(all.has_value());
    const auto* failure = all.error().as<BucketErrors::CollectionFailure>();
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->error.code, COLLECTION_ERROR_INTERNAL);
    EXPECT_EQ(failure->error.message, "injected find failure");
}

TEST_F(DownloadStreamTest, SinkFailureStopsTheDownload)
{
    auto stream = open(store("ABCDEFGH", 4));
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    COstreamSink sink(out);

    auto written = stream->writeTo(sink);
    ASSERT_FALSE(written.has_value());
    EXPECT_TRUE(written.error().is<BucketErrors::StreamIoError>());
    EXPECT_EQ(stream->nextChunk().error().kind(), "StreamIoError");
}

TEST_F(DownloadStreamTest, OstreamSinkReceivesEveryByte)
{
    std::string content(1000, '\0');
    for (size_t i = 0; i < content.size(); ++i)
        content[i] = static_cast<char>(i * 31);

    auto stream = open(store(content, 64));
    std::ostringstream out;
    COstreamSink sink(out);

    ASSERT_TRUE(stream->writeTo(sink).has_value());
    EXPECT_EQ(out.str(), content);
}

TEST(BucketErrorTest, MessagesNameThePayload)
{
    EXPECT_EQ(CBucketError(BucketErrors::FileNotFound{"abc"}).message(),
              "file not found: abc");
    EXPECT_EQ(CBucketError(BucketErrors::MissingChunk{3}).message(), "missing chunk 3");
    EXPECT_EQ(CBucketError(BucketErrors::UnexpectedChunkIndex{2, 0}).message(),
              "expected chunk 2 but found chunk 0");
    EXPECT_EQ(CBucketError(BucketErrors::ChunkSizeMismatch{1, 4, 2}).message(),
              "chunk 1 has 2 bytes, expected 4");
    EXPECT_EQ(CBucketError(BucketErrors::ExtraChunks{5}).message(),
              "extra chunk 5 past the end of the file");
    EXPECT_EQ(CBucketError(BucketErrors::CollectionFailure{
                               CCollectionError(COLLECTION_ERROR_TIMEOUT, "slow")})
                  .message(),
              "collection error 50: slow");
    EXPECT_EQ(CBucketError(BucketErrors::ExtraChunks{5}).kind(), "ExtraChunks");
}

} /* namespace Regression */
} /* namespace DocBucket */
