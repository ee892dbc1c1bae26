/*-------------------------------------------------------------------------
 *
 * test_upload_stream.cpp
 *      Chunk buffering, close, abort and failure handling of uploads.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestSupport.hpp"
#include "bucket/CUploadStream.hpp"

#include <gtest/gtest.h>

namespace DocBucket
{
namespace Regression
{

using namespace DocBucket::Testing;

class UploadStreamTest : public ::testing::Test
{
  protected:
    std::shared_ptr<CMemoryCollection> files;
    std::shared_ptr<CMemoryCollection> chunks;
    std::shared_ptr<CFaultyCollection> faultyChunks;
    std::shared_ptr<CFaultyCollection> faultyFiles;

    void SetUp() override
    {
        files = std::make_shared<CMemoryCollection>("fs.files");
        chunks = std::make_shared<CMemoryCollection>("fs.chunks");
        faultyFiles = std::make_shared<CFaultyCollection>(files);
        faultyChunks = std::make_shared<CFaultyCollection>(chunks);
    }

    std::unique_ptr<CUploadStream> open(int32_t chunkSize, bool md5 = true)
    {
        CFileRecord pending;
        pending.id = CDocumentId::generate();
        pending.filename = "upload.bin";
        pending.chunkSize = chunkSize;
        return std::make_unique<CUploadStream>(faultyFiles, faultyChunks, pending,
                                               md5, nullptr);
    }

    int64_t chunkCount(const CDocumentId& id)
    {
        return chunks->countDocuments(CChunkCodec::filesIdFilter(id)).value();
    }
};

TEST_F(UploadStreamTest, SmallWritesAreBufferedUntilAChunkFills)
{
    auto stream = open(4);

    ASSERT_TRUE(stream->write(asBytes("AB")).has_value());
    EXPECT_EQ(chunkCount(stream->id()), 0);
    ASSERT_TRUE(stream->write(asBytes("C")).has_value());
    EXPECT_EQ(chunkCount(stream->id()), 0);
    ASSERT_TRUE(stream->write(asBytes("DE")).has_value());
    EXPECT_EQ(chunkCount(stream->id()), 1);
    EXPECT_EQ(stream->chunksWritten(), 1);
    EXPECT_EQ(stream->bytesWritten(), 5);
}

TEST_F(UploadStreamTest, LargeWriteSplitsIntoWholeChunks)
{
    auto stream = open(4);

    ASSERT_TRUE(stream->write(asBytes("A")).has_value());
    ASSERT_TRUE(stream->write(asBytes("BCDEFGHIJKLMN")).has_value());
    EXPECT_EQ(stream->chunksWritten(), 3);
    EXPECT_EQ(faultyChunks->insertCalls, 3);

    auto file = stream->close();
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->length, 14);
    EXPECT_EQ(stream->chunksWritten(), 4);
    EXPECT_EQ(stream->state(), CUploadState::Closed);
}

TEST_F(UploadStreamTest, CloseWithEmptyBufferAddsNoChunk)
{
    auto stream = open(4);

    ASSERT_TRUE(stream->write(asBytes("ABCDEFGH")).has_value());
    auto file = stream->close();
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(chunkCount(file->id), 2);
}

TEST_F(UploadStreamTest, FileDocumentAppearsOnlyAtClose)
{
    auto stream = open(4);

    ASSERT_TRUE(stream->write(asBytes("ABCDEFGHI")).has_value());
    EXPECT_FALSE(files->findOne(CChunkCodec::idFilter(stream->id())).value().has_value());

    DateTimeMs before = currentDateTimeMs();
    auto file = stream->close();
    ASSERT_TRUE(file.has_value());

    auto stored = files->findOne(CChunkCodec::idFilter(stream->id())).value();
    ASSERT_TRUE(stored.has_value());
    auto decoded = CChunkCodec::decodeFile(*stored);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->length, 9);
    EXPECT_EQ(decoded->chunkSize, 4);
    EXPECT_EQ(decoded->filename, "upload.bin");
    EXPECT_GE(decoded->uploadDate, before);
}

TEST_F(UploadStreamTest, Md5CoversEveryWrittenByte)
{
    auto stream = open(2);

    ASSERT_TRUE(stream->write(asBytes("a")).has_value());
    ASSERT_TRUE(stream->write(asBytes("bc")).has_value());
    auto file = stream->close();
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->md5, "900150983cd24fb0d6963f7d28e17f72");
}

TEST_F(UploadStreamTest, Md5CanBeSkipped)
{
    auto stream = open(2, false);

    ASSERT_TRUE(stream->write(asBytes("abc")).has_value());
    auto file = stream->close();
    ASSERT_TRUE(file.has_value());
    EXPECT_FALSE(file->md5.has_value());
}

TEST_F(UploadStreamTest, WriteAfterCloseIsRejected)
{
    auto stream = open(4);
    ASSERT_TRUE(stream->close().has_value());

    auto written = stream->write(asBytes("late"));
    ASSERT_FALSE(written.has_value());
    ASSERT_TRUE(written.error().is<BucketErrors::InvalidArgument>());
    EXPECT_EQ(written.error().message(),
              "invalid argument: write on a closed upload stream");

    auto closed = stream->close();
    ASSERT_FALSE(closed.has_value());
    EXPECT_TRUE(closed.error().is<BucketErrors::InvalidArgument>());
    EXPECT_EQ(files->countDocuments(CBsonDocument()).value(), 1);
}

TEST_F(UploadStreamTest, AbortRemovesWrittenChunks)
{
    auto stream = open(4);

    ASSERT_TRUE(stream->write(asBytes("ABCDEFGHIJ")).has_value());
    EXPECT_EQ(chunkCount(stream->id()), 2);

    ASSERT_TRUE(stream->abort().has_value());
    EXPECT_EQ(stream->state(), CUploadState::Aborted);
    EXPECT_EQ(chunkCount(stream->id()), 0);
    EXPECT_EQ(files->countDocuments(CBsonDocument()).value(), 0);

    EXPECT_FALSE(stream->write(asBytes("x")).has_value());
    EXPECT_FALSE(stream->close().has_value());
    auto again = stream->abort();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().message(),
              "invalid argument: abort on an aborted upload stream");
}

TEST_F(UploadStreamTest, AbortAfterCloseIsRejected)
{
    auto stream = open(4);

    ASSERT_TRUE(stream->write(asBytes("ABCDE")).has_value());
    ASSERT_TRUE(stream->close().has_value());

    auto aborted = stream->abort();
    ASSERT_FALSE(aborted.has_value());
    EXPECT_TRUE(aborted.error().is<BucketErrors::InvalidArgument>());
    EXPECT_EQ(chunkCount(stream->id()), 2);
}

TEST_F(UploadStreamTest, InsertFailureIsStickyAndLeavesChunks)
{
    auto stream = open(4);
    faultyChunks->insertsBeforeFailure = 1;

    auto written = stream->write(asBytes("ABCDEFGHIJ"));
    ASSERT_FALSE(written.has_value());
    ASSERT_TRUE(written.error().is<BucketErrors::CollectionFailure>());
    EXPECT_EQ(stream->state(), CUploadState::Failed);
    EXPECT_EQ(chunkCount(stream->id()), 1);

    faultyChunks->insertsBeforeFailure = -1;
    auto later = stream->write(asBytes("K"));
    ASSERT_FALSE(later.has_value());
    EXPECT_EQ(later.error().message(), written.error().message());

    auto closed = stream->close();
    ASSERT_FALSE(closed.has_value());
    EXPECT_TRUE(closed.error().is<BucketErrors::CollectionFailure>());
    EXPECT_EQ(files->countDocuments(CBsonDocument()).value(), 0);

    /* abort still cleans up after a failure */
    ASSERT_TRUE(stream->abort().has_value());
    EXPECT_EQ(chunkCount(stream->id()), 0);
}

TEST_F(UploadStreamTest, FileInsertFailureFailsClose)
{
    auto stream = open(4);
    faultyFiles->insertsBeforeFailure = 0;

    ASSERT_TRUE(stream->write(asBytes("ABCDE")).has_value());
    auto file = stream->close();
    ASSERT_FALSE(file.has_value());
    const auto* failure = file.error().as<BucketErrors::CollectionFailure>();
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->error.message, "injected insert failure");
    EXPECT_EQ(stream->state(), CUploadState::Failed);
    EXPECT_EQ(chunkCount(stream->id()), 2);
}

TEST_F(UploadStreamTest, AbortFailureIsReported)
{
    auto stream = open(4);
    ASSERT_TRUE(stream->write(asBytes("ABCD")).has_value());
    faultyChunks->failDeleteMany = true;

    auto aborted = stream->abort();
    ASSERT_FALSE(aborted.has_value());
    EXPECT_TRUE(aborted.error().is<BucketErrors::CollectionFailure>());
    EXPECT_EQ(stream->state(), CUploadState::Failed);
}

} /* namespace Regression */
} /* namespace DocBucket */
