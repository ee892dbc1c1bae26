/*-------------------------------------------------------------------------
 *
 * CBackendScenarios.hpp
 *      Bucket scenarios run unchanged against each live backend.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "bucket/CBucket.hpp"
#include "database/IDatabase.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>

namespace DocBucket
{
namespace Regression
{

/**
 * Derived fixtures supply a connected database through openDatabase(); the
 * fixture skips when that returns null.  Every test works in its own
 * bucket, dropped again in TearDown().
 */
class BackendScenarioTest : public ::testing::Test
{
  protected:
    std::shared_ptr<IDatabase> database;
    std::unique_ptr<CBucket> bucket;

    virtual std::shared_ptr<IDatabase> openDatabase() = 0;

    static std::string environment(const char* name)
    {
        const char* value = std::getenv(name);
        return value ? value : "";
    }

    void SetUp() override
    {
        database = openDatabase();
        if (!database)
            GTEST_SKIP() << "backend not configured";

        auto connected = database->connect();
        ASSERT_TRUE(connected.has_value()) << connected.error().message;

        CBucketOptions options;
        options.bucketName =
            "it_" + std::to_string(getpid()) + "_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count() %
                           1000000);
        options.chunkSizeBytes = 4;
        bucket = std::make_unique<CBucket>(database, options);
    }

    void TearDown() override
    {
        if (bucket)
            EXPECT_TRUE(bucket->drop().has_value());
        if (database)
            database->disconnect();
    }

    CDocumentId upload(const std::string& content,
                       const CUploadOptions& options = CUploadOptions())
    {
        std::istringstream source(content);
        auto id = bucket->uploadFromStream("scenario.bin", source, options);
        EXPECT_TRUE(id.has_value()) << (id ? "" : id.error().message());
        return id ? *id : CDocumentId();
    }

    BucketResult<std::string> download(const CDocumentId& id)
    {
        CVectorSink sink;
        auto done = bucket->downloadToStream(id, sink);
        if (!done)
            return std::unexpected(done.error());
        return toString(ByteSpan(sink.bytes()));
    }

    static CBsonDocument chunkFilter(const CDocumentId& id, int32_t n)
    {
        CBsonDocument filter = CChunkCodec::filesIdFilter(id);
        filter.appendInt32("n", n);
        return filter;
    }

    void roundTrip()
    {
        for (const std::string content : {"", "A", "ABCD", "ABCDEFGH", "ABCDEFGHI"})
        {
            CDocumentId id = upload(content);
            auto restored = download(id);
            ASSERT_TRUE(restored.has_value()) << restored.error().message();
            EXPECT_EQ(*restored, content);

            auto chunks = bucket->chunksCollection()->countDocuments(
                CChunkCodec::filesIdFilter(id));
            ASSERT_TRUE(chunks.has_value());
            EXPECT_EQ(*chunks, static_cast<int64_t>((content.size() + 3) / 4));
        }
    }

    void integrityFailures()
    {
        CDocumentId missing = upload("ABCDEFGHIJKL");
        ASSERT_EQ(bucket->chunksCollection()->deleteOne(chunkFilter(missing, 1)).value(), 1);
        auto gap = download(missing);
        ASSERT_FALSE(gap.has_value());
        ASSERT_TRUE(gap.error().is<BucketErrors::MissingChunk>());
        EXPECT_EQ(gap.error().as<BucketErrors::MissingChunk>()->n, 1);

        CDocumentId extra = upload("ABCDEFGH");
        auto chunk = CChunkCodec::encodeChunk(extra, 2, asBytes("IJKL"));
        ASSERT_TRUE(chunk.has_value());
        ASSERT_TRUE(bucket->chunksCollection()->insertOne(*chunk).has_value());
        auto tooMany = download(extra);
        ASSERT_FALSE(tooMany.has_value());
        EXPECT_TRUE(tooMany.error().is<BucketErrors::ExtraChunks>());

        CDocumentId truncated = upload("ABCDEFGHI");
        ASSERT_EQ(bucket->chunksCollection()->deleteOne(chunkFilter(truncated, 0)).value(), 1);
        auto shortChunk = CChunkCodec::encodeChunk(truncated, 0, asBytes("AB"));
        ASSERT_TRUE(shortChunk.has_value());
        ASSERT_TRUE(bucket->chunksCollection()->insertOne(*shortChunk).has_value());
        auto mismatch = download(truncated);
        ASSERT_FALSE(mismatch.has_value());
        EXPECT_TRUE(mismatch.error().is<BucketErrors::ChunkSizeMismatch>());
    }

    void deleteAndFind()
    {
        CUploadOptions tagged;
        tagged.metadata = CBsonDocument();
        tagged.metadata->appendString("owner", "ops");
        CDocumentId kept = upload("keep", tagged);
        CDocumentId removed = upload("remove me");

        ASSERT_TRUE(bucket->deleteFile(removed).has_value());
        auto again = bucket->deleteFile(removed);
        ASSERT_FALSE(again.has_value());
        EXPECT_TRUE(again.error().is<BucketErrors::FileNotFound>());
        EXPECT_EQ(bucket->chunksCollection()
                      ->countDocuments(CChunkCodec::filesIdFilter(removed))
                      .value(),
                  0);

        CBsonDocument filter;
        filter.appendString("metadata.owner", "ops");
        auto cursor = bucket->find(filter);
        ASSERT_TRUE(cursor.has_value());
        auto first = cursor->next();
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(first->has_value());
        EXPECT_EQ((*first)->id, kept);
        EXPECT_EQ((*first)->md5, "18ccf61d533b600bbf5a963359223fe4");
        ASSERT_TRUE((*first)->metadata.has_value());
        EXPECT_EQ((*first)->metadata->getString("owner"), "ops");
        auto end = cursor->next();
        ASSERT_TRUE(end.has_value());
        EXPECT_FALSE(end->has_value());
    }

    void duplicateIds()
    {
        CUploadOptions options;
        options.id = CDocumentId::fromString("fixed-id");
        upload("one", options);

        std::istringstream source("two");
        auto second = bucket->uploadFromStream("dup", source, options);
        ASSERT_FALSE(second.has_value());
        const auto* failure = second.error().as<BucketErrors::CollectionFailure>();
        ASSERT_NE(failure, nullptr) << second.error().message();
        EXPECT_EQ(failure->error.code, COLLECTION_ERROR_DUPLICATE_KEY);
        EXPECT_EQ(download(CDocumentId::fromString("fixed-id")).value(), "one");
    }
};

} /* namespace Regression */
} /* namespace DocBucket */
