/*-------------------------------------------------------------------------
 *
 * CTestSupport.hpp
 *      Shared fixtures for the DocBucket unit tests.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CTypes.hpp"
#include "database/CMemoryDatabase.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <unordered_map>

namespace DocBucket
{
namespace Testing
{

inline ByteVector bytesOf(const std::string& text)
{
    return ByteVector(text.begin(), text.end());
}

/* Deterministic non-repeating-looking content */
inline ByteVector patternBytes(size_t size, uint32_t seed = 7)
{
    ByteVector bytes(size);
    uint32_t state = seed;

    for (size_t i = 0; i < size; ++i)
    {
        state = state * 1103515245u + 12345u;
        bytes[i] = static_cast<uint8_t>(state >> 16);
    }
    return bytes;
}

inline CBsonDocument parseJson(const std::string& json)
{
    std::string error;
    auto document = CBsonDocument::fromJson(json, &error);
    EXPECT_TRUE(document.has_value()) << json << ": " << error;
    return document ? *document : CBsonDocument();
}

/**
 * Forwards to a real collection and fails selected operations on demand.
 */
class CFaultyCollection : public ICollection
{
  public:
    explicit CFaultyCollection(std::shared_ptr<ICollection> inner)
        : insertsBeforeFailure(-1), failDeleteMany(false), failFind(false),
          failCreateIndex(false), insertCalls(0), findCalls(0),
          createIndexCalls(0), inner_(std::move(inner))
    {
    }

    const std::string& name() const override
    {
        return inner_->name();
    }

    CollectionResult<CDocumentId> insertOne(const CBsonDocument& document) override
    {
        ++insertCalls;
        if (insertsBeforeFailure == 0)
            return std::unexpected(injected("insert"));
        if (insertsBeforeFailure > 0)
            --insertsBeforeFailure;
        return inner_->insertOne(document);
    }

    CollectionResult<int64_t> deleteOne(const CBsonDocument& filter) override
    {
        return inner_->deleteOne(filter);
    }

    CollectionResult<int64_t> deleteMany(const CBsonDocument& filter) override
    {
        if (failDeleteMany)
            return std::unexpected(injected("deleteMany"));
        return inner_->deleteMany(filter);
    }

    CollectionResult<std::unique_ptr<ICursor>>
    find(const CBsonDocument& filter, const CFindOptions& options) override
    {
        ++findCalls;
        if (failFind)
            return std::unexpected(injected("find"));
        return inner_->find(filter, options);
    }

    CollectionResult<std::optional<CBsonDocument>>
    findOne(const CBsonDocument& filter) override
    {
        return inner_->findOne(filter);
    }

    CollectionResult<int64_t> countDocuments(const CBsonDocument& filter) override
    {
        return inner_->countDocuments(filter);
    }

    CollectionResult<void> drop() override
    {
        return inner_->drop();
    }

    CollectionResult<void> createIndex(const CBsonDocument& keys) override
    {
        ++createIndexCalls;
        if (failCreateIndex)
            return std::unexpected(injected("createIndex"));
        return inner_->createIndex(keys);
    }

    /* Successful inserts left before every insert fails; -1 never fails */
    int insertsBeforeFailure;
    bool failDeleteMany;
    bool failFind;
    bool failCreateIndex;

    int insertCalls;
    int findCalls;
    int createIndexCalls;

  private:
    std::shared_ptr<ICollection> inner_;

    static CCollectionError injected(const std::string& operation)
    {
        return CCollectionError(COLLECTION_ERROR_INTERNAL,
                                "injected " + operation + " failure");
    }
};

/* Memory database whose collections are wrapped in CFaultyCollection */
class CFaultyDatabase : public IDatabase
{
  public:
    CFaultyDatabase() : memory_(std::make_shared<CMemoryDatabase>())
    {
    }

    CollectionResult<void> connect() override
    {
        return memory_->connect();
    }
    void disconnect() override
    {
        memory_->disconnect();
    }
    CDatabaseStatus getStatus() const override
    {
        return memory_->getStatus();
    }
    bool ping() override
    {
        return memory_->ping();
    }

    std::shared_ptr<ICollection>
    getCollection(const std::string& name,
                  const CCollectionOptions& options) override
    {
        return faulty(name, options);
    }

    std::shared_ptr<CFaultyCollection>
    faulty(const std::string& name,
           const CCollectionOptions& options = CCollectionOptions())
    {
        auto& slot = wrappers_[name];
        if (!slot)
            slot = std::make_shared<CFaultyCollection>(
                memory_->getCollection(name, options));
        return slot;
    }

    std::shared_ptr<CMemoryCollection> memory(const std::string& name)
    {
        return memory_->getMemoryCollection(name);
    }

    std::string getConnectionInfo() const override
    {
        return "faulty+" + memory_->getConnectionInfo();
    }

  private:
    std::shared_ptr<CMemoryDatabase> memory_;
    std::unordered_map<std::string, std::shared_ptr<CFaultyCollection>> wrappers_;
};

} /* namespace Testing */
} /* namespace DocBucket */
