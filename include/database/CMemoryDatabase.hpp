/*-------------------------------------------------------------------------
 *
 * CMemoryDatabase.hpp
 *      In-process document collections.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------*/

#pragma once

#include "IDatabase.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace DocBucket
{

using StoredDocument = std::shared_ptr<const CBsonDocument>;

/* Copies one stored document out per next() */
class CMemoryCursor : public ICursor
{
  public:
    explicit CMemoryCursor(std::vector<StoredDocument> documents);
    CollectionResult<std::optional<CBsonDocument>> next() override;

  private:
    std::vector<StoredDocument> documents_;
    size_t position_;
};

/**
 * Documents are kept in insertion order and are immutable once stored.
 * find() snapshots references to the matching documents, so writes made
 * while a cursor is open are not seen by it and deleted documents stay
 * readable until the cursor moves past them.
 */
class CMemoryCollection : public ICollection
{
  public:
    explicit CMemoryCollection(const std::string& name);

    const std::string& name() const override;
    CollectionResult<CDocumentId> insertOne(const CBsonDocument& document) override;
    CollectionResult<int64_t> deleteOne(const CBsonDocument& filter) override;
    CollectionResult<int64_t> deleteMany(const CBsonDocument& filter) override;
    CollectionResult<std::unique_ptr<ICursor>>
    find(const CBsonDocument& filter, const CFindOptions& options) override;
    CollectionResult<std::optional<CBsonDocument>>
    findOne(const CBsonDocument& filter) override;
    CollectionResult<int64_t> countDocuments(const CBsonDocument& filter) override;
    CollectionResult<void> drop() override;
    CollectionResult<void> createIndex(const CBsonDocument& keys) override;

    /* Introspection */
    std::vector<CBsonDocument> indexes() const;
    bool exists() const;

  private:
    std::string name_;
    mutable std::mutex mutex_;
    std::vector<StoredDocument> documents_;
    std::vector<CBsonDocument> indexes_;
    bool exists_;

    CollectionResult<std::vector<size_t>>
    matchingPositions(const CBsonDocument& filter, size_t maxCount) const;
};

class CMemoryDatabase : public IDatabase
{
  public:
    CMemoryDatabase();
    ~CMemoryDatabase() override;

    CollectionResult<void> connect() override;
    void disconnect() override;
    CDatabaseStatus getStatus() const override;
    bool ping() override;

    /* The same name always yields the same collection object */
    std::shared_ptr<ICollection>
    getCollection(const std::string& name,
                  const CCollectionOptions& options) override;
    std::shared_ptr<CMemoryCollection> getMemoryCollection(const std::string& name);

    std::string getConnectionInfo() const override;

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CMemoryCollection>> collections_;
    CDatabaseStatus status_;
};

} // namespace DocBucket
