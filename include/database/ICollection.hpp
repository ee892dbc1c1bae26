/*-------------------------------------------------------------------------
 *
 * ICollection.hpp
 *      Document collection interface consumed by the bucket layer.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "../document/CBsonDocument.hpp"
#include "../document/CDocumentId.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace DocBucket
{

/* Error codes shared by every backend */
enum CCollectionErrorCode : int32_t
{
    COLLECTION_ERROR_INTERNAL = 1,
    COLLECTION_ERROR_BAD_VALUE = 2,
    COLLECTION_ERROR_CONNECTION = 6,
    COLLECTION_ERROR_NAMESPACE_NOT_FOUND = 26,
    COLLECTION_ERROR_TIMEOUT = 50,
    COLLECTION_ERROR_DUPLICATE_KEY = 11000
};

struct CCollectionError
{
    int32_t code;
    std::string message;

    CCollectionError() : code(COLLECTION_ERROR_INTERNAL)
    {
    }
    CCollectionError(int32_t c, const std::string& msg) : code(c), message(msg)
    {
    }
};

template <typename T>
using CollectionResult = std::expected<T, CCollectionError>;

struct CFindOptions
{
    CBsonDocument sort;
    int64_t limit;
    int64_t skip;

    CFindOptions() : limit(0), skip(0)
    {
    }
};

/*
 * Read/write policy handed to every collection of a bucket unchanged.
 * Backends that have no such notion ignore the fields they cannot apply.
 */
struct CCollectionOptions
{
    std::string readPreference;
    int32_t writeConcernW;
    int64_t maxTimeMS;

    CCollectionOptions() : readPreference("primary"), writeConcernW(1), maxTimeMS(0)
    {
    }
};

/**
 * Lazy, forward-only sequence of documents.  next() yields an empty optional
 * once the sequence is exhausted.
 */
class ICursor
{
  public:
    virtual ~ICursor() = default;
    virtual CollectionResult<std::optional<CBsonDocument>> next() = 0;
};

class ICollection
{
  public:
    virtual ~ICollection() = default;

    virtual const std::string& name() const = 0;

    /* Inserts the document, returning its _id */
    virtual CollectionResult<CDocumentId>
    insertOne(const CBsonDocument& document) = 0;
    virtual CollectionResult<int64_t> deleteOne(const CBsonDocument& filter) = 0;
    virtual CollectionResult<int64_t>
    deleteMany(const CBsonDocument& filter) = 0;
    virtual CollectionResult<std::unique_ptr<ICursor>>
    find(const CBsonDocument& filter, const CFindOptions& options) = 0;
    virtual CollectionResult<std::optional<CBsonDocument>>
    findOne(const CBsonDocument& filter) = 0;
    virtual CollectionResult<int64_t>
    countDocuments(const CBsonDocument& filter) = 0;

    /* Dropping a collection that does not exist succeeds */
    virtual CollectionResult<void> drop() = 0;

    /* Idempotent; keys is an ordered {field: 1|-1} document */
    virtual CollectionResult<void> createIndex(const CBsonDocument& keys) = 0;
};

/* Name libbson-style drivers give an index: "files_id_1_n_1" */
std::string indexNameForKeys(const CBsonDocument& keys);

/* The document itself when it carries an _id, else a copy with a new one */
CBsonDocument withDocumentId(const CBsonDocument& document, CDocumentId& id);

} /* namespace DocBucket */
