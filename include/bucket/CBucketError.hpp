/*-------------------------------------------------------------------------
 *
 * CBucketError.hpp
 *      Error taxonomy of the bucket layer.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "../database/ICollection.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <variant>

namespace DocBucket
{

namespace BucketErrors
{

/* No file document carries the requested id */
struct FileNotFound
{
    std::string id;
};

/* Chunk n is absent: the cursor ended or skipped past it */
struct MissingChunk
{
    int64_t n;
};

/* A duplicate or out of order index */
struct UnexpectedChunkIndex
{
    int64_t expected;
    int64_t actual;
};

struct ChunkSizeMismatch
{
    int64_t n;
    int64_t expected;
    int64_t actual;
};

/* A chunk was found past the last index; n is the first extra one */
struct ExtraChunks
{
    int64_t n;
};

struct InvalidArgument
{
    std::string message;
};

struct CorruptDocument
{
    std::string message;
};

/* The caller's source stream or sink failed */
struct StreamIoError
{
    std::string message;
};

struct CollectionFailure
{
    CCollectionError error;
};

} /* namespace BucketErrors */

/**
 * Closed set of bucket failures.  Inspect with is<T>() / as<T>(), or
 * std::visit over detail().
 */
class CBucketError
{
  public:
    using Detail = std::variant<BucketErrors::FileNotFound, BucketErrors::MissingChunk,
                                BucketErrors::UnexpectedChunkIndex,
                                BucketErrors::ChunkSizeMismatch, BucketErrors::ExtraChunks,
                                BucketErrors::InvalidArgument,
                                BucketErrors::CorruptDocument, BucketErrors::StreamIoError,
                                BucketErrors::CollectionFailure>;

    explicit CBucketError(Detail detail) : detail_(std::move(detail))
    {
    }

    const Detail& detail() const noexcept
    {
        return detail_;
    }

    template <typename T>
    bool is() const noexcept
    {
        return std::holds_alternative<T>(detail_);
    }

    template <typename T>
    const T* as() const noexcept
    {
        return std::get_if<T>(&detail_);
    }

    /* Variant name, e.g. "MissingChunk" */
    std::string kind() const;

    /* Human readable description including the payload */
    std::string message() const;

  private:
    Detail detail_;
};

template <typename T>
using BucketResult = std::expected<T, CBucketError>;

/* Shorthand for std::unexpected(CBucketError(detail)) */
inline std::unexpected<CBucketError> bucketFailure(CBucketError::Detail detail)
{
    return std::unexpected<CBucketError>(CBucketError(std::move(detail)));
}

inline std::unexpected<CBucketError> collectionFailure(const CCollectionError& error)
{
    return bucketFailure(BucketErrors::CollectionFailure{error});
}

} /* namespace DocBucket */
