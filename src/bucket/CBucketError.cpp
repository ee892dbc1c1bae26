/*-------------------------------------------------------------------------
 *
 * CBucketError.cpp
 *      Error taxonomy of the bucket layer.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "bucket/CBucketError.hpp"

namespace DocBucket
{

namespace
{

struct KindVisitor
{
    std::string operator()(const BucketErrors::FileNotFound&) const
    {
        return "FileNotFound";
    }
    std::string operator()(const BucketErrors::MissingChunk&) const
    {
        return "MissingChunk";
    }
    std::string operator()(const BucketErrors::UnexpectedChunkIndex&) const
    {
        return "UnexpectedChunkIndex";
    }
    std::string operator()(const BucketErrors::ChunkSizeMismatch&) const
    {
        return "ChunkSizeMismatch";
    }
    std::string operator()(const BucketErrors::ExtraChunks&) const
    {
        return "ExtraChunks";
    }
    std::string operator()(const BucketErrors::InvalidArgument&) const
    {
        return "InvalidArgument";
    }
    std::string operator()(const BucketErrors::CorruptDocument&) const
    {
        return "CorruptDocument";
    }
    std::string operator()(const BucketErrors::StreamIoError&) const
    {
        return "StreamIoError";
    }
    std::string operator()(const BucketErrors::CollectionFailure&) const
    {
        return "CollectionFailure";
    }
};

struct MessageVisitor
{
    std::string operator()(const BucketErrors::FileNotFound& e) const
    {
        return "file not found: " + e.id;
    }
    std::string operator()(const BucketErrors::MissingChunk& e) const
    {
        return "missing chunk " + std::to_string(e.n);
    }
    std::string operator()(const BucketErrors::UnexpectedChunkIndex& e) const
    {
        return "expected chunk " + std::to_string(e.expected) + " but found chunk " +
               std::to_string(e.actual);
    }
    std::string operator()(const BucketErrors::ChunkSizeMismatch& e) const
    {
        return "chunk " + std::to_string(e.n) + " has " + std::to_string(e.actual) +
               " bytes, expected " + std::to_string(e.expected);
    }
    std::string operator()(const BucketErrors::ExtraChunks& e) const
    {
        return "extra chunk " + std::to_string(e.n) + " past the end of the file";
    }
    std::string operator()(const BucketErrors::InvalidArgument& e) const
    {
        return "invalid argument: " + e.message;
    }
    std::string operator()(const BucketErrors::CorruptDocument& e) const
    {
        return "corrupt document: " + e.message;
    }
    std::string operator()(const BucketErrors::StreamIoError& e) const
    {
        return "stream I/O error: " + e.message;
    }
    std::string operator()(const BucketErrors::CollectionFailure& e) const
    {
        return "collection error " + std::to_string(e.error.code) + ": " +
               e.error.message;
    }
};

} /* anonymous namespace */

std::string CBucketError::kind() const
{
    return std::visit(KindVisitor(), detail_);
}

std::string CBucketError::message() const
{
    return std::visit(MessageVisitor(), detail_);
}

} /* namespace DocBucket */
