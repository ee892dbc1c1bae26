/*-------------------------------------------------------------------------
 *
 * CChunkCodec.cpp
 *      Chunk and file document layout plus chunk arithmetic.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "bucket/CChunkCodec.hpp"

namespace DocBucket
{

namespace
{

std::unexpected<CBucketError> corrupt(const std::string& message)
{
    return bucketFailure(BucketErrors::CorruptDocument{message});
}

std::unexpected<CBucketError> encodeFailed(const CBsonDocument& document)
{
    return bucketFailure(
        BucketErrors::InvalidArgument{"unable to encode document: " + document.getLastError()});
}

} /* anonymous namespace */

BucketResult<CBsonDocument> CChunkCodec::encodeChunk(const CDocumentId& filesId,
                                                     int32_t n, ByteSpan data)
{
    CBsonDocument chunk;

    if (filesId.empty())
        return bucketFailure(BucketErrors::InvalidArgument{"chunk has no files_id"});

    if (!CDocumentId::generate().appendTo(chunk, "_id") ||
        !filesId.appendTo(chunk, "files_id") || !chunk.appendInt32("n", n) ||
        !chunk.appendBinary("data", data))
        return encodeFailed(chunk);
    return chunk;
}

BucketResult<CChunkRecord> CChunkCodec::decodeChunk(const CBsonDocument& document)
{
    CChunkRecord record;

    auto filesId = CDocumentId::fromField(document, "files_id");
    if (!filesId)
        return corrupt("chunk has no files_id");
    record.filesId = *filesId;

    auto n = document.getInt32("n");
    if (!n)
        return corrupt("chunk for " + filesId->toString() + " has no integer n");
    record.n = *n;

    auto data = document.getBinary("data");
    if (!data)
        return corrupt("chunk " + std::to_string(*n) + " of " + filesId->toString() +
                       " has no binary data");
    record.data = std::move(*data);
    return record;
}

BucketResult<CBsonDocument> CChunkCodec::encodeFile(const CFileRecord& file)
{
    CBsonDocument document;

    if (file.id.empty())
        return bucketFailure(BucketErrors::InvalidArgument{"file has no id"});

    if (!file.id.appendTo(document, "_id") ||
        !document.appendInt64("length", file.length) ||
        !document.appendInt32("chunkSize", file.chunkSize) ||
        !document.appendDateTime("uploadDate", file.uploadDate))
        return encodeFailed(document);

    if (file.md5 && !document.appendString("md5", *file.md5))
        return encodeFailed(document);
    if (!document.appendString("filename", file.filename))
        return encodeFailed(document);
    if (file.contentType && !document.appendString("contentType", *file.contentType))
        return encodeFailed(document);
    if (file.aliases && !document.appendStringArray("aliases", *file.aliases))
        return encodeFailed(document);
    if (file.metadata && !document.appendDocument("metadata", *file.metadata))
        return encodeFailed(document);
    return document;
}

BucketResult<CFileRecord> CChunkCodec::decodeFile(const CBsonDocument& document)
{
    CFileRecord file;

    auto id = CDocumentId::fromField(document, "_id");
    if (!id)
        return corrupt("file document has no _id");
    file.id = *id;

    auto length = document.getInt64("length");
    if (!length || *length < 0)
        return corrupt("file " + id->toString() + " has no valid length");
    file.length = *length;

    auto chunkSize = document.getInt32("chunkSize");
    if (!chunkSize || *chunkSize <= 0)
        return corrupt("file " + id->toString() + " has no valid chunkSize");
    file.chunkSize = *chunkSize;

    file.filename = document.getString("filename").value_or("");
    file.uploadDate = document.getDateTime("uploadDate").value_or(0);
    file.md5 = document.getString("md5");
    file.metadata = document.getDocument("metadata");
    file.contentType = document.getString("contentType");
    file.aliases = document.getStringArray("aliases");
    return file;
}

int64_t CChunkCodec::chunkCount(int64_t length, int32_t chunkSize)
{
    if (length <= 0 || chunkSize <= 0)
        return 0;
    /* length + chunkSize - 1 can overflow for lengths near INT64_MAX */
    return length / chunkSize + (length % chunkSize != 0 ? 1 : 0);
}

int64_t CChunkCodec::lastChunkIndex(int64_t length, int32_t chunkSize)
{
    return chunkCount(length, chunkSize) - 1;
}

int64_t CChunkCodec::expectedChunkLength(int64_t length, int32_t chunkSize,
                                         int64_t n)
{
    int64_t last = lastChunkIndex(length, chunkSize);

    if (n < 0 || n > last)
        return 0;
    if (n < last)
        return chunkSize;

    int64_t tail = length % chunkSize;
    return tail == 0 ? chunkSize : tail;
}

CBsonDocument CChunkCodec::idFilter(const CDocumentId& id)
{
    CBsonDocument filter;
    id.appendTo(filter, "_id");
    return filter;
}

CBsonDocument CChunkCodec::filesIdFilter(const CDocumentId& id)
{
    CBsonDocument filter;
    id.appendTo(filter, "files_id");
    return filter;
}

CBsonDocument CChunkCodec::chunkSort()
{
    CBsonDocument sort;
    sort.appendInt32("n", 1);
    return sort;
}

CBsonDocument CChunkCodec::filesIndexKeys()
{
    CBsonDocument keys;
    keys.appendInt32("filename", 1);
    keys.appendInt32("uploadDate", 1);
    return keys;
}

CBsonDocument CChunkCodec::chunksIndexKeys()
{
    CBsonDocument keys;
    keys.appendInt32("files_id", 1);
    keys.appendInt32("n", 1);
    return keys;
}

} /* namespace DocBucket */
