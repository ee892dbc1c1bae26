/*-------------------------------------------------------------------------
 *
 * CChunkCodec.hpp
 *      Chunk and file document layout plus chunk arithmetic.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "../CTypes.hpp"
#include "../document/CBsonDocument.hpp"
#include "../document/CDocumentId.hpp"
#include "CBucketError.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace DocBucket
{

/* One slice of a stored object: {_id, files_id, n, data} */
struct CChunkRecord
{
    CDocumentId filesId;
    int32_t n;
    ByteVector data;

    CChunkRecord() : n(0)
    {
    }
};

/* The files collection entry describing one stored object */
struct CFileRecord
{
    CDocumentId id;
    std::string filename;
    int64_t length;
    int32_t chunkSize;
    DateTimeMs uploadDate;
    std::optional<std::string> md5;
    std::optional<CBsonDocument> metadata;
    std::optional<std::string> contentType;
    std::optional<StringVector> aliases;

    CFileRecord() : length(0), chunkSize(0), uploadDate(0)
    {
    }
};

/**
 * Stateless mapping between records and documents.  Decoding is strict:
 * a missing or mistyped required field is a CorruptDocument error.
 *
 * Chunk arithmetic for length L and chunk size C > 0:
 *     chunkCount          ceil(L / C), zero iff L == 0
 *     lastChunkIndex      chunkCount - 1, -1 for an empty file
 *     expectedChunkLength C, except L mod C (when nonzero) for the last one
 */
class CChunkCodec
{
  public:
    static BucketResult<CBsonDocument> encodeChunk(const CDocumentId& filesId,
                                                   int32_t n, ByteSpan data);
    static BucketResult<CChunkRecord> decodeChunk(const CBsonDocument& document);

    static BucketResult<CBsonDocument> encodeFile(const CFileRecord& file);
    static BucketResult<CFileRecord> decodeFile(const CBsonDocument& document);

    static int64_t chunkCount(int64_t length, int32_t chunkSize);
    static int64_t lastChunkIndex(int64_t length, int32_t chunkSize);
    static int64_t expectedChunkLength(int64_t length, int32_t chunkSize, int64_t n);

    /* {_id: id} */
    static CBsonDocument idFilter(const CDocumentId& id);
    /* {files_id: id} */
    static CBsonDocument filesIdFilter(const CDocumentId& id);
    /* {n: 1} */
    static CBsonDocument chunkSort();

    /* {filename: 1, uploadDate: 1} */
    static CBsonDocument filesIndexKeys();
    /* {files_id: 1, n: 1} */
    static CBsonDocument chunksIndexKeys();
};

} /* namespace DocBucket */
