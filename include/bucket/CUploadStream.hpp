/*-------------------------------------------------------------------------
 *
 * CUploadStream.hpp
 *      Write side of a bucket: splits a byte stream into chunks.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "../IInterfaces.hpp"
#include "../database/ICollection.hpp"
#include "CChunkCodec.hpp"
#include "CMd5Digest.hpp"

#include <memory>
#include <optional>

namespace DocBucket
{

enum class CUploadState : uint8_t
{
    Open = 0,
    Closed = 1,
    Aborted = 2,
    Failed = 3
};

/**
 * Buffers written bytes and inserts one chunk document each time a full
 * chunk is available.  close() flushes the short tail chunk and then
 * inserts the file document, which makes the object visible.
 *
 * After an insert fails the stream is Failed and every later write() or
 * close() returns that same error; abort() may still remove the chunks.
 * Destroying an open stream leaves its chunks orphaned and no file
 * document.
 */
class CUploadStream
{
  public:
    CUploadStream(std::shared_ptr<ICollection> files,
                  std::shared_ptr<ICollection> chunks, CFileRecord pending,
                  bool computeMD5, std::shared_ptr<ILogger> logger);
    ~CUploadStream();

    CUploadStream(const CUploadStream&) = delete;
    CUploadStream& operator=(const CUploadStream&) = delete;

    BucketResult<void> write(ByteSpan bytes);
    BucketResult<CFileRecord> close();

    /* Deletes the chunks written so far */
    BucketResult<void> abort();

    const CDocumentId& id() const noexcept;
    const std::string& filename() const noexcept;
    int32_t chunkSizeBytes() const noexcept;
    int64_t bytesWritten() const noexcept;
    int32_t chunksWritten() const noexcept;
    CUploadState state() const noexcept;

  private:
    std::shared_ptr<ICollection> files_;
    std::shared_ptr<ICollection> chunks_;
    CFileRecord pending_;
    std::unique_ptr<CMd5Digest> md5_;
    ByteVector buffer_;
    int32_t nextIndex_;
    int64_t bytesWritten_;
    CUploadState state_;
    std::optional<CBucketError> failure_;
    std::shared_ptr<ILogger> logger_;

    BucketResult<void> checkWritable(const char* operation) const;
    BucketResult<void> insertChunk(ByteSpan data);
    std::unexpected<CBucketError> fail(const CBucketError& error);
};

} /* namespace DocBucket */
