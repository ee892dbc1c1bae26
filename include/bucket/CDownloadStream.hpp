/*-------------------------------------------------------------------------
 *
 * CDownloadStream.hpp
 *      Read side of a bucket: validates and yields chunks in order.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "../IInterfaces.hpp"
#include "../database/ICollection.hpp"
#include "CChunkCodec.hpp"
#include "IByteSink.hpp"

#include <memory>
#include <optional>

namespace DocBucket
{

/**
 * Chunks are read lazily through a {files_id} cursor sorted on n.  Each
 * chunk must carry the next expected index and exactly the expected
 * number of bytes; after the last index the cursor must be exhausted.
 * The first failure is terminal and returned again by every later call.
 *
 * An empty file yields nothing and never queries the chunks collection.
 */
class CDownloadStream
{
  public:
    CDownloadStream(std::shared_ptr<ICollection> chunks, CFileRecord file,
                    std::shared_ptr<ILogger> logger);

    CDownloadStream(const CDownloadStream&) = delete;
    CDownloadStream& operator=(const CDownloadStream&) = delete;

    /*
     * Next validated chunk, or an empty optional at end of file.  The
     * span stays valid until the next call on this stream.
     */
    BucketResult<std::optional<ByteSpan>> nextChunk();

    /* Copies up to size bytes across chunk boundaries; 0 at end of file */
    BucketResult<size_t> read(uint8_t* buffer, size_t size);

    /* Drives the rest of the stream into the sink */
    BucketResult<void> writeTo(IByteSink& sink);

    BucketResult<ByteVector> readAll();

    const CFileRecord& fileRecord() const noexcept;
    int64_t bytesRead() const noexcept;
    bool finished() const noexcept;

  private:
    std::shared_ptr<ICollection> chunks_;
    CFileRecord file_;
    std::unique_ptr<ICursor> cursor_;
    int64_t lastIndex_;
    int64_t nextIndex_;
    ByteVector current_;
    size_t offset_;
    int64_t bytesRead_;
    bool finished_;
    std::optional<CBucketError> failure_;
    std::shared_ptr<ILogger> logger_;

    /* Loads the next chunk into current_; false at end of file */
    BucketResult<bool> fetchChunk();
    BucketResult<std::optional<CBsonDocument>> nextRecord();
    std::unexpected<CBucketError> fail(const CBucketError& error);
};

} /* namespace DocBucket */
