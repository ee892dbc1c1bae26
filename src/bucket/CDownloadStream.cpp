/*-------------------------------------------------------------------------
 *
 * CDownloadStream.cpp
 *      Read side of a bucket: validates and yields chunks in order.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "bucket/CDownloadStream.hpp"

#include "CLogMacros.hpp"

#include <algorithm>
#include <cstring>

namespace DocBucket
{

CDownloadStream::CDownloadStream(std::shared_ptr<ICollection> chunks,
                                 CFileRecord file,
                                 std::shared_ptr<ILogger> logger)
    : chunks_(std::move(chunks)), file_(std::move(file)),
      lastIndex_(CChunkCodec::lastChunkIndex(file_.length, file_.chunkSize)),
      nextIndex_(0), offset_(0), bytesRead_(0), finished_(false),
      logger_(std::move(logger))
{
}

std::unexpected<CBucketError> CDownloadStream::fail(const CBucketError& error)
{
    failure_ = error;
    cursor_.reset();
    warn_log("download of " + file_.id.toString() + " failed: " + error.message());
    return std::unexpected(error);
}

BucketResult<std::optional<CBsonDocument>> CDownloadStream::nextRecord()
{
    if (!cursor_)
    {
        CFindOptions options;
        options.sort = CChunkCodec::chunkSort();

        auto cursor = chunks_->find(CChunkCodec::filesIdFilter(file_.id), options);
        if (!cursor)
            return fail(CBucketError(BucketErrors::CollectionFailure{cursor.error()}));
        cursor_ = std::move(*cursor);
    }

    auto record = cursor_->next();
    if (!record)
        return fail(CBucketError(BucketErrors::CollectionFailure{record.error()}));
    return std::move(*record);
}

BucketResult<bool> CDownloadStream::fetchChunk()
{
    if (failure_)
        return std::unexpected(*failure_);
    if (finished_)
        return false;

    if (file_.length == 0)
    {
        finished_ = true;
        return false;
    }

    auto record = nextRecord();
    if (!record)
        return std::unexpected(record.error());

    if (nextIndex_ > lastIndex_)
    {
        if (*record)
        {
            auto extra = CChunkCodec::decodeChunk(**record);
            return fail(CBucketError(
                BucketErrors::ExtraChunks{extra ? extra->n : nextIndex_}));
        }
        finished_ = true;
        cursor_.reset();
        return false;
    }

    if (!*record)
        return fail(CBucketError(BucketErrors::MissingChunk{nextIndex_}));

    auto chunk = CChunkCodec::decodeChunk(**record);
    if (!chunk)
        return fail(chunk.error());

    /* A gap in the sorted run means chunk nextIndex_ is gone */
    if (chunk->n > nextIndex_)
        return fail(CBucketError(BucketErrors::MissingChunk{nextIndex_}));
    if (chunk->n != nextIndex_)
        return fail(CBucketError(
            BucketErrors::UnexpectedChunkIndex{nextIndex_, chunk->n}));

    int64_t expected =
        CChunkCodec::expectedChunkLength(file_.length, file_.chunkSize, nextIndex_);
    int64_t actual = static_cast<int64_t>(chunk->data.size());
    if (actual != expected)
        return fail(CBucketError(
            BucketErrors::ChunkSizeMismatch{nextIndex_, expected, actual}));

    current_ = std::move(chunk->data);
    offset_ = 0;
    ++nextIndex_;
    return true;
}

BucketResult<std::optional<ByteSpan>> CDownloadStream::nextChunk()
{
    /* Remainder of a chunk partially consumed by read() */
    if (offset_ < current_.size())
    {
        ByteSpan rest = ByteSpan(current_).subspan(offset_);
        offset_ = current_.size();
        bytesRead_ += static_cast<int64_t>(rest.size());
        return std::optional<ByteSpan>(rest);
    }

    auto fetched = fetchChunk();
    if (!fetched)
        return std::unexpected(fetched.error());
    if (!*fetched)
        return std::optional<ByteSpan>();

    offset_ = current_.size();
    bytesRead_ += static_cast<int64_t>(current_.size());
    return std::optional<ByteSpan>(ByteSpan(current_));
}

BucketResult<size_t> CDownloadStream::read(uint8_t* buffer, size_t size)
{
    size_t copied = 0;

    while (copied < size)
    {
        if (offset_ >= current_.size())
        {
            auto fetched = fetchChunk();
            if (!fetched)
            {
                /* Hand back what was copied; the error is sticky */
                if (copied > 0)
                    break;
                return std::unexpected(fetched.error());
            }
            if (!*fetched)
                break;
        }

        size_t take = std::min(size - copied, current_.size() - offset_);
        std::memcpy(buffer + copied, current_.data() + offset_, take);
        offset_ += take;
        copied += take;
    }

    bytesRead_ += static_cast<int64_t>(copied);
    return copied;
}

BucketResult<void> CDownloadStream::writeTo(IByteSink& sink)
{
    while (true)
    {
        auto chunk = nextChunk();
        if (!chunk)
            return std::unexpected(chunk.error());
        if (!*chunk)
            break;

        auto accepted = sink.accept(**chunk);
        if (!accepted)
            return fail(accepted.error());
    }

    debug_log("downloaded " + std::to_string(bytesRead_) + " bytes of " +
              file_.id.toString());
    return {};
}

BucketResult<ByteVector> CDownloadStream::readAll()
{
    CVectorSink sink;

    auto written = writeTo(sink);
    if (!written)
        return std::unexpected(written.error());
    return sink.release();
}

const CFileRecord& CDownloadStream::fileRecord() const noexcept
{
    return file_;
}

int64_t CDownloadStream::bytesRead() const noexcept
{
    return bytesRead_;
}

bool CDownloadStream::finished() const noexcept
{
    return finished_;
}

} /* namespace DocBucket */
