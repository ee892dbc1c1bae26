/*-------------------------------------------------------------------------
 *
 * CUploadStream.cpp
 *      Write side of a bucket: splits a byte stream into chunks.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "bucket/CUploadStream.hpp"

#include "CLogMacros.hpp"

#include <algorithm>

namespace DocBucket
{

CUploadStream::CUploadStream(std::shared_ptr<ICollection> files,
                             std::shared_ptr<ICollection> chunks,
                             CFileRecord pending, bool computeMD5,
                             std::shared_ptr<ILogger> logger)
    : files_(std::move(files)), chunks_(std::move(chunks)),
      pending_(std::move(pending)), nextIndex_(0), bytesWritten_(0),
      state_(CUploadState::Open), logger_(std::move(logger))
{
    if (computeMD5)
    {
        md5_ = std::make_unique<CMd5Digest>();
        if (!md5_->isValid())
        {
            warn_log("MD5 is unavailable, file " + pending_.id.toString() +
                     " is stored without md5");
            md5_.reset();
        }
    }
    buffer_.reserve(static_cast<size_t>(pending_.chunkSize));
    debug_log("upload stream opened for " + pending_.id.toString() + " (" +
              pending_.filename + ", chunk size " +
              std::to_string(pending_.chunkSize) + ")");
}

CUploadStream::~CUploadStream()
{
    if (state_ == CUploadState::Open)
    {
        warn_log("upload stream for " + pending_.id.toString() +
                 " destroyed without close; " + std::to_string(nextIndex_) +
                 " chunk(s) left without a file document");
    }
}

BucketResult<void> CUploadStream::checkWritable(const char* operation) const
{
    switch (state_)
    {
    case CUploadState::Open:
        return {};
    case CUploadState::Failed:
        return std::unexpected(*failure_);
    case CUploadState::Closed:
        return bucketFailure(BucketErrors::InvalidArgument{
            std::string(operation) + " on a closed upload stream"});
    case CUploadState::Aborted:
    default:
        return bucketFailure(BucketErrors::InvalidArgument{
            std::string(operation) + " on an aborted upload stream"});
    }
}

std::unexpected<CBucketError> CUploadStream::fail(const CBucketError& error)
{
    state_ = CUploadState::Failed;
    failure_ = error;
    debug_log("upload stream for " + pending_.id.toString() +
              " failed: " + error.message());
    return std::unexpected(error);
}

BucketResult<void> CUploadStream::insertChunk(ByteSpan data)
{
    auto chunk = CChunkCodec::encodeChunk(pending_.id, nextIndex_, data);
    if (!chunk)
        return fail(chunk.error());

    auto inserted = chunks_->insertOne(*chunk);
    if (!inserted)
        return fail(CBucketError(BucketErrors::CollectionFailure{inserted.error()}));

    trace_log("inserted chunk " + std::to_string(nextIndex_) + " of " +
              pending_.id.toString() + " (" + std::to_string(data.size()) +
              " bytes)");
    ++nextIndex_;
    return {};
}

BucketResult<void> CUploadStream::write(ByteSpan bytes)
{
    auto writable = checkWritable("write");
    if (!writable)
        return writable;

    const size_t chunkSize = static_cast<size_t>(pending_.chunkSize);

    if (md5_)
        md5_->update(bytes);
    bytesWritten_ += static_cast<int64_t>(bytes.size());

    /* Top up a partial chunk first */
    if (!buffer_.empty())
    {
        size_t take = std::min(chunkSize - buffer_.size(), bytes.size());
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.begin() + take);
        bytes = bytes.subspan(take);

        if (buffer_.size() < chunkSize)
            return {};

        auto flushed = insertChunk(ByteSpan(buffer_));
        if (!flushed)
            return flushed;
        buffer_.clear();
    }

    /* Whole chunks go straight from the caller's slice */
    while (bytes.size() >= chunkSize)
    {
        auto inserted = insertChunk(bytes.first(chunkSize));
        if (!inserted)
            return inserted;
        bytes = bytes.subspan(chunkSize);
    }

    buffer_.assign(bytes.begin(), bytes.end());
    return {};
}

BucketResult<CFileRecord> CUploadStream::close()
{
    auto writable = checkWritable("close");
    if (!writable)
        return std::unexpected(writable.error());

    if (!buffer_.empty())
    {
        auto flushed = insertChunk(ByteSpan(buffer_));
        if (!flushed)
            return std::unexpected(flushed.error());
        buffer_.clear();
    }

    CFileRecord file = pending_;
    file.length = bytesWritten_;
    file.uploadDate = currentDateTimeMs();
    if (md5_)
        file.md5 = md5_->finalHex();

    auto document = CChunkCodec::encodeFile(file);
    if (!document)
        return fail(document.error());

    auto inserted = files_->insertOne(*document);
    if (!inserted)
        return fail(CBucketError(BucketErrors::CollectionFailure{inserted.error()}));

    state_ = CUploadState::Closed;
    debug_log("upload stream closed for " + file.id.toString() + ": " +
              std::to_string(file.length) + " bytes in " +
              std::to_string(nextIndex_) + " chunk(s)");
    return file;
}

BucketResult<void> CUploadStream::abort()
{
    if (state_ == CUploadState::Closed || state_ == CUploadState::Aborted)
        return checkWritable("abort");

    auto deleted = chunks_->deleteMany(CChunkCodec::filesIdFilter(pending_.id));
    if (!deleted)
        return fail(CBucketError(BucketErrors::CollectionFailure{deleted.error()}));

    state_ = CUploadState::Aborted;
    buffer_.clear();
    debug_log("upload stream aborted for " + pending_.id.toString() + ", removed " +
              std::to_string(*deleted) + " chunk(s)");
    return {};
}

const CDocumentId& CUploadStream::id() const noexcept
{
    return pending_.id;
}

const std::string& CUploadStream::filename() const noexcept
{
    return pending_.filename;
}

int32_t CUploadStream::chunkSizeBytes() const noexcept
{
    return pending_.chunkSize;
}

int64_t CUploadStream::bytesWritten() const noexcept
{
    return bytesWritten_;
}

int32_t CUploadStream::chunksWritten() const noexcept
{
    return nextIndex_;
}

CUploadState CUploadStream::state() const noexcept
{
    return state_;
}

} /* namespace DocBucket */
