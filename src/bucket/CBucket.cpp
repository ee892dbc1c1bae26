/*-------------------------------------------------------------------------
 *
 * CBucket.cpp
 *      Chunked binary object store over a pair of document collections.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "bucket/CBucket.hpp"

#include "CLogMacros.hpp"

namespace DocBucket
{

/*-------------------------------------------------------------------------
 * CFileCursor implementation
 *-------------------------------------------------------------------------*/
CFileCursor::CFileCursor(std::unique_ptr<ICursor> cursor)
    : cursor_(std::move(cursor))
{
}

BucketResult<std::optional<CFileRecord>> CFileCursor::next()
{
    auto document = cursor_->next();
    if (!document)
        return collectionFailure(document.error());
    if (!*document)
        return std::optional<CFileRecord>();

    auto file = CChunkCodec::decodeFile(**document);
    if (!file)
        return std::unexpected(file.error());
    return std::optional<CFileRecord>(std::move(*file));
}

/*-------------------------------------------------------------------------
 * CBucket implementation
 *-------------------------------------------------------------------------*/
CBucket::CBucket(std::shared_ptr<IDatabase> database, const CBucketOptions& options,
                 std::shared_ptr<ILogger> logger)
    : database_(std::move(database)), options_(options), indexesEnsured_(false),
      logger_(std::move(logger))
{
    files_ = database_->getCollection(options_.bucketName + ".files",
                                      options_.collectionOptions);
    chunks_ = database_->getCollection(options_.bucketName + ".chunks",
                                       options_.collectionOptions);
}

BucketResult<void> CBucket::ensureIndexes()
{
    if (indexesEnsured_.load())
        return {};

    auto filesIndex = files_->createIndex(CChunkCodec::filesIndexKeys());
    if (!filesIndex)
        return collectionFailure(filesIndex.error());

    auto chunksIndex = chunks_->createIndex(CChunkCodec::chunksIndexKeys());
    if (!chunksIndex)
        return collectionFailure(chunksIndex.error());

    indexesEnsured_.store(true);
    debug_log("indexes ensured for bucket " + options_.bucketName);
    return {};
}

BucketResult<std::unique_ptr<CUploadStream>>
CBucket::openUploadStream(const std::string& filename, const CUploadOptions& options)
{
    int32_t chunkSize = options.chunkSizeBytes.value_or(options_.chunkSizeBytes);
    if (chunkSize <= 0)
        return bucketFailure(BucketErrors::InvalidArgument{
            "chunk size must be positive, got " + std::to_string(chunkSize)});
    if (options.id && options.id->empty())
        return bucketFailure(BucketErrors::InvalidArgument{"file id is empty"});

    auto indexed = ensureIndexes();
    if (!indexed)
        return std::unexpected(indexed.error());

    CFileRecord pending;
    pending.id = options.id ? *options.id : CDocumentId::generate();
    pending.filename = filename;
    pending.chunkSize = chunkSize;
    pending.metadata = options.metadata;
    pending.contentType = options.contentType;
    pending.aliases = options.aliases;

    return std::make_unique<CUploadStream>(files_, chunks_, std::move(pending),
                                           !options_.disableMD5, logger_);
}

BucketResult<CDocumentId> CBucket::uploadFromStream(const std::string& filename,
                                                    std::istream& source,
                                                    const CUploadOptions& options)
{
    auto stream = openUploadStream(filename, options);
    if (!stream)
        return std::unexpected(stream.error());

    ByteVector slice(static_cast<size_t>((*stream)->chunkSizeBytes()));
    while (source)
    {
        source.read(reinterpret_cast<char*>(slice.data()),
                    static_cast<std::streamsize>(slice.size()));
        std::streamsize got = source.gcount();
        if (got <= 0)
            break;

        auto written = (*stream)->write(ByteSpan(slice.data(), static_cast<size_t>(got)));
        if (!written)
            return std::unexpected(written.error());
    }

    if (source.bad())
    {
        warn_log("reading upload source for " + filename + " failed");
        auto aborted = (*stream)->abort();
        if (!aborted)
            warn_log("cleanup of partial upload " + (*stream)->id().toString() +
                     " failed: " + aborted.error().message());
        return bucketFailure(BucketErrors::StreamIoError{"reading upload source failed"});
    }

    auto closed = (*stream)->close();
    if (!closed)
        return std::unexpected(closed.error());
    return closed->id;
}

BucketResult<std::unique_ptr<CDownloadStream>>
CBucket::openDownloadStream(const CDocumentId& id)
{
    if (id.empty())
        return bucketFailure(BucketErrors::InvalidArgument{"file id is empty"});

    auto document = files_->findOne(CChunkCodec::idFilter(id));
    if (!document)
        return collectionFailure(document.error());
    if (!*document)
        return bucketFailure(BucketErrors::FileNotFound{id.toString()});

    auto file = CChunkCodec::decodeFile(**document);
    if (!file)
        return std::unexpected(file.error());

    debug_log("download stream opened for " + id.toString() + " (" +
              std::to_string(file->length) + " bytes)");
    return std::make_unique<CDownloadStream>(chunks_, std::move(*file), logger_);
}

BucketResult<void> CBucket::downloadToStream(const CDocumentId& id, IByteSink& sink)
{
    auto stream = openDownloadStream(id);
    if (!stream)
        return std::unexpected(stream.error());
    return (*stream)->writeTo(sink);
}

BucketResult<void> CBucket::deleteFile(const CDocumentId& id)
{
    if (id.empty())
        return bucketFailure(BucketErrors::InvalidArgument{"file id is empty"});

    auto filesDeleted = files_->deleteOne(CChunkCodec::idFilter(id));
    if (!filesDeleted)
        return collectionFailure(filesDeleted.error());

    auto chunksDeleted = chunks_->deleteMany(CChunkCodec::filesIdFilter(id));
    if (!chunksDeleted)
        return collectionFailure(chunksDeleted.error());

    if (*filesDeleted != 1)
    {
        warn_log("delete of " + id.toString() + " matched " +
                 std::to_string(*filesDeleted) + " file document(s), removed " +
                 std::to_string(*chunksDeleted) + " chunk(s)");
        return bucketFailure(BucketErrors::FileNotFound{id.toString()});
    }

    debug_log("deleted " + id.toString() + " and " + std::to_string(*chunksDeleted) +
              " chunk(s)");
    return {};
}

BucketResult<CFileCursor> CBucket::find(const CBsonDocument& filter,
                                        const CFindOptions& options)
{
    auto cursor = files_->find(filter, options);
    if (!cursor)
        return collectionFailure(cursor.error());
    return CFileCursor(std::move(*cursor));
}

BucketResult<void> CBucket::drop()
{
    auto filesDropped = files_->drop();
    if (!filesDropped)
        return collectionFailure(filesDropped.error());

    auto chunksDropped = chunks_->drop();
    if (!chunksDropped)
        return collectionFailure(chunksDropped.error());

    /* A later upload recreates the indexes */
    indexesEnsured_.store(false);
    info_log("dropped bucket " + options_.bucketName);
    return {};
}

const std::string& CBucket::bucketName() const noexcept
{
    return options_.bucketName;
}

int32_t CBucket::chunkSizeBytes() const noexcept
{
    return options_.chunkSizeBytes;
}

bool CBucket::md5Disabled() const noexcept
{
    return options_.disableMD5;
}

std::shared_ptr<ICollection> CBucket::filesCollection() const
{
    return files_;
}

std::shared_ptr<ICollection> CBucket::chunksCollection() const
{
    return chunks_;
}

} /* namespace DocBucket */
