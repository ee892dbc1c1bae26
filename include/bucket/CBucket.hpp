/*-------------------------------------------------------------------------
 *
 * CBucket.hpp
 *      Chunked binary object store over a pair of document collections.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "../IInterfaces.hpp"
#include "../database/IDatabase.hpp"
#include "CChunkCodec.hpp"
#include "CDownloadStream.hpp"
#include "CUploadStream.hpp"
#include "IByteSink.hpp"

#include <atomic>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace DocBucket
{

struct CBucketOptions
{
    static constexpr int32_t kDefaultChunkSize = 255 * 1024;

    std::string bucketName;
    int32_t chunkSizeBytes;
    bool disableMD5;
    CCollectionOptions collectionOptions;

    CBucketOptions()
        : bucketName("fs"), chunkSizeBytes(kDefaultChunkSize), disableMD5(false)
    {
    }
};

/* Per-upload settings; unset fields fall back to the bucket's */
struct CUploadOptions
{
    std::optional<CDocumentId> id;
    std::optional<int32_t> chunkSizeBytes;
    std::optional<CBsonDocument> metadata;
    std::optional<std::string> contentType;
    std::optional<StringVector> aliases;
};

/* Decodes file documents from a files collection cursor */
class CFileCursor
{
  public:
    explicit CFileCursor(std::unique_ptr<ICursor> cursor);

    BucketResult<std::optional<CFileRecord>> next();

  private:
    std::unique_ptr<ICursor> cursor_;
};

/**
 * A bucket named B stores file documents in "B.files" and chunks in
 * "B.chunks".  The bucket itself only remembers whether its indexes have
 * been ensured; everything else lives in the collections.
 */
class CBucket
{
  public:
    CBucket(std::shared_ptr<IDatabase> database,
            const CBucketOptions& options = CBucketOptions(),
            std::shared_ptr<ILogger> logger = nullptr);

    CBucket(const CBucket&) = delete;
    CBucket& operator=(const CBucket&) = delete;

    BucketResult<std::unique_ptr<CUploadStream>>
    openUploadStream(const std::string& filename,
                     const CUploadOptions& options = CUploadOptions());

    /* Reads source to end of file in chunk sized slices */
    BucketResult<CDocumentId>
    uploadFromStream(const std::string& filename, std::istream& source,
                     const CUploadOptions& options = CUploadOptions());

    BucketResult<std::unique_ptr<CDownloadStream>>
    openDownloadStream(const CDocumentId& id);
    BucketResult<void> downloadToStream(const CDocumentId& id, IByteSink& sink);

    /*
     * Removes the file document and then all of its chunks.  The chunk
     * delete runs even when no file document matched, in which case the
     * result is FileNotFound.
     */
    BucketResult<void> deleteFile(const CDocumentId& id);

    BucketResult<CFileCursor> find(const CBsonDocument& filter,
                                   const CFindOptions& options = CFindOptions());

    /* Drops files, then chunks */
    BucketResult<void> drop();

    BucketResult<void> ensureIndexes();

    const std::string& bucketName() const noexcept;
    int32_t chunkSizeBytes() const noexcept;
    bool md5Disabled() const noexcept;
    std::shared_ptr<ICollection> filesCollection() const;
    std::shared_ptr<ICollection> chunksCollection() const;

  private:
    std::shared_ptr<IDatabase> database_;
    CBucketOptions options_;
    std::shared_ptr<ICollection> files_;
    std::shared_ptr<ICollection> chunks_;
    std::atomic<bool> indexesEnsured_;
    std::shared_ptr<ILogger> logger_;
};

} /* namespace DocBucket */
