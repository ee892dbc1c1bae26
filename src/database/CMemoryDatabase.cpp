/*-------------------------------------------------------------------------
 *
 * CMemoryDatabase.cpp
 *      In-process document collections.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */
#include "database/CMemoryDatabase.hpp"
#include "database/CDocumentMatcher.hpp"

#include <algorithm>
#include <limits>

namespace DocBucket
{

/*-------------------------------------------------------------------------
 * CMemoryCursor implementation
 *-------------------------------------------------------------------------*/
CMemoryCursor::CMemoryCursor(std::vector<StoredDocument> documents)
    : documents_(std::move(documents)), position_(0)
{
}

CollectionResult<std::optional<CBsonDocument>> CMemoryCursor::next()
{
    if (position_ >= documents_.size())
        return std::optional<CBsonDocument>();
    StoredDocument document = std::move(documents_[position_++]);
    return std::optional<CBsonDocument>(*document);
}

/*-------------------------------------------------------------------------
 * CMemoryCollection implementation
 *-------------------------------------------------------------------------*/
CMemoryCollection::CMemoryCollection(const std::string& name)
    : name_(name), exists_(false)
{
}

const std::string& CMemoryCollection::name() const
{
    return name_;
}

CollectionResult<std::vector<size_t>>
CMemoryCollection::matchingPositions(const CBsonDocument& filter,
                                     size_t maxCount) const
{
    std::vector<size_t> positions;

    for (size_t i = 0; i < documents_.size() && positions.size() < maxCount;
         ++i)
    {
        auto matched = CDocumentMatcher::matches(*documents_[i], filter);
        if (!matched)
            return std::unexpected(matched.error());
        if (*matched)
            positions.push_back(i);
    }
    return positions;
}

CollectionResult<CDocumentId>
CMemoryCollection::insertOne(const CBsonDocument& document)
{
    CDocumentId id;
    CBsonDocument stored = withDocumentId(document, id);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& existing : documents_)
    {
        auto existingId = CDocumentId::fromField(*existing, "_id");
        if (existingId && *existingId == id)
            return std::unexpected(CCollectionError(
                COLLECTION_ERROR_DUPLICATE_KEY,
                "E11000 duplicate key error collection: " + name_ +
                    " dup key: { _id: " + id.toString() + " }"));
    }
    documents_.push_back(std::make_shared<const CBsonDocument>(std::move(stored)));
    exists_ = true;
    return id;
}

CollectionResult<int64_t> CMemoryCollection::deleteOne(const CBsonDocument& filter)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto positions = matchingPositions(filter, 1);

    if (!positions)
        return std::unexpected(positions.error());
    if (positions->empty())
        return 0;
    documents_.erase(documents_.begin() +
                     static_cast<std::ptrdiff_t>(positions->front()));
    return 1;
}

CollectionResult<int64_t> CMemoryCollection::deleteMany(const CBsonDocument& filter)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto positions = matchingPositions(filter, std::numeric_limits<size_t>::max());

    if (!positions)
        return std::unexpected(positions.error());

    /* Erase back to front so earlier positions stay valid */
    for (auto it = positions->rbegin(); it != positions->rend(); ++it)
        documents_.erase(documents_.begin() + static_cast<std::ptrdiff_t>(*it));
    return static_cast<int64_t>(positions->size());
}

CollectionResult<std::unique_ptr<ICursor>>
CMemoryCollection::find(const CBsonDocument& filter, const CFindOptions& options)
{
    std::vector<StoredDocument> selected;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto positions =
            matchingPositions(filter, std::numeric_limits<size_t>::max());
        if (!positions)
            return std::unexpected(positions.error());
        selected.reserve(positions->size());
        for (size_t position : *positions)
            selected.push_back(documents_[position]);
    }

    if (!options.sort.isEmpty())
    {
        std::stable_sort(selected.begin(), selected.end(),
                         [&options](const StoredDocument& a, const StoredDocument& b)
                         {
                             return CDocumentMatcher::compareForSort(
                                        *a, *b, options.sort) < 0;
                         });
    }

    if (options.skip > 0)
    {
        size_t skip = std::min(selected.size(), static_cast<size_t>(options.skip));
        selected.erase(selected.begin(),
                       selected.begin() + static_cast<std::ptrdiff_t>(skip));
    }
    if (options.limit > 0 && selected.size() > static_cast<size_t>(options.limit))
        selected.resize(static_cast<size_t>(options.limit));

    return std::make_unique<CMemoryCursor>(std::move(selected));
}

CollectionResult<std::optional<CBsonDocument>>
CMemoryCollection::findOne(const CBsonDocument& filter)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto positions = matchingPositions(filter, 1);

    if (!positions)
        return std::unexpected(positions.error());
    if (positions->empty())
        return std::optional<CBsonDocument>();
    return std::optional<CBsonDocument>(*documents_[positions->front()]);
}

CollectionResult<int64_t>
CMemoryCollection::countDocuments(const CBsonDocument& filter)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto positions = matchingPositions(filter, std::numeric_limits<size_t>::max());

    if (!positions)
        return std::unexpected(positions.error());
    return static_cast<int64_t>(positions->size());
}

CollectionResult<void> CMemoryCollection::drop()
{
    std::lock_guard<std::mutex> lock(mutex_);

    documents_.clear();
    indexes_.clear();
    exists_ = false;
    return {};
}

CollectionResult<void> CMemoryCollection::createIndex(const CBsonDocument& keys)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (keys.isEmpty())
        return std::unexpected(CCollectionError(COLLECTION_ERROR_BAD_VALUE,
                                                "index key pattern is empty"));

    for (const auto& existing : indexes_)
    {
        if (existing == keys)
            return {};
    }
    indexes_.push_back(keys);
    exists_ = true;
    return {};
}

std::vector<CBsonDocument> CMemoryCollection::indexes() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return indexes_;
}

bool CMemoryCollection::exists() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return exists_;
}

/*-------------------------------------------------------------------------
 * CMemoryDatabase implementation
 *-------------------------------------------------------------------------*/
CMemoryDatabase::CMemoryDatabase() : status_(CDatabaseStatus::DISCONNECTED)
{
}

CMemoryDatabase::~CMemoryDatabase() = default;

CollectionResult<void> CMemoryDatabase::connect()
{
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = CDatabaseStatus::CONNECTED;
    return {};
}

void CMemoryDatabase::disconnect()
{
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = CDatabaseStatus::DISCONNECTED;
}

CDatabaseStatus CMemoryDatabase::getStatus() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool CMemoryDatabase::ping()
{
    return true;
}

std::shared_ptr<ICollection>
CMemoryDatabase::getCollection(const std::string& name,
                               const CCollectionOptions& /* options */)
{
    return getMemoryCollection(name);
}

std::shared_ptr<CMemoryCollection>
CMemoryDatabase::getMemoryCollection(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = collections_[name];

    if (!slot)
        slot = std::make_shared<CMemoryCollection>(name);
    return slot;
}

std::string CMemoryDatabase::getConnectionInfo() const
{
    return "memory";
}

} /* namespace DocBucket */
