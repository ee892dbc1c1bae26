/*-------------------------------------------------------------------------
 *
 * CDocumentId.cpp
 *      Opaque document identifier (ObjectId, string or integer).
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CDocumentId.hpp"

#include <utility>

namespace DocBucket
{

namespace
{

const char* const kValueKey = "v";

} /* anonymous namespace */

CDocumentId::CDocumentId() : holder_()
{
}

CDocumentId::CDocumentId(CBsonDocument holder) : holder_(std::move(holder))
{
}

CDocumentId CDocumentId::generate()
{
    bson_oid_t oid;

    bson_oid_init(&oid, nullptr);
    return fromObjectId(oid);
}

CDocumentId CDocumentId::fromObjectId(const bson_oid_t& oid)
{
    CBsonDocument holder;

    holder.appendObjectId(kValueKey, oid);
    return CDocumentId(std::move(holder));
}

std::optional<CDocumentId> CDocumentId::fromObjectIdString(
    const std::string& hex)
{
    bson_oid_t oid;

    if (!bson_oid_is_valid(hex.c_str(), hex.length()))
        return std::nullopt;
    bson_oid_init_from_string(&oid, hex.c_str());
    return fromObjectId(oid);
}

CDocumentId CDocumentId::fromString(const std::string& value)
{
    CBsonDocument holder;

    holder.appendString(kValueKey, value);
    return CDocumentId(std::move(holder));
}

CDocumentId CDocumentId::fromInt64(int64_t value)
{
    CBsonDocument holder;

    holder.appendInt64(kValueKey, value);
    return CDocumentId(std::move(holder));
}

std::optional<CDocumentId> CDocumentId::fromIterator(const bson_iter_t* iter)
{
    CBsonDocument holder;

    if (!iter || !holder.appendIterValue(kValueKey, iter))
        return std::nullopt;
    return CDocumentId(std::move(holder));
}

std::optional<CDocumentId> CDocumentId::fromField(const CBsonDocument& doc,
                                                  const std::string& key)
{
    bson_iter_t iter;

    if (!doc.findField(key, &iter))
        return std::nullopt;
    return fromIterator(&iter);
}

CDocumentId CDocumentId::parse(const std::string& text)
{
    if (text.size() == 24)
    {
        if (auto oid = fromObjectIdString(text))
            return *oid;
    }
    return fromString(text);
}

bool CDocumentId::empty() const noexcept
{
    return holder_.isEmpty();
}

bson_type_t CDocumentId::type() const
{
    bson_iter_t iter;

    if (!holder_.findField(kValueKey, &iter))
        return BSON_TYPE_EOD;
    return bson_iter_type(&iter);
}

bool CDocumentId::appendTo(CBsonDocument& doc, const std::string& key) const
{
    bson_iter_t iter;

    if (!holder_.findField(kValueKey, &iter))
        return false;
    return doc.appendIterValue(key, &iter);
}

std::string CDocumentId::toString() const
{
    bson_iter_t iter;

    if (!holder_.findField(kValueKey, &iter))
        return std::string();

    switch (bson_iter_type(&iter))
    {
    case BSON_TYPE_OID:
    {
        char hex[25];
        bson_oid_to_string(bson_iter_oid(&iter), hex);
        return std::string(hex);
    }
    case BSON_TYPE_UTF8:
    {
        uint32_t length = 0;
        const char* value = bson_iter_utf8(&iter, &length);
        return std::string(value, length);
    }
    case BSON_TYPE_INT32:
        return std::to_string(bson_iter_int32(&iter));
    case BSON_TYPE_INT64:
        return std::to_string(bson_iter_int64(&iter));
    default:
        return canonicalKey();
    }
}

std::string CDocumentId::canonicalKey() const
{
    return holder_.toJson();
}

bool CDocumentId::operator==(const CDocumentId& other) const
{
    return holder_ == other.holder_;
}

bool CDocumentId::operator!=(const CDocumentId& other) const
{
    return !(*this == other);
}

} /* namespace DocBucket */
