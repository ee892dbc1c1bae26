/*-------------------------------------------------------------------------
 *
 * CDocumentId.hpp
 *      Opaque document identifier (ObjectId, string or integer).
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CBsonDocument.hpp"

#include <bson/bson.h>
#include <optional>
#include <string>

namespace DocBucket
{

class CDocumentId
{
  public:
    CDocumentId();

    static CDocumentId generate();
    static CDocumentId fromObjectId(const bson_oid_t& oid);
    static std::optional<CDocumentId> fromObjectIdString(const std::string& hex);
    static CDocumentId fromString(const std::string& value);
    static CDocumentId fromInt64(int64_t value);
    static std::optional<CDocumentId> fromIterator(const bson_iter_t* iter);
    static std::optional<CDocumentId> fromField(const CBsonDocument& doc,
                                                const std::string& key);

    /* 24 hex digits become an ObjectId, anything else a string id */
    static CDocumentId parse(const std::string& text);

    bool empty() const noexcept;
    bson_type_t type() const;
    bool appendTo(CBsonDocument& doc, const std::string& key) const;

    /* Display form: hex for ObjectIds, the raw value otherwise */
    std::string toString() const;

    /* Canonical extended JSON of the value, stable across equal ids */
    std::string canonicalKey() const;

    bool operator==(const CDocumentId& other) const;
    bool operator!=(const CDocumentId& other) const;

  private:
    /* {"v": <value>}, or an empty document for an unset id */
    CBsonDocument holder_;

    explicit CDocumentId(CBsonDocument holder);
};

} /* namespace DocBucket */
