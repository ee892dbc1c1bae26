/*-------------------------------------------------------------------------
 *
 * CBsonDocument.hpp
 *      Owning wrapper around a libbson document.
 *      Part of the DocBucket chunked object store.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "../CTypes.hpp"

#include <bson/bson.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DocBucket
{

/**
 * A BSON document with value semantics.  Copies are deep, moves transfer
 * the underlying bson_t.  Builders return false when libbson rejects the
 * append; the reason is kept in getLastError().
 *
 * Getters accept dotted paths ("metadata.owner").
 */
class CBsonDocument
{
  public:
    CBsonDocument();
    explicit CBsonDocument(const bson_t* doc);
    CBsonDocument(const CBsonDocument& other);
    CBsonDocument(CBsonDocument&& other) noexcept;
    CBsonDocument& operator=(const CBsonDocument& other);
    CBsonDocument& operator=(CBsonDocument&& other) noexcept;
    ~CBsonDocument();

    /* Takes ownership of a heap allocated bson_t */
    static CBsonDocument adopt(bson_t* doc);
    static std::optional<CBsonDocument> fromData(const uint8_t* data,
                                                 size_t size);
    static std::optional<CBsonDocument> fromJson(const std::string& json,
                                                 std::string* error = nullptr);

    bool appendString(const std::string& key, const std::string& value);
    bool appendInt32(const std::string& key, int32_t value);
    bool appendInt64(const std::string& key, int64_t value);
    bool appendDouble(const std::string& key, double value);
    bool appendBool(const std::string& key, bool value);
    bool appendNull(const std::string& key);
    bool appendObjectId(const std::string& key, const bson_oid_t& oid);
    bool appendDateTime(const std::string& key, DateTimeMs value);
    bool appendBinary(const std::string& key, ByteSpan data);
    bool appendDocument(const std::string& key, const CBsonDocument& subdoc);
    bool appendArray(const std::string& key, const CBsonDocument& array);
    bool appendStringArray(const std::string& key,
                           const std::vector<std::string>& values);
    bool appendValue(const std::string& key, const bson_value_t* value);
    bool appendIterValue(const std::string& key, const bson_iter_t* iter);

    bool hasField(const std::string& key) const;
    bool findField(const std::string& key, bson_iter_t* out) const;
    std::vector<std::string> fieldNames() const;

    std::optional<int32_t> getInt32(const std::string& key) const;
    std::optional<int64_t> getInt64(const std::string& key) const;
    std::optional<double> getDouble(const std::string& key) const;
    std::optional<bool> getBool(const std::string& key) const;
    std::optional<std::string> getString(const std::string& key) const;
    std::optional<DateTimeMs> getDateTime(const std::string& key) const;
    std::optional<ByteVector> getBinary(const std::string& key) const;
    std::optional<CBsonDocument> getDocument(const std::string& key) const;
    std::optional<std::vector<std::string>>
    getStringArray(const std::string& key) const;

    const bson_t* get() const noexcept;
    const uint8_t* data() const noexcept;
    size_t size() const noexcept;
    uint32_t fieldCount() const;
    bool isEmpty() const noexcept;
    ByteVector toBytes() const;

    std::string toJson() const;        // canonical extended JSON
    std::string toRelaxedJson() const; // relaxed extended JSON

    bool operator==(const CBsonDocument& other) const;
    bool operator!=(const CBsonDocument& other) const;

    std::string getLastError() const;

  private:
    bson_t* doc_;
    mutable std::string lastError_;

    bool appendFailed(const std::string& what, const std::string& key);
};

} /* namespace DocBucket */
