/*-------------------------------------------------------------------------
 *
 * CBsonDocument.cpp
 *      Owning wrapper around a libbson document.
 *      Part of the DocBucket chunked object store.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CBsonDocument.hpp"

#include <cmath>
#include <cstring>
#include <utility>

namespace DocBucket
{

namespace
{

/* Stands in for moved-from documents */
const bson_t*
emptyDocument()
{
    static const bson_t empty = BSON_INITIALIZER;
    return &empty;
}

} /* anonymous namespace */

CBsonDocument::CBsonDocument() : doc_(bson_new())
{
}

CBsonDocument::CBsonDocument(const bson_t* doc)
    : doc_(doc ? bson_copy(doc) : bson_new())
{
}

CBsonDocument::CBsonDocument(const CBsonDocument& other)
    : doc_(bson_copy(other.get())), lastError_()
{
}

CBsonDocument::CBsonDocument(CBsonDocument&& other) noexcept
    : doc_(std::exchange(other.doc_, nullptr)),
      lastError_(std::move(other.lastError_))
{
}

CBsonDocument& CBsonDocument::operator=(const CBsonDocument& other)
{
    if (this != &other)
    {
        bson_t* copy = bson_copy(other.get());
        if (doc_)
            bson_destroy(doc_);
        doc_ = copy;
        lastError_.clear();
    }
    return *this;
}

CBsonDocument& CBsonDocument::operator=(CBsonDocument&& other) noexcept
{
    if (this != &other)
    {
        if (doc_)
            bson_destroy(doc_);
        doc_ = std::exchange(other.doc_, nullptr);
        lastError_ = std::move(other.lastError_);
    }
    return *this;
}

CBsonDocument::~CBsonDocument()
{
    if (doc_)
        bson_destroy(doc_);
}

CBsonDocument CBsonDocument::adopt(bson_t* doc)
{
    CBsonDocument result;

    if (doc)
    {
        bson_destroy(result.doc_);
        result.doc_ = doc;
    }
    return result;
}

std::optional<CBsonDocument> CBsonDocument::fromData(const uint8_t* data,
                                                     size_t size)
{
    if (!data || size < 5)
        return std::nullopt;

    bson_t* parsed = bson_new_from_data(data, size);
    if (!parsed)
        return std::nullopt;

    if (!bson_validate(parsed, BSON_VALIDATE_NONE, nullptr))
    {
        bson_destroy(parsed);
        return std::nullopt;
    }
    return adopt(parsed);
}

std::optional<CBsonDocument> CBsonDocument::fromJson(const std::string& json,
                                                     std::string* error)
{
    bson_error_t bsonError;

    bson_t* parsed = bson_new_from_json(
        reinterpret_cast<const uint8_t*>(json.data()),
        static_cast<ssize_t>(json.size()), &bsonError);
    if (!parsed)
    {
        if (error)
            *error = bsonError.message;
        return std::nullopt;
    }
    return adopt(parsed);
}

bool CBsonDocument::appendFailed(const std::string& what,
                                 const std::string& key)
{
    lastError_ = "Failed to add " + what + " '" + key + "'";
    return false;
}

bool CBsonDocument::appendString(const std::string& key,
                                 const std::string& value)
{
    if (!doc_)
        doc_ = bson_new();
    if (!bson_append_utf8(doc_, key.c_str(), -1, value.c_str(),
                          static_cast<int>(value.size())))
        return appendFailed("string", key);
    return true;
}

bool CBsonDocument::appendInt32(const std::string& key, int32_t value)
{
    if (!doc_)
        doc_ = bson_new();
    if (!bson_append_int32(doc_, key.c_str(), -1, value))
        return appendFailed("int32", key);
    return true;
}

bool CBsonDocument::appendInt64(const std::string& key, int64_t value)
{
    if (!doc_)
        doc_ = bson_new();
    if (!bson_append_int64(doc_, key.c_str(), -1, value))
        return appendFailed("int64", key);
    return true;
}

bool CBsonDocument::appendDouble(const std::string& key, double value)
{
    if (!doc_)
        doc_ = bson_new();
    if (!bson_append_double(doc_, key.c_str(), -1, value))
        return appendFailed("double", key);
    return true;
}

bool CBsonDocument::appendBool(const std::string& key, bool value)
{
    if (!doc_)
        doc_ = bson_new();
    if (!bson_append_bool(doc_, key.c_str(), -1, value))
        return appendFailed("bool", key);
    return true;
}

bool CBsonDocument::appendNull(const std::string& key)
{
    if (!doc_)
        doc_ = bson_new();
    if (!bson_append_null(doc_, key.c_str(), -1))
        return appendFailed("null", key);
    return true;
}

bool CBsonDocument::appendObjectId(const std::string& key,
                                   const bson_oid_t& oid)
{
    if (!doc_)
        doc_ = bson_new();
    if (!bson_append_oid(doc_, key.c_str(), -1, &oid))
        return appendFailed("ObjectId", key);
    return true;
}

bool CBsonDocument::appendDateTime(const std::string& key, DateTimeMs value)
{
    if (!doc_)
        doc_ = bson_new();
    if (!bson_append_date_time(doc_, key.c_str(), -1, value))
        return appendFailed("datetime", key);
    return true;
}

bool CBsonDocument::appendBinary(const std::string& key, ByteSpan data)
{
    if (!doc_)
        doc_ = bson_new();
    if (!bson_append_binary(doc_, key.c_str(), -1, BSON_SUBTYPE_BINARY,
                            data.data(), static_cast<uint32_t>(data.size())))
        return appendFailed("binary", key);
    return true;
}

bool CBsonDocument::appendDocument(const std::string& key,
                                   const CBsonDocument& subdoc)
{
    if (!doc_)
        doc_ = bson_new();
    if (!bson_append_document(doc_, key.c_str(), -1, subdoc.get()))
        return appendFailed("document", key);
    return true;
}

bool CBsonDocument::appendArray(const std::string& key,
                                const CBsonDocument& array)
{
    if (!doc_)
        doc_ = bson_new();
    if (!bson_append_array(doc_, key.c_str(), -1, array.get()))
        return appendFailed("array", key);
    return true;
}

bool CBsonDocument::appendStringArray(const std::string& key,
                                      const std::vector<std::string>& values)
{
    bson_t child;

    if (!doc_)
        doc_ = bson_new();
    if (!bson_append_array_begin(doc_, key.c_str(), -1, &child))
        return appendFailed("array", key);

    for (size_t i = 0; i < values.size(); ++i)
    {
        char buffer[16];
        const char* indexKey;

        bson_uint32_to_string(static_cast<uint32_t>(i), &indexKey, buffer,
                              sizeof(buffer));
        bson_append_utf8(&child, indexKey, -1, values[i].c_str(),
                         static_cast<int>(values[i].size()));
    }

    if (!bson_append_array_end(doc_, &child))
        return appendFailed("array", key);
    return true;
}

bool CBsonDocument::appendValue(const std::string& key,
                                const bson_value_t* value)
{
    if (!doc_)
        doc_ = bson_new();
    if (!value || !bson_append_value(doc_, key.c_str(), -1, value))
        return appendFailed("value", key);
    return true;
}

bool CBsonDocument::appendIterValue(const std::string& key,
                                    const bson_iter_t* iter)
{
    if (!doc_)
        doc_ = bson_new();
    if (!iter || !bson_append_iter(doc_, key.c_str(), -1, iter))
        return appendFailed("value", key);
    return true;
}

bool CBsonDocument::findField(const std::string& key, bson_iter_t* out) const
{
    bson_iter_t iter;

    if (!bson_iter_init(&iter, get()))
        return false;
    if (key.find('.') == std::string::npos)
    {
        if (!bson_iter_find(&iter, key.c_str()))
            return false;
        *out = iter;
        return true;
    }
    return bson_iter_find_descendant(&iter, key.c_str(), out);
}

bool CBsonDocument::hasField(const std::string& key) const
{
    bson_iter_t iter;
    return findField(key, &iter);
}

std::vector<std::string> CBsonDocument::fieldNames() const
{
    std::vector<std::string> names;
    bson_iter_t iter;

    if (bson_iter_init(&iter, get()))
    {
        while (bson_iter_next(&iter))
            names.emplace_back(bson_iter_key(&iter));
    }
    return names;
}

std::optional<int32_t> CBsonDocument::getInt32(const std::string& key) const
{
    std::optional<int64_t> wide = getInt64(key);

    if (!wide || *wide < INT32_MIN || *wide > INT32_MAX)
        return std::nullopt;
    return static_cast<int32_t>(*wide);
}

std::optional<int64_t> CBsonDocument::getInt64(const std::string& key) const
{
    bson_iter_t iter;

    if (!findField(key, &iter))
        return std::nullopt;

    if (BSON_ITER_HOLDS_INT32(&iter))
        return bson_iter_int32(&iter);
    if (BSON_ITER_HOLDS_INT64(&iter))
        return bson_iter_int64(&iter);
    if (BSON_ITER_HOLDS_DOUBLE(&iter))
    {
        /* Some writers store lengths as doubles */
        double value = bson_iter_double(&iter);
        /* 2^63 itself is out of range; -2^63 is exact */
        constexpr double limit = 9223372036854775808.0;
        if (std::isfinite(value) && std::floor(value) == value &&
            value >= -limit && value < limit)
            return static_cast<int64_t>(value);
    }
    return std::nullopt;
}

std::optional<double> CBsonDocument::getDouble(const std::string& key) const
{
    bson_iter_t iter;

    if (!findField(key, &iter) || !BSON_ITER_HOLDS_NUMBER(&iter))
        return std::nullopt;
    return bson_iter_as_double(&iter);
}

std::optional<bool> CBsonDocument::getBool(const std::string& key) const
{
    bson_iter_t iter;

    if (!findField(key, &iter) || !BSON_ITER_HOLDS_BOOL(&iter))
        return std::nullopt;
    return bson_iter_bool(&iter);
}

std::optional<std::string> CBsonDocument::getString(
    const std::string& key) const
{
    bson_iter_t iter;
    uint32_t length = 0;

    if (!findField(key, &iter) || !BSON_ITER_HOLDS_UTF8(&iter))
        return std::nullopt;

    const char* value = bson_iter_utf8(&iter, &length);
    return std::string(value, length);
}

std::optional<DateTimeMs> CBsonDocument::getDateTime(
    const std::string& key) const
{
    bson_iter_t iter;

    if (!findField(key, &iter) || !BSON_ITER_HOLDS_DATE_TIME(&iter))
        return std::nullopt;
    return bson_iter_date_time(&iter);
}

std::optional<ByteVector> CBsonDocument::getBinary(const std::string& key) const
{
    bson_iter_t iter;
    bson_subtype_t subtype;
    uint32_t length = 0;
    const uint8_t* binary = nullptr;

    if (!findField(key, &iter) || !BSON_ITER_HOLDS_BINARY(&iter))
        return std::nullopt;

    bson_iter_binary(&iter, &subtype, &length, &binary);
    if (!binary)
        return ByteVector();
    return ByteVector(binary, binary + length);
}

std::optional<CBsonDocument> CBsonDocument::getDocument(
    const std::string& key) const
{
    bson_iter_t iter;
    uint32_t length = 0;
    const uint8_t* data = nullptr;

    if (!findField(key, &iter) || !BSON_ITER_HOLDS_DOCUMENT(&iter))
        return std::nullopt;

    bson_iter_document(&iter, &length, &data);
    return fromData(data, length);
}

std::optional<std::vector<std::string>> CBsonDocument::getStringArray(
    const std::string& key) const
{
    bson_iter_t iter;
    bson_iter_t child;
    std::vector<std::string> values;

    if (!findField(key, &iter) || !BSON_ITER_HOLDS_ARRAY(&iter) ||
        !bson_iter_recurse(&iter, &child))
        return std::nullopt;

    while (bson_iter_next(&child))
    {
        uint32_t length = 0;
        if (!BSON_ITER_HOLDS_UTF8(&child))
            return std::nullopt;
        const char* value = bson_iter_utf8(&child, &length);
        values.emplace_back(value, length);
    }
    return values;
}

const bson_t* CBsonDocument::get() const noexcept
{
    return doc_ ? doc_ : emptyDocument();
}

const uint8_t* CBsonDocument::data() const noexcept
{
    return bson_get_data(get());
}

size_t CBsonDocument::size() const noexcept
{
    return get()->len;
}

uint32_t CBsonDocument::fieldCount() const
{
    return bson_count_keys(get());
}

bool CBsonDocument::isEmpty() const noexcept
{
    /* Empty BSON document is 5 bytes */
    return get()->len == 5;
}

ByteVector CBsonDocument::toBytes() const
{
    const uint8_t* bytes = data();
    return ByteVector(bytes, bytes + size());
}

std::string CBsonDocument::toJson() const
{
    size_t length = 0;
    char* json = bson_as_canonical_extended_json(get(), &length);

    if (!json)
    {
        lastError_ = "Failed to convert to canonical JSON";
        return std::string();
    }
    std::string result(json, length);
    bson_free(json);
    return result;
}

std::string CBsonDocument::toRelaxedJson() const
{
    size_t length = 0;
    char* json = bson_as_relaxed_extended_json(get(), &length);

    if (!json)
    {
        lastError_ = "Failed to convert to relaxed JSON";
        return std::string();
    }
    std::string result(json, length);
    bson_free(json);
    return result;
}

bool CBsonDocument::operator==(const CBsonDocument& other) const
{
    return bson_equal(get(), other.get());
}

bool CBsonDocument::operator!=(const CBsonDocument& other) const
{
    return !(*this == other);
}

std::string CBsonDocument::getLastError() const
{
    return lastError_;
}

} /* namespace DocBucket */
