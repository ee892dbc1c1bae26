/*-------------------------------------------------------------------------
 *
 * CDocumentMatcher.cpp
 *      Client-side evaluation of query filters and sort specifications.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "database/CDocumentMatcher.hpp"

#include <algorithm>
#include <cstring>

namespace DocBucket
{

int CDocumentMatcher::typeRank(bson_type_t type)
{
    switch (type)
    {
    case BSON_TYPE_MINKEY:
        return 0;
    case BSON_TYPE_UNDEFINED:
    case BSON_TYPE_NULL:
    case BSON_TYPE_EOD:
        return 1;
    case BSON_TYPE_INT32:
    case BSON_TYPE_INT64:
    case BSON_TYPE_DOUBLE:
    case BSON_TYPE_DECIMAL128:
        return 2;
    case BSON_TYPE_UTF8:
    case BSON_TYPE_SYMBOL:
        return 3;
    case BSON_TYPE_DOCUMENT:
        return 4;
    case BSON_TYPE_ARRAY:
        return 5;
    case BSON_TYPE_BINARY:
        return 6;
    case BSON_TYPE_OID:
        return 7;
    case BSON_TYPE_BOOL:
        return 8;
    case BSON_TYPE_DATE_TIME:
        return 9;
    case BSON_TYPE_TIMESTAMP:
        return 10;
    case BSON_TYPE_REGEX:
        return 11;
    case BSON_TYPE_MAXKEY:
        return 13;
    default:
        return 12;
    }
}

namespace
{

template <typename T>
int threeWay(const T& a, const T& b)
{
    if (a < b)
        return -1;
    if (b < a)
        return 1;
    return 0;
}

int compareBytes(const uint8_t* a, uint32_t alen, const uint8_t* b,
                 uint32_t blen)
{
    int cmp = std::memcmp(a, b, std::min(alen, blen));

    if (cmp != 0)
        return cmp < 0 ? -1 : 1;
    return threeWay(alen, blen);
}

} /* anonymous namespace */

int CDocumentMatcher::compareValues(const bson_iter_t* left,
                                    const bson_iter_t* right)
{
    bson_type_t ltype = left ? bson_iter_type(left) : BSON_TYPE_NULL;
    bson_type_t rtype = right ? bson_iter_type(right) : BSON_TYPE_NULL;
    int lrank = typeRank(ltype);
    int rrank = typeRank(rtype);

    if (lrank != rrank)
        return threeWay(lrank, rrank);

    switch (lrank)
    {
    case 1:
        return 0;
    case 2:
        if ((ltype == BSON_TYPE_INT32 || ltype == BSON_TYPE_INT64) &&
            (rtype == BSON_TYPE_INT32 || rtype == BSON_TYPE_INT64))
            return threeWay(bson_iter_as_int64(left), bson_iter_as_int64(right));
        return threeWay(bson_iter_as_double(left), bson_iter_as_double(right));
    case 3:
    {
        uint32_t llen = 0;
        uint32_t rlen = 0;
        const char* lstr = ltype == BSON_TYPE_UTF8
                               ? bson_iter_utf8(left, &llen)
                               : bson_iter_symbol(left, &llen);
        const char* rstr = rtype == BSON_TYPE_UTF8
                               ? bson_iter_utf8(right, &rlen)
                               : bson_iter_symbol(right, &rlen);
        return compareBytes(reinterpret_cast<const uint8_t*>(lstr), llen,
                            reinterpret_cast<const uint8_t*>(rstr), rlen);
    }
    case 4:
    case 5:
    {
        uint32_t llen = 0;
        uint32_t rlen = 0;
        const uint8_t* ldata = nullptr;
        const uint8_t* rdata = nullptr;
        if (ltype == BSON_TYPE_DOCUMENT)
        {
            bson_iter_document(left, &llen, &ldata);
            bson_iter_document(right, &rlen, &rdata);
        }
        else
        {
            bson_iter_array(left, &llen, &ldata);
            bson_iter_array(right, &rlen, &rdata);
        }
        return compareBytes(ldata, llen, rdata, rlen);
    }
    case 6:
    {
        bson_subtype_t lsub;
        bson_subtype_t rsub;
        uint32_t llen = 0;
        uint32_t rlen = 0;
        const uint8_t* ldata = nullptr;
        const uint8_t* rdata = nullptr;
        bson_iter_binary(left, &lsub, &llen, &ldata);
        bson_iter_binary(right, &rsub, &rlen, &rdata);
        if (llen != rlen)
            return threeWay(llen, rlen);
        if (lsub != rsub)
            return threeWay(static_cast<int>(lsub), static_cast<int>(rsub));
        return llen == 0 ? 0 : compareBytes(ldata, llen, rdata, rlen);
    }
    case 7:
    {
        int cmp = bson_oid_compare(bson_iter_oid(left), bson_iter_oid(right));
        return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }
    case 8:
        return threeWay(bson_iter_bool(left), bson_iter_bool(right));
    case 9:
        return threeWay(bson_iter_date_time(left), bson_iter_date_time(right));
    case 10:
    {
        uint32_t lts, lin, rts, rin;
        bson_iter_timestamp(left, &lts, &lin);
        bson_iter_timestamp(right, &rts, &rin);
        if (lts != rts)
            return threeWay(lts, rts);
        return threeWay(lin, rin);
    }
    default:
        return 0;
    }
}

bool CDocumentMatcher::isOperatorDocument(const bson_iter_t* condition)
{
    bson_iter_t child;

    if (!BSON_ITER_HOLDS_DOCUMENT(condition) ||
        !bson_iter_recurse(condition, &child) || !bson_iter_next(&child))
        return false;
    return bson_iter_key(&child)[0] == '$';
}

bool CDocumentMatcher::valueEquals(const bson_iter_t* value, bool present,
                                   const bson_iter_t* operand)
{
    bson_type_t operandType = bson_iter_type(operand);

    /* {field: null} also matches documents without the field */
    if (!present)
        return operandType == BSON_TYPE_NULL;

    if (typeRank(bson_iter_type(value)) == typeRank(operandType) &&
        compareValues(value, operand) == 0)
        return true;

    /* Scalar against array: any element may match */
    if (BSON_ITER_HOLDS_ARRAY(value) && operandType != BSON_TYPE_ARRAY)
    {
        bson_iter_t element;
        if (bson_iter_recurse(value, &element))
        {
            while (bson_iter_next(&element))
            {
                if (typeRank(bson_iter_type(&element)) == typeRank(operandType) &&
                    compareValues(&element, operand) == 0)
                    return true;
            }
        }
    }
    return false;
}

CollectionResult<bool> CDocumentMatcher::matchOperator(
    const std::string& op, const bson_iter_t* value, bool present,
    const bson_iter_t* operand)
{
    if (op == "$eq")
        return valueEquals(value, present, operand);
    if (op == "$ne")
        return !valueEquals(value, present, operand);

    if (op == "$gt" || op == "$gte" || op == "$lt" || op == "$lte")
    {
        if (!present ||
            typeRank(bson_iter_type(value)) != typeRank(bson_iter_type(operand)))
            return false;

        int cmp = compareValues(value, operand);
        if (op == "$gt")
            return cmp > 0;
        if (op == "$gte")
            return cmp >= 0;
        if (op == "$lt")
            return cmp < 0;
        return cmp <= 0;
    }

    if (op == "$in" || op == "$nin")
    {
        bson_iter_t element;
        bool found = false;

        if (!BSON_ITER_HOLDS_ARRAY(operand) ||
            !bson_iter_recurse(operand, &element))
            return std::unexpected(CCollectionError(
                COLLECTION_ERROR_BAD_VALUE, op + " needs an array"));

        while (!found && bson_iter_next(&element))
            found = valueEquals(value, present, &element);
        return op == "$in" ? found : !found;
    }

    if (op == "$exists")
        return present == bson_iter_as_bool(operand);

    return std::unexpected(CCollectionError(COLLECTION_ERROR_BAD_VALUE,
                                            "unknown operator: " + op));
}

CollectionResult<bool> CDocumentMatcher::matchField(
    const CBsonDocument& document, const std::string& path,
    const bson_iter_t* condition)
{
    bson_iter_t value;
    bool present = document.findField(path, &value);

    if (!isOperatorDocument(condition))
        return valueEquals(&value, present, condition);

    bson_iter_t op;
    if (!bson_iter_recurse(condition, &op))
        return false;

    while (bson_iter_next(&op))
    {
        auto result = matchOperator(bson_iter_key(&op), &value, present, &op);
        if (!result)
            return result;
        if (!*result)
            return false;
    }
    return true;
}

CollectionResult<bool> CDocumentMatcher::matchClauses(
    const CBsonDocument& document, const bson_iter_t* clauses, bool requireAll)
{
    bson_iter_t clause;
    bool any = false;

    if (!BSON_ITER_HOLDS_ARRAY(clauses) || !bson_iter_recurse(clauses, &clause))
        return std::unexpected(CCollectionError(
            COLLECTION_ERROR_BAD_VALUE, "$and/$or need an array of filters"));

    while (bson_iter_next(&clause))
    {
        uint32_t length = 0;
        const uint8_t* data = nullptr;

        if (!BSON_ITER_HOLDS_DOCUMENT(&clause))
            return std::unexpected(CCollectionError(
                COLLECTION_ERROR_BAD_VALUE, "$and/$or entries must be documents"));

        bson_iter_document(&clause, &length, &data);
        auto sub = CBsonDocument::fromData(data, length);
        if (!sub)
            return std::unexpected(CCollectionError(
                COLLECTION_ERROR_BAD_VALUE, "corrupt $and/$or entry"));

        auto result = matches(document, *sub);
        if (!result)
            return result;
        if (requireAll && !*result)
            return false;
        any = any || *result;
    }
    return requireAll ? true : any;
}

CollectionResult<bool> CDocumentMatcher::matches(const CBsonDocument& document,
                                                 const CBsonDocument& filter)
{
    bson_iter_t iter;

    if (!bson_iter_init(&iter, filter.get()))
        return std::unexpected(
            CCollectionError(COLLECTION_ERROR_BAD_VALUE, "corrupt filter"));

    while (bson_iter_next(&iter))
    {
        std::string key = bson_iter_key(&iter);
        CollectionResult<bool> result;

        if (key == "$and")
            result = matchClauses(document, &iter, true);
        else if (key == "$or")
            result = matchClauses(document, &iter, false);
        else if (!key.empty() && key[0] == '$')
            return std::unexpected(CCollectionError(
                COLLECTION_ERROR_BAD_VALUE, "unknown top level operator: " + key));
        else
            result = matchField(document, key, &iter);

        if (!result)
            return result;
        if (!*result)
            return false;
    }
    return true;
}

int CDocumentMatcher::compareForSort(const CBsonDocument& left,
                                     const CBsonDocument& right,
                                     const CBsonDocument& sort)
{
    bson_iter_t sortKey;

    if (!bson_iter_init(&sortKey, sort.get()))
        return 0;

    while (bson_iter_next(&sortKey))
    {
        std::string field = bson_iter_key(&sortKey);
        int direction = bson_iter_as_int64(&sortKey) < 0 ? -1 : 1;
        bson_iter_t lvalue;
        bson_iter_t rvalue;
        bool lpresent = left.findField(field, &lvalue);
        bool rpresent = right.findField(field, &rvalue);

        int cmp = compareValues(lpresent ? &lvalue : nullptr,
                                rpresent ? &rvalue : nullptr);
        if (cmp != 0)
            return cmp * direction;
    }
    return 0;
}

} /* namespace DocBucket */
