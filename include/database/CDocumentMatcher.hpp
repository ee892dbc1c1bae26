/*-------------------------------------------------------------------------
 *
 * CDocumentMatcher.hpp
 *      Client-side evaluation of query filters and sort specifications.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "ICollection.hpp"

#include <bson/bson.h>

namespace DocBucket
{

/**
 * Evaluates the filter subset understood by every backend: field equality
 * on dotted paths, $eq $ne $gt $gte $lt $lte $in $nin $exists, and
 * top-level $and / $or.
 */
class CDocumentMatcher
{
  public:
    static CollectionResult<bool> matches(const CBsonDocument& document,
                                          const CBsonDocument& filter);

    /* Ordering of two sort keys; missing fields sort as null */
    static int compareForSort(const CBsonDocument& left,
                              const CBsonDocument& right,
                              const CBsonDocument& sort);

    /* BSON comparison order: <0, 0 or >0 */
    static int compareValues(const bson_iter_t* left, const bson_iter_t* right);

    /* Canonical type bracket used by compareValues */
    static int typeRank(bson_type_t type);

  private:
    static CollectionResult<bool> matchClauses(const CBsonDocument& document,
                                               const bson_iter_t* clauses,
                                               bool requireAll);
    static CollectionResult<bool> matchField(const CBsonDocument& document,
                                             const std::string& path,
                                             const bson_iter_t* condition);
    static CollectionResult<bool> matchOperator(const std::string& op,
                                                const bson_iter_t* value,
                                                bool present,
                                                const bson_iter_t* operand);
    static bool valueEquals(const bson_iter_t* value, bool present,
                            const bson_iter_t* operand);
    static bool isOperatorDocument(const bson_iter_t* condition);
};

} /* namespace DocBucket */
