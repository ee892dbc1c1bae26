/*-------------------------------------------------------------------------
 *
 * ICollection.cpp
 *      Helpers shared by the collection backends.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "database/ICollection.hpp"

namespace DocBucket
{

std::string indexNameForKeys(const CBsonDocument& keys)
{
    std::string name;
    bson_iter_t iter;

    if (!bson_iter_init(&iter, keys.get()))
        return name;

    while (bson_iter_next(&iter))
    {
        if (!name.empty())
            name += "_";
        name += bson_iter_key(&iter);
        name += "_";
        if (BSON_ITER_HOLDS_NUMBER(&iter))
            name += std::to_string(bson_iter_as_int64(&iter));
        else if (BSON_ITER_HOLDS_UTF8(&iter))
            name += bson_iter_utf8(&iter, nullptr);
    }
    return name;
}

CBsonDocument withDocumentId(const CBsonDocument& document, CDocumentId& id)
{
    auto existing = CDocumentId::fromField(document, "_id");
    if (existing)
    {
        id = *existing;
        return document;
    }

    /* Generated _id goes first, as a server would place it */
    CBsonDocument stored;
    bson_iter_t iter;

    id = CDocumentId::generate();
    id.appendTo(stored, "_id");
    if (bson_iter_init(&iter, document.get()))
    {
        while (bson_iter_next(&iter))
            stored.appendIterValue(bson_iter_key(&iter), &iter);
    }
    return stored;
}

} /* namespace DocBucket */
