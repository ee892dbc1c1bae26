/*-------------------------------------------------------------------------
 *
 * test_memory_collection.cpp
 *      Filter evaluation and the in-process collection backend.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestSupport.hpp"
#include "database/CDocumentMatcher.hpp"

#include <gtest/gtest.h>

namespace DocBucket
{
namespace Regression
{

using namespace DocBucket::Testing;

namespace
{

bool matches(const std::string& document, const std::string& filter)
{
    auto result = CDocumentMatcher::matches(parseJson(document), parseJson(filter));
    EXPECT_TRUE(result.has_value()) << filter;
    return result && *result;
}

std::vector<CBsonDocument> drain(ICursor& cursor)
{
    std::vector<CBsonDocument> documents;

    while (true)
    {
        auto next = cursor.next();
        EXPECT_TRUE(next.has_value());
        if (!next || !*next)
            break;
        documents.push_back(std::move(**next));
    }
    return documents;
}

} /* anonymous namespace */

TEST(DocumentMatcherTest, EqualityOnScalarsAndPaths)
{
    const std::string doc = R"({"a": 1, "b": {"c": "x"}, "tags": ["red", "blue"]})";

    EXPECT_TRUE(matches(doc, "{}"));
    EXPECT_TRUE(matches(doc, R"({"a": 1})"));
    EXPECT_TRUE(matches(doc, R"({"a": 1.0})"));
    EXPECT_TRUE(matches(doc, R"({"a": {"$numberLong": "1"}})"));
    EXPECT_FALSE(matches(doc, R"({"a": "1"})"));
    EXPECT_TRUE(matches(doc, R"({"b.c": "x"})"));
    EXPECT_TRUE(matches(doc, R"({"tags": "blue"})"));
    EXPECT_FALSE(matches(doc, R"({"tags": "green"})"));
    EXPECT_TRUE(matches(doc, R"({"missing": null})"));
    EXPECT_FALSE(matches(doc, R"({"a": null})"));
}

TEST(DocumentMatcherTest, ComparisonOperatorsStayWithinAType)
{
    const std::string doc = R"({"n": 5, "s": "m"})";

    EXPECT_TRUE(matches(doc, R"({"n": {"$gt": 4, "$lte": 5}})"));
    EXPECT_FALSE(matches(doc, R"({"n": {"$lt": 5}})"));
    EXPECT_FALSE(matches(doc, R"({"n": {"$gt": "a"}})"));
    EXPECT_TRUE(matches(doc, R"({"s": {"$gte": "a"}})"));
    EXPECT_FALSE(matches(doc, R"({"missing": {"$gt": 0}})"));
    EXPECT_TRUE(matches(doc, R"({"n": {"$ne": 4}})"));
    EXPECT_TRUE(matches(doc, R"({"missing": {"$ne": 4}})"));
}

TEST(DocumentMatcherTest, MembershipExistenceAndLogic)
{
    const std::string doc = R"({"n": 2, "k": "v"})";

    EXPECT_TRUE(matches(doc, R"({"n": {"$in": [1, 2]}})"));
    EXPECT_FALSE(matches(doc, R"({"n": {"$nin": [1, 2]}})"));
    EXPECT_FALSE(matches(doc, R"({"n": {"$in": []}})"));
    EXPECT_TRUE(matches(doc, R"({"k": {"$exists": true}, "z": {"$exists": false}})"));
    EXPECT_TRUE(matches(doc, R"({"$or": [{"n": 9}, {"k": "v"}]})"));
    EXPECT_FALSE(matches(doc, R"({"$and": [{"n": 2}, {"k": "w"}]})"));
}

TEST(DocumentMatcherTest, UnknownOperatorsAreBadValues)
{
    auto result = CDocumentMatcher::matches(parseJson(R"({"a": 1})"),
                                            parseJson(R"({"a": {"$regex": "x"}})"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, COLLECTION_ERROR_BAD_VALUE);

    result = CDocumentMatcher::matches(parseJson("{}"), parseJson(R"({"$nor": []})"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, COLLECTION_ERROR_BAD_VALUE);
}

TEST(DocumentMatcherTest, SortOrderPutsMissingFirst)
{
    CBsonDocument sort = parseJson(R"({"n": 1})");

    EXPECT_LT(CDocumentMatcher::compareForSort(parseJson("{}"), parseJson(R"({"n": 0})"),
                                               sort),
              0);
    EXPECT_LT(CDocumentMatcher::compareForSort(parseJson(R"({"n": 1})"),
                                               parseJson(R"({"n": 2.5})"), sort),
              0);
    EXPECT_GT(CDocumentMatcher::compareForSort(parseJson(R"({"n": 1})"),
                                               parseJson(R"({"n": 2})"),
                                               parseJson(R"({"n": -1})")),
              0);
}

class MemoryCollectionTest : public ::testing::Test
{
  protected:
    CMemoryDatabase database;
    std::shared_ptr<CMemoryCollection> collection;

    void SetUp() override
    {
        collection = database.getMemoryCollection("items");
        for (int i = 0; i < 5; ++i)
        {
            CBsonDocument doc;
            doc.appendInt32("i", i);
            doc.appendString("group", i % 2 == 0 ? "even" : "odd");
            ASSERT_TRUE(collection->insertOne(doc).has_value());
        }
    }
};

TEST_F(MemoryCollectionTest, SameNameSameCollection)
{
    EXPECT_EQ(database.getCollection("items", CCollectionOptions()).get(),
              collection.get());
    EXPECT_NE(database.getCollection("other", CCollectionOptions()).get(),
              collection.get());
    EXPECT_EQ(database.getConnectionInfo(), "memory");
    EXPECT_TRUE(database.ping());
}

TEST_F(MemoryCollectionTest, InsertAssignsIdsAndRejectsDuplicates)
{
    auto id = collection->insertOne(parseJson(R"({"_id": "fixed"})"));
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, CDocumentId::fromString("fixed"));

    auto duplicate = collection->insertOne(parseJson(R"({"_id": "fixed", "x": 1})"));
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, COLLECTION_ERROR_DUPLICATE_KEY);
    EXPECT_NE(duplicate.error().message.find("items"), std::string::npos);

    auto stored = collection->findOne(parseJson(R"({"group": "even"})"));
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(stored->has_value());
    EXPECT_TRUE((*stored)->hasField("_id"));
}

TEST_F(MemoryCollectionTest, FindSortsSkipsAndLimits)
{
    CFindOptions options;
    options.sort = parseJson(R"({"i": -1})");
    options.skip = 1;
    options.limit = 2;

    auto cursor = collection->find(parseJson(R"({"i": {"$gte": 1}})"), options);
    ASSERT_TRUE(cursor.has_value());
    auto documents = drain(**cursor);
    ASSERT_EQ(documents.size(), 2u);
    EXPECT_EQ(documents[0].getInt32("i"), 3);
    EXPECT_EQ(documents[1].getInt32("i"), 2);
}

TEST_F(MemoryCollectionTest, CursorIsASnapshot)
{
    auto cursor = collection->find(CBsonDocument(), CFindOptions());
    ASSERT_TRUE(cursor.has_value());
    ASSERT_EQ(collection->deleteMany(CBsonDocument()).value(), 5);

    EXPECT_EQ(drain(**cursor).size(), 5u);
}

TEST_F(MemoryCollectionTest, CursorCopiesOneDocumentPerStep)
{
    CFindOptions options;
    options.sort = parseJson(R"({"i": 1})");

    auto cursor = collection->find(parseJson(R"({"group": "even"})"), options);
    ASSERT_TRUE(cursor.has_value());

    auto first = (*cursor)->next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first->has_value());
    EXPECT_EQ((*first)->getInt32("i"), 0);

    /* Later matches survive deletion and inserts stay invisible */
    ASSERT_EQ(collection->deleteMany(parseJson(R"({"i": {"$gte": 2}})")).value(), 3);
    ASSERT_TRUE(collection->insertOne(parseJson(R"({"i": 6, "group": "even"})")).has_value());

    (*first)->appendInt32("touched", 1);
    auto stored = collection->findOne(parseJson(R"({"i": 0})"));
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(stored->has_value());
    EXPECT_FALSE((*stored)->hasField("touched"));

    std::vector<CBsonDocument> rest = drain(**cursor);
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0].getInt32("i"), 2);
    EXPECT_EQ(rest[1].getInt32("i"), 4);
}

TEST_F(MemoryCollectionTest, DeleteOneAndDeleteManyCount)
{
    EXPECT_EQ(collection->deleteOne(parseJson(R"({"group": "odd"})")).value(), 1);
    EXPECT_EQ(collection->countDocuments(parseJson(R"({"group": "odd"})")).value(), 1);
    EXPECT_EQ(collection->deleteMany(parseJson(R"({"group": "even"})")).value(), 3);
    EXPECT_EQ(collection->deleteOne(parseJson(R"({"group": "even"})")).value(), 0);
    EXPECT_EQ(collection->countDocuments(CBsonDocument()).value(), 1);
}

TEST_F(MemoryCollectionTest, BadFiltersPropagate)
{
    auto count = collection->countDocuments(parseJson(R"({"i": {"$bogus": 1}})"));
    ASSERT_FALSE(count.has_value());
    EXPECT_EQ(count.error().code, COLLECTION_ERROR_BAD_VALUE);
}

TEST_F(MemoryCollectionTest, IndexesAreIdempotentAndDroppedWithTheCollection)
{
    CBsonDocument keys = parseJson(R"({"i": 1})");

    ASSERT_TRUE(collection->createIndex(keys).has_value());
    ASSERT_TRUE(collection->createIndex(keys).has_value());
    EXPECT_EQ(collection->indexes().size(), 1u);
    EXPECT_FALSE(collection->createIndex(CBsonDocument()).has_value());

    ASSERT_TRUE(collection->drop().has_value());
    EXPECT_FALSE(collection->exists());
    EXPECT_TRUE(collection->indexes().empty());
    EXPECT_EQ(collection->countDocuments(CBsonDocument()).value(), 0);

    /* Dropping again is fine */
    EXPECT_TRUE(collection->drop().has_value());
}

} /* namespace Regression */
} /* namespace DocBucket */
