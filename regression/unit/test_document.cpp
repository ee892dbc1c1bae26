/*-------------------------------------------------------------------------
 *
 * test_document.cpp
 *      CBsonDocument value semantics and CDocumentId forms.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CTestSupport.hpp"
#include "document/CDocumentId.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace DocBucket
{
namespace Regression
{

using namespace DocBucket::Testing;

TEST(BsonDocumentTest, BuildersAndGetters)
{
    CBsonDocument doc;
    ByteVector payload = {0x00, 0xff, 0x10};

    ASSERT_TRUE(doc.appendString("name", "report"));
    ASSERT_TRUE(doc.appendInt32("small", 7));
    ASSERT_TRUE(doc.appendInt64("large", int64_t(1) << 40));
    ASSERT_TRUE(doc.appendDouble("ratio", 0.5));
    ASSERT_TRUE(doc.appendBool("flag", true));
    ASSERT_TRUE(doc.appendNull("nothing"));
    ASSERT_TRUE(doc.appendDateTime("when", 1700000000000));
    ASSERT_TRUE(doc.appendBinary("blob", ByteSpan(payload)));
    ASSERT_TRUE(doc.appendStringArray("tags", {"a", "b"}));

    EXPECT_EQ(doc.fieldCount(), 9u);
    EXPECT_EQ(doc.getString("name"), "report");
    EXPECT_EQ(doc.getInt32("small"), 7);
    EXPECT_EQ(doc.getInt64("large"), int64_t(1) << 40);
    EXPECT_FALSE(doc.getInt32("large").has_value());
    EXPECT_EQ(doc.getDouble("ratio"), 0.5);
    EXPECT_EQ(doc.getBool("flag"), true);
    EXPECT_TRUE(doc.hasField("nothing"));
    EXPECT_EQ(doc.getDateTime("when"), 1700000000000);
    EXPECT_EQ(doc.getBinary("blob"), payload);
    EXPECT_EQ(doc.getStringArray("tags"), (StringVector{"a", "b"}));

    EXPECT_FALSE(doc.getString("small").has_value());
    EXPECT_FALSE(doc.getBinary("name").has_value());
    EXPECT_FALSE(doc.hasField("absent"));
}

TEST(BsonDocumentTest, IntegralDoublesConvertOnlyWithinRange)
{
    CBsonDocument doc;
    doc.appendDouble("whole", 4096.0);
    doc.appendDouble("huge", 1e19);
    doc.appendDouble("edge", 9223372036854775808.0);
    doc.appendDouble("lowest", -9223372036854775808.0);
    doc.appendDouble("fraction", 2.5);

    EXPECT_EQ(doc.getInt64("whole"), 4096);
    EXPECT_FALSE(doc.getInt64("huge").has_value());
    EXPECT_FALSE(doc.getInt64("edge").has_value());
    EXPECT_EQ(doc.getInt64("lowest"), std::numeric_limits<int64_t>::min());
    EXPECT_FALSE(doc.getInt64("fraction").has_value());
}

TEST(BsonDocumentTest, DottedPathsReachIntoSubdocuments)
{
    CBsonDocument doc = parseJson(R"({"metadata": {"owner": {"name": "ops"}, "size": 3}})");

    EXPECT_EQ(doc.getString("metadata.owner.name"), "ops");
    EXPECT_EQ(doc.getInt32("metadata.size"), 3);
    EXPECT_FALSE(doc.hasField("metadata.missing"));

    auto metadata = doc.getDocument("metadata");
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->fieldNames(), (std::vector<std::string>{"owner", "size"}));
}

TEST(BsonDocumentTest, CopiesAreDeep)
{
    CBsonDocument original;
    original.appendInt32("a", 1);

    CBsonDocument copy = original;
    copy.appendInt32("b", 2);

    EXPECT_EQ(original.fieldCount(), 1u);
    EXPECT_EQ(copy.fieldCount(), 2u);
    EXPECT_NE(original, copy);

    CBsonDocument moved = std::move(copy);
    EXPECT_EQ(moved.fieldCount(), 2u);
}

TEST(BsonDocumentTest, BytesRoundTripAndValidation)
{
    CBsonDocument doc = parseJson(R"({"x": [1, 2, {"y": "z"}]})");
    ByteVector bytes = doc.toBytes();

    auto restored = CBsonDocument::fromData(bytes.data(), bytes.size());
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, doc);

    EXPECT_FALSE(CBsonDocument::fromData(bytes.data(), 3).has_value());
    bytes[0] = 0x7f;
    EXPECT_FALSE(CBsonDocument::fromData(bytes.data(), bytes.size()).has_value());
}

TEST(BsonDocumentTest, InvalidJsonReportsAnError)
{
    std::string error;
    EXPECT_FALSE(CBsonDocument::fromJson("{not json", &error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST(BsonDocumentTest, RelaxedJsonKeepsPlainNumbers)
{
    CBsonDocument doc;
    doc.appendInt64("length", 12);
    EXPECT_NE(doc.toRelaxedJson().find("12"), std::string::npos);
    EXPECT_NE(doc.toJson().find("$numberLong"), std::string::npos);
}

TEST(DocumentIdTest, GeneratedIdsAreDistinctObjectIds)
{
    CDocumentId first = CDocumentId::generate();
    CDocumentId second = CDocumentId::generate();

    EXPECT_EQ(first.type(), BSON_TYPE_OID);
    EXPECT_NE(first, second);
    EXPECT_EQ(first.toString().size(), 24u);
}

TEST(DocumentIdTest, ParseRecognisesObjectIdHex)
{
    CDocumentId oid = CDocumentId::parse("0123456789abcdef01234567");
    EXPECT_EQ(oid.type(), BSON_TYPE_OID);
    EXPECT_EQ(oid.toString(), "0123456789abcdef01234567");

    CDocumentId text = CDocumentId::parse("report.pdf");
    EXPECT_EQ(text.type(), BSON_TYPE_UTF8);
    EXPECT_EQ(text.toString(), "report.pdf");

    /* 24 characters but not hex */
    EXPECT_EQ(CDocumentId::parse("zzzzzzzzzzzzzzzzzzzzzzzz").type(), BSON_TYPE_UTF8);
    EXPECT_FALSE(CDocumentId::fromObjectIdString("xyz").has_value());
}

TEST(DocumentIdTest, IdsOfDifferentTypesDiffer)
{
    EXPECT_NE(CDocumentId::fromString("5"), CDocumentId::fromInt64(5));
    EXPECT_EQ(CDocumentId::fromInt64(5).toString(), "5");
    EXPECT_EQ(CDocumentId::fromInt64(5), CDocumentId::fromInt64(5));
}

TEST(DocumentIdTest, EmptyIdAppendsNothing)
{
    CDocumentId id;
    CBsonDocument doc;

    EXPECT_TRUE(id.empty());
    EXPECT_FALSE(id.appendTo(doc, "_id"));
    EXPECT_TRUE(doc.isEmpty());
    EXPECT_EQ(id.toString(), "");
}

TEST(DocumentIdTest, FieldExtractionAndCanonicalKey)
{
    CBsonDocument doc = parseJson(R"({"_id": {"$oid": "0123456789abcdef01234567"}})");

    auto id = CDocumentId::fromField(doc, "_id");
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(*id, CDocumentId::parse("0123456789abcdef01234567"));
    EXPECT_EQ(id->canonicalKey(),
              CDocumentId::parse("0123456789abcdef01234567").canonicalKey());
    EXPECT_NE(id->canonicalKey(), CDocumentId::fromString("0123456789abcdef01234567")
                                      .canonicalKey());
    EXPECT_FALSE(CDocumentId::fromField(doc, "other").has_value());
}

TEST(DocumentIdTest, WithDocumentIdKeepsOrAddsTheId)
{
    CDocumentId id;
    CBsonDocument named = parseJson(R"({"_id": "mine", "x": 1})");

    CBsonDocument kept = withDocumentId(named, id);
    EXPECT_EQ(kept, named);
    EXPECT_EQ(id, CDocumentId::fromString("mine"));

    CBsonDocument anonymous = parseJson(R"({"x": 1})");
    CBsonDocument added = withDocumentId(anonymous, id);
    EXPECT_EQ(added.fieldNames(), (std::vector<std::string>{"_id", "x"}));
    EXPECT_EQ(id.type(), BSON_TYPE_OID);
    EXPECT_EQ(CDocumentId::fromField(added, "_id"), id);
}

} /* namespace Regression */
} /* namespace DocBucket */
