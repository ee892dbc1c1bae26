/*-------------------------------------------------------------------------
 *
 * postgres_bucket_regression.cpp
 *      Bucket scenarios against a live PostgreSQL server.
 *
 * Set DOCBUCKET_PG_CONNINFO to a libpq connection string to run them.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CBackendScenarios.hpp"
#include "database/CPostgresDatabase.hpp"

namespace DocBucket
{
namespace Regression
{

class PostgresBucketRegressionTest : public BackendScenarioTest
{
  protected:
    std::shared_ptr<IDatabase> openDatabase() override
    {
        std::string conninfo = environment("DOCBUCKET_PG_CONNINFO");
        if (conninfo.empty())
            return nullptr;

        PLibpqConfig config;
        config.conninfo = conninfo;
        return std::make_shared<CPostgresDatabase>(config);
    }
};

TEST_F(PostgresBucketRegressionTest, RoundTrip)
{
    roundTrip();
}

TEST_F(PostgresBucketRegressionTest, IntegrityFailures)
{
    integrityFailures();
}

TEST_F(PostgresBucketRegressionTest, DeleteAndFind)
{
    deleteAndFind();
}

TEST_F(PostgresBucketRegressionTest, DuplicateIds)
{
    duplicateIds();
}

TEST_F(PostgresBucketRegressionTest, ServerReportsItsVersion)
{
    auto postgres = std::dynamic_pointer_cast<CPostgresDatabase>(database);
    ASSERT_NE(postgres, nullptr);
    EXPECT_TRUE(postgres->ping());
    EXPECT_FALSE(postgres->getServerVersion().empty());
}

TEST_F(PostgresBucketRegressionTest, UnsupportedFilterIsABadValue)
{
    upload("x");
    auto cursor = bucket->find(CBsonDocument::fromJson(R"({"a": {"$regex": "x"}})").value());
    ASSERT_FALSE(cursor.has_value());
    const auto* failure = cursor.error().as<BucketErrors::CollectionFailure>();
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->error.code, COLLECTION_ERROR_BAD_VALUE);
}

} /* namespace Regression */
} /* namespace DocBucket */
