/*-------------------------------------------------------------------------
 *
 * mongo_bucket_regression.cpp
 *      Bucket scenarios against a live MongoDB deployment.
 *
 * Set DOCBUCKET_MONGODB_URI (and optionally DOCBUCKET_MONGODB_DATABASE)
 * to run them.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "CBackendScenarios.hpp"
#include "database/CMongoDatabase.hpp"

namespace DocBucket
{
namespace Regression
{

class MongoBucketRegressionTest : public BackendScenarioTest
{
  protected:
    std::shared_ptr<IDatabase> openDatabase() override
    {
        std::string uri = environment("DOCBUCKET_MONGODB_URI");
        if (uri.empty())
            return nullptr;

        std::string name = environment("DOCBUCKET_MONGODB_DATABASE");
        return std::make_shared<CMongoDatabase>(uri, name.empty() ? "docbucket_test"
                                                                  : name);
    }
};

TEST_F(MongoBucketRegressionTest, RoundTrip)
{
    roundTrip();
}

TEST_F(MongoBucketRegressionTest, IntegrityFailures)
{
    integrityFailures();
}

TEST_F(MongoBucketRegressionTest, DeleteAndFind)
{
    deleteAndFind();
}

TEST_F(MongoBucketRegressionTest, DuplicateIds)
{
    duplicateIds();
}

TEST_F(MongoBucketRegressionTest, IndexesExistAfterUpload)
{
    upload("ABCDE");
    /* createIndexes is idempotent on the server */
    EXPECT_TRUE(bucket->ensureIndexes().has_value());
    EXPECT_TRUE(database->ping());
}

} /* namespace Regression */
} /* namespace DocBucket */
