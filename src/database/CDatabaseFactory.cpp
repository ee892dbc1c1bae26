/*-------------------------------------------------------------------------
 *
 * CDatabaseFactory.cpp
 *      Builds the configured database backend.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */
#include "database/CDatabaseFactory.hpp"

#include "database/CMemoryDatabase.hpp"
#include "database/CMongoDatabase.hpp"
#include "database/CPostgresDatabase.hpp"

namespace DocBucket
{

std::shared_ptr<IDatabase>
CDatabaseFactory::create(const CBucketConfig& config,
                         std::shared_ptr<ILogger> logger)
{
    switch (config.backend)
    {
    case CBackendType::PostgreSQL:
    {
        PLibpqConfig pg;
        pg.host = config.pgHost;
        pg.port = config.pgPort;
        pg.database = config.pgDatabase;
        pg.username = config.pgUser;
        pg.password = config.pgPassword;
        pg.statementTimeout = config.pgTimeout;
        return std::make_shared<CPostgresDatabase>(pg, logger);
    }
    case CBackendType::MongoDB:
        return std::make_shared<CMongoDatabase>(config.mongoUri,
                                                config.mongoDatabase, logger);
    case CBackendType::Memory:
    default:
        return std::make_shared<CMemoryDatabase>();
    }
}

CCollectionOptions CDatabaseFactory::collectionOptions(const CBucketConfig& config)
{
    CCollectionOptions options;

    options.readPreference = config.mongoReadPreference;
    options.writeConcernW = config.mongoWriteConcernW;
    options.maxTimeMS = config.mongoMaxTimeMS;
    return options;
}

} /* namespace DocBucket */
