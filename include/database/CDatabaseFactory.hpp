/*-------------------------------------------------------------------------
 *
 * CDatabaseFactory.hpp
 *      Builds the configured database backend.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------*/

#pragma once

#include "../CBucketConfig.hpp"
#include "../IInterfaces.hpp"
#include "IDatabase.hpp"

#include <memory>

namespace DocBucket
{

class CDatabaseFactory
{
  public:
    /* Unconnected database for config.backend */
    static std::shared_ptr<IDatabase>
    create(const CBucketConfig& config, std::shared_ptr<ILogger> logger);

    /* Read/write policy for the bucket's collections */
    static CCollectionOptions collectionOptions(const CBucketConfig& config);
};

} // namespace DocBucket
