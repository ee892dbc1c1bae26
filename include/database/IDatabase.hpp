/*-------------------------------------------------------------------------
 *
 * IDatabase.hpp
 *      Abstract database handing out named document collections.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------*/

#pragma once

#include "ICollection.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace DocBucket
{

enum class CDatabaseStatus : uint8_t
{
    DISCONNECTED = 0,
    CONNECTING = 1,
    CONNECTED = 2,
    ERROR = 3
};

class IDatabase
{
  public:
    virtual ~IDatabase() = default;

    virtual CollectionResult<void> connect() = 0;
    virtual void disconnect() = 0;
    virtual CDatabaseStatus getStatus() const = 0;
    virtual bool ping() = 0;

    virtual std::shared_ptr<ICollection>
    getCollection(const std::string& name,
                  const CCollectionOptions& options) = 0;

    virtual std::string getConnectionInfo() const = 0;
};

} // namespace DocBucket
