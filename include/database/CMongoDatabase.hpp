/*-------------------------------------------------------------------------
 *
 * CMongoDatabase.hpp
 *      MongoDB database implementation for DocBucket (libmongoc).
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------*/

#pragma once

#include "../IInterfaces.hpp"
#include "IDatabase.hpp"

#include <mongoc/mongoc.h>

#include <memory>
#include <mutex>
#include <string>

namespace DocBucket
{

/* Owns the URI and the client pool; clients are popped per operation */
class CMongoClientPool
{
public:
	CMongoClientPool(mongoc_uri_t* uri, mongoc_client_pool_t* pool);
	~CMongoClientPool();

	CMongoClientPool(const CMongoClientPool&) = delete;
	CMongoClientPool& operator=(const CMongoClientPool&) = delete;

	mongoc_client_t* pop();
	void push(mongoc_client_t* client);

private:
	mongoc_uri_t* uri_;
	mongoc_client_pool_t* pool_;
};

/* A pooled client returned to the pool on scope exit */
class CPooledClient
{
public:
	explicit CPooledClient(std::shared_ptr<CMongoClientPool> pool);
	~CPooledClient();

	CPooledClient(const CPooledClient&) = delete;
	CPooledClient& operator=(const CPooledClient&) = delete;

	mongoc_client_t* get() const;

private:
	std::shared_ptr<CMongoClientPool> pool_;
	mongoc_client_t* client_;
};

class CMongoCursor : public ICursor
{
public:
	CMongoCursor(std::unique_ptr<CPooledClient> client,
				 mongoc_collection_t* collection, mongoc_cursor_t* cursor);
	~CMongoCursor() override;

	CollectionResult<std::optional<CBsonDocument>> next() override;

private:
	std::unique_ptr<CPooledClient> client_;
	mongoc_collection_t* collection_;
	mongoc_cursor_t* cursor_;
};

class CMongoCollection : public ICollection
{
public:
	CMongoCollection(std::shared_ptr<CMongoClientPool> pool,
					 const std::string& database, const std::string& name,
					 const CCollectionOptions& options,
					 std::shared_ptr<ILogger> logger);

	const std::string& name() const override;
	CollectionResult<CDocumentId> insertOne(const CBsonDocument& document) override;
	CollectionResult<int64_t> deleteOne(const CBsonDocument& filter) override;
	CollectionResult<int64_t> deleteMany(const CBsonDocument& filter) override;
	CollectionResult<std::unique_ptr<ICursor>>
	find(const CBsonDocument& filter, const CFindOptions& options) override;
	CollectionResult<std::optional<CBsonDocument>>
	findOne(const CBsonDocument& filter) override;
	CollectionResult<int64_t> countDocuments(const CBsonDocument& filter) override;
	CollectionResult<void> drop() override;
	CollectionResult<void> createIndex(const CBsonDocument& keys) override;

private:
	std::shared_ptr<CMongoClientPool> pool_;
	std::string database_;
	std::string name_;
	CCollectionOptions options_;
	std::shared_ptr<ILogger> logger_;

	/* Caller destroys the handle before the client goes back */
	mongoc_collection_t* openCollection(mongoc_client_t* client) const;
	CollectionResult<int64_t> deleteWith(const CBsonDocument& filter, bool many);
};

class CMongoDatabase : public IDatabase
{
public:
	CMongoDatabase(const std::string& uri, const std::string& database,
				   std::shared_ptr<ILogger> logger = nullptr);
	~CMongoDatabase() override;

	CollectionResult<void> connect() override;
	void disconnect() override;
	CDatabaseStatus getStatus() const override;
	bool ping() override;

	std::shared_ptr<ICollection>
	getCollection(const std::string& name,
				  const CCollectionOptions& options) override;

	std::string getConnectionInfo() const override;

private:
	std::string uri_;
	std::string database_;
	std::shared_ptr<CMongoClientPool> pool_;
	CDatabaseStatus status_;
	mutable std::mutex mutex_;
	std::shared_ptr<ILogger> logger_;
};

/* Maps a driver or server error to a collection error */
CCollectionError mongoError(const bson_error_t& error);

/* "primary", "secondaryPreferred", ... */
bool parseReadMode(const std::string& name, mongoc_read_mode_t& mode);

} // namespace DocBucket
