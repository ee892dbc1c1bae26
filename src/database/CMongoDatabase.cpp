/*-------------------------------------------------------------------------
 *
 * CMongoDatabase.cpp
 *      MongoDB database implementation for DocBucket.
 *      Thin layer over libmongoc with a client pool.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */
#include "database/CMongoDatabase.hpp"

#include "CLogMacros.hpp"

namespace DocBucket
{

CCollectionError mongoError(const bson_error_t& error)
{
	std::string message = error.message;

	if (error.code == COLLECTION_ERROR_DUPLICATE_KEY)
		return CCollectionError(COLLECTION_ERROR_DUPLICATE_KEY, message);
	if (error.code == 50 /* MaxTimeMSExpired */)
		return CCollectionError(COLLECTION_ERROR_TIMEOUT, message);
	if (error.code == 26 /* NamespaceNotFound */)
		return CCollectionError(COLLECTION_ERROR_NAMESPACE_NOT_FOUND, message);
	if (error.domain == MONGOC_ERROR_STREAM ||
		error.domain == MONGOC_ERROR_SERVER_SELECTION ||
		error.domain == MONGOC_ERROR_CLIENT)
		return CCollectionError(COLLECTION_ERROR_CONNECTION, message);
	if (error.domain == MONGOC_ERROR_BSON || error.domain == MONGOC_ERROR_COMMAND)
		return CCollectionError(COLLECTION_ERROR_BAD_VALUE, message);
	return CCollectionError(COLLECTION_ERROR_INTERNAL, message);
}

namespace
{

CCollectionError notConnected()
{
	return CCollectionError(COLLECTION_ERROR_CONNECTION,
							"not connected to MongoDB");
}

} /* anonymous namespace */

bool parseReadMode(const std::string& name, mongoc_read_mode_t& mode)
{
	if (name == "primary")
		mode = MONGOC_READ_PRIMARY;
	else if (name == "primaryPreferred")
		mode = MONGOC_READ_PRIMARY_PREFERRED;
	else if (name == "secondary")
		mode = MONGOC_READ_SECONDARY;
	else if (name == "secondaryPreferred")
		mode = MONGOC_READ_SECONDARY_PREFERRED;
	else if (name == "nearest")
		mode = MONGOC_READ_NEAREST;
	else
		return false;
	return true;
}

/*-------------------------------------------------------------------------
 * CMongoClientPool / CPooledClient implementation
 *-------------------------------------------------------------------------*/
CMongoClientPool::CMongoClientPool(mongoc_uri_t* uri, mongoc_client_pool_t* pool)
	: uri_(uri), pool_(pool)
{
}

CMongoClientPool::~CMongoClientPool()
{
	mongoc_client_pool_destroy(pool_);
	mongoc_uri_destroy(uri_);
}

mongoc_client_t* CMongoClientPool::pop()
{
	return mongoc_client_pool_pop(pool_);
}

void CMongoClientPool::push(mongoc_client_t* client)
{
	mongoc_client_pool_push(pool_, client);
}

CPooledClient::CPooledClient(std::shared_ptr<CMongoClientPool> pool)
	: pool_(std::move(pool)), client_(pool_->pop())
{
}

CPooledClient::~CPooledClient()
{
	pool_->push(client_);
}

mongoc_client_t* CPooledClient::get() const
{
	return client_;
}

/*-------------------------------------------------------------------------
 * CMongoCursor implementation
 *-------------------------------------------------------------------------*/
CMongoCursor::CMongoCursor(std::unique_ptr<CPooledClient> client,
						   mongoc_collection_t* collection,
						   mongoc_cursor_t* cursor)
	: client_(std::move(client)), collection_(collection), cursor_(cursor)
{
}

CMongoCursor::~CMongoCursor()
{
	/* Cursor first, then collection, then the client goes back */
	mongoc_cursor_destroy(cursor_);
	mongoc_collection_destroy(collection_);
}

CollectionResult<std::optional<CBsonDocument>> CMongoCursor::next()
{
	const bson_t* document = nullptr;
	bson_error_t error;

	if (mongoc_cursor_next(cursor_, &document))
		return std::optional<CBsonDocument>(CBsonDocument(document));

	if (mongoc_cursor_error(cursor_, &error))
		return std::unexpected(mongoError(error));
	return std::optional<CBsonDocument>();
}

/*-------------------------------------------------------------------------
 * CMongoCollection implementation
 *-------------------------------------------------------------------------*/
CMongoCollection::CMongoCollection(std::shared_ptr<CMongoClientPool> pool,
								   const std::string& database,
								   const std::string& name,
								   const CCollectionOptions& options,
								   std::shared_ptr<ILogger> logger)
	: pool_(std::move(pool)), database_(database), name_(name),
	  options_(options), logger_(std::move(logger))
{
}

const std::string& CMongoCollection::name() const
{
	return name_;
}

mongoc_collection_t* CMongoCollection::openCollection(mongoc_client_t* client) const
{
	mongoc_collection_t* collection =
		mongoc_client_get_collection(client, database_.c_str(), name_.c_str());

	mongoc_read_mode_t mode = MONGOC_READ_PRIMARY;
	if (parseReadMode(options_.readPreference, mode))
	{
		mongoc_read_prefs_t* prefs = mongoc_read_prefs_new(mode);
		mongoc_collection_set_read_prefs(collection, prefs);
		mongoc_read_prefs_destroy(prefs);
	}

	mongoc_write_concern_t* concern = mongoc_write_concern_new();
	mongoc_write_concern_set_w(concern, options_.writeConcernW);
	mongoc_collection_set_write_concern(collection, concern);
	mongoc_write_concern_destroy(concern);

	return collection;
}

CollectionResult<CDocumentId>
CMongoCollection::insertOne(const CBsonDocument& document)
{
	if (!pool_)
		return std::unexpected(notConnected());
	CDocumentId id;
	CBsonDocument stored = withDocumentId(document, id);
	bson_error_t error;

	CPooledClient client(pool_);
	mongoc_collection_t* collection = openCollection(client.get());
	bool ok = mongoc_collection_insert_one(collection, stored.get(), nullptr,
										   nullptr, &error);
	mongoc_collection_destroy(collection);

	if (!ok)
	{
		debug_log("insert into " + name_ + " failed: " + error.message);
		return std::unexpected(mongoError(error));
	}
	return id;
}

CollectionResult<int64_t> CMongoCollection::deleteWith(const CBsonDocument& filter,
													   bool many)
{
	if (!pool_)
		return std::unexpected(notConnected());
	bson_t reply;
	bson_error_t error;

	CPooledClient client(pool_);
	mongoc_collection_t* collection = openCollection(client.get());
	bool ok = many ? mongoc_collection_delete_many(collection, filter.get(),
												   nullptr, &reply, &error)
				   : mongoc_collection_delete_one(collection, filter.get(),
												  nullptr, &reply, &error);
	mongoc_collection_destroy(collection);

	CBsonDocument result(&reply);
	bson_destroy(&reply);
	if (!ok)
		return std::unexpected(mongoError(error));

	return result.getInt64("deletedCount").value_or(0);
}

CollectionResult<int64_t> CMongoCollection::deleteOne(const CBsonDocument& filter)
{
	return deleteWith(filter, false);
}

CollectionResult<int64_t> CMongoCollection::deleteMany(const CBsonDocument& filter)
{
	return deleteWith(filter, true);
}

CollectionResult<std::unique_ptr<ICursor>>
CMongoCollection::find(const CBsonDocument& filter, const CFindOptions& options)
{
	if (!pool_)
		return std::unexpected(notConnected());
	CBsonDocument opts;

	if (!options.sort.isEmpty())
		opts.appendDocument("sort", options.sort);
	if (options.limit > 0)
		opts.appendInt64("limit", options.limit);
	if (options.skip > 0)
		opts.appendInt64("skip", options.skip);
	if (options_.maxTimeMS > 0)
		opts.appendInt64("maxTimeMS", options_.maxTimeMS);

	auto client = std::make_unique<CPooledClient>(pool_);
	mongoc_collection_t* collection = openCollection(client->get());
	mongoc_cursor_t* cursor = mongoc_collection_find_with_opts(
		collection, filter.get(), opts.get(), nullptr);

	return std::make_unique<CMongoCursor>(std::move(client), collection, cursor);
}

CollectionResult<std::optional<CBsonDocument>>
CMongoCollection::findOne(const CBsonDocument& filter)
{
	CFindOptions options;
	options.limit = 1;

	auto cursor = find(filter, options);
	if (!cursor)
		return std::unexpected(cursor.error());
	return (*cursor)->next();
}

CollectionResult<int64_t> CMongoCollection::countDocuments(const CBsonDocument& filter)
{
	if (!pool_)
		return std::unexpected(notConnected());
	CBsonDocument opts;
	bson_t reply;
	bson_error_t error;

	if (options_.maxTimeMS > 0)
		opts.appendInt64("maxTimeMS", options_.maxTimeMS);

	CPooledClient client(pool_);
	mongoc_collection_t* collection = openCollection(client.get());
	int64_t count = mongoc_collection_count_documents(
		collection, filter.get(), opts.get(), nullptr, &reply, &error);
	mongoc_collection_destroy(collection);
	bson_destroy(&reply);

	if (count < 0)
		return std::unexpected(mongoError(error));
	return count;
}

CollectionResult<void> CMongoCollection::drop()
{
	if (!pool_)
		return std::unexpected(notConnected());
	bson_error_t error;

	CPooledClient client(pool_);
	mongoc_collection_t* collection = openCollection(client.get());
	bool ok = mongoc_collection_drop_with_opts(collection, nullptr, &error);
	mongoc_collection_destroy(collection);

	if (!ok)
	{
		CCollectionError mapped = mongoError(error);
		if (mapped.code == COLLECTION_ERROR_NAMESPACE_NOT_FOUND)
			return {};
		return std::unexpected(mapped);
	}
	return {};
}

CollectionResult<void> CMongoCollection::createIndex(const CBsonDocument& keys)
{
	if (!pool_)
		return std::unexpected(notConnected());
	CBsonDocument index;
	CBsonDocument indexes;
	CBsonDocument command;
	bson_t reply;
	bson_error_t error;

	index.appendDocument("key", keys);
	index.appendString("name", indexNameForKeys(keys));
	indexes.appendDocument("0", index);
	command.appendString("createIndexes", name_);
	command.appendArray("indexes", indexes);

	CPooledClient client(pool_);
	mongoc_collection_t* collection = openCollection(client.get());
	bool ok = mongoc_collection_write_command_with_opts(
		collection, command.get(), nullptr, &reply, &error);
	mongoc_collection_destroy(collection);
	bson_destroy(&reply);

	if (!ok)
		return std::unexpected(mongoError(error));
	return {};
}

/*-------------------------------------------------------------------------
 * CMongoDatabase implementation
 *-------------------------------------------------------------------------*/
CMongoDatabase::CMongoDatabase(const std::string& uri, const std::string& database,
							   std::shared_ptr<ILogger> logger)
	: uri_(uri), database_(database), status_(CDatabaseStatus::DISCONNECTED),
	  logger_(std::move(logger))
{
}

CMongoDatabase::~CMongoDatabase()
{
	disconnect();
}

CollectionResult<void> CMongoDatabase::connect()
{
	bson_error_t error;

	mongoc_init();

	{
		std::lock_guard<std::mutex> lock(mutex_);
		status_ = CDatabaseStatus::CONNECTING;

		mongoc_uri_t* uri = mongoc_uri_new_with_error(uri_.c_str(), &error);
		if (!uri)
		{
			status_ = CDatabaseStatus::ERROR;
			error_log(std::string("invalid MongoDB URI: ") + error.message);
			return std::unexpected(
				CCollectionError(COLLECTION_ERROR_BAD_VALUE, error.message));
		}

		mongoc_client_pool_t* pool = mongoc_client_pool_new(uri);
		if (!pool)
		{
			mongoc_uri_destroy(uri);
			status_ = CDatabaseStatus::ERROR;
			return std::unexpected(CCollectionError(
				COLLECTION_ERROR_CONNECTION, "unable to create client pool"));
		}
		mongoc_client_pool_set_error_api(pool, MONGOC_ERROR_API_VERSION_2);
		mongoc_client_pool_set_appname(pool, "docbucket");
		pool_ = std::make_shared<CMongoClientPool>(uri, pool);
	}

	if (!ping())
	{
		std::lock_guard<std::mutex> lock(mutex_);
		status_ = CDatabaseStatus::ERROR;
		pool_.reset();
		return std::unexpected(CCollectionError(COLLECTION_ERROR_CONNECTION,
												"MongoDB server did not answer ping"));
	}

	std::lock_guard<std::mutex> lock(mutex_);
	status_ = CDatabaseStatus::CONNECTED;
	info_log("Connected to MongoDB " + getConnectionInfo());
	return {};
}

void CMongoDatabase::disconnect()
{
	std::lock_guard<std::mutex> lock(mutex_);

	pool_.reset();
	status_ = CDatabaseStatus::DISCONNECTED;
}

CDatabaseStatus CMongoDatabase::getStatus() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return status_;
}

bool CMongoDatabase::ping()
{
	std::shared_ptr<CMongoClientPool> pool;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		pool = pool_;
	}
	if (!pool)
		return false;

	CBsonDocument command;
	bson_t reply;
	bson_error_t error;

	command.appendInt32("ping", 1);
	CPooledClient client(pool);
	bool ok = mongoc_client_command_simple(client.get(), "admin", command.get(),
										   nullptr, &reply, &error);
	bson_destroy(&reply);
	if (!ok)
		warn_log(std::string("MongoDB ping failed: ") + error.message);
	return ok;
}

std::shared_ptr<ICollection>
CMongoDatabase::getCollection(const std::string& name,
							  const CCollectionOptions& options)
{
	std::lock_guard<std::mutex> lock(mutex_);
	return std::make_shared<CMongoCollection>(pool_, database_, name, options,
											  logger_);
}

std::string CMongoDatabase::getConnectionInfo() const
{
	return uri_ + "/" + database_;
}

} /* namespace DocBucket */
