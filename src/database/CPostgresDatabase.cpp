/*-------------------------------------------------------------------------
 *
 * CPostgresDatabase.cpp
 *      PostgreSQL database implementation for DocBucket.
 *      Stores documents as BSON plus a jsonb projection for queries.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */
#include "database/CPostgresDatabase.hpp"

#include "CLogMacros.hpp"
#include "database/CQueryTranslator.hpp"

namespace DocBucket
{

namespace
{

/* Top-level fields minus binary payloads, as relaxed JSON */
std::string searchableJson(const CBsonDocument& document)
{
	CBsonDocument searchable;
	bson_iter_t iter;

	if (bson_iter_init(&iter, document.get()))
	{
		while (bson_iter_next(&iter))
		{
			if (!BSON_ITER_HOLDS_BINARY(&iter))
				searchable.appendIterValue(bson_iter_key(&iter), &iter);
		}
	}
	return searchable.toRelaxedJson();
}

std::string quoteIdentifier(const std::string& identifier)
{
	std::string quoted = "\"";
	for (char c : identifier)
	{
		if (c == '"')
			quoted += '"';
		quoted += c;
	}
	quoted += '"';
	return quoted;
}

std::string whereClause(const std::string& condition)
{
	return condition == "TRUE" ? std::string() : " WHERE " + condition;
}

} /* anonymous namespace */

std::string byteaHex(ByteSpan bytes)
{
	static const char digits[] = "0123456789abcdef";
	std::string hex = "\\x";

	hex.reserve(2 + bytes.size() * 2);
	for (uint8_t b : bytes)
	{
		hex += digits[b >> 4];
		hex += digits[b & 0x0f];
	}
	return hex;
}

CCollectionError postgresError(const PLibpqResult* result, const CLibpq& libpq)
{
	if (!result)
		return CCollectionError(COLLECTION_ERROR_CONNECTION, libpq.getLastError());

	std::string state = result->getSqlState();
	std::string message = result->getErrorMessage();
	while (!message.empty() && message.back() == '\n')
		message.pop_back();
	if (!result->getErrorDetail().empty())
		message += " (" + result->getErrorDetail() + ")";

	if (state == "23505")
		return CCollectionError(COLLECTION_ERROR_DUPLICATE_KEY,
								"E11000 duplicate key error: " + message);
	if (state == "57014")
		return CCollectionError(COLLECTION_ERROR_TIMEOUT, message);
	if (state == "42P01")
		return CCollectionError(COLLECTION_ERROR_NAMESPACE_NOT_FOUND, message);
	if (state.compare(0, 2, "08") == 0)
		return CCollectionError(COLLECTION_ERROR_CONNECTION, message);
	if (state.compare(0, 2, "22") == 0)
		return CCollectionError(COLLECTION_ERROR_BAD_VALUE, message);
	return CCollectionError(COLLECTION_ERROR_INTERNAL, message);
}

/*-------------------------------------------------------------------------
 * CPostgresCursor implementation
 *-------------------------------------------------------------------------*/
CPostgresCursor::CPostgresCursor(std::shared_ptr<CPostgresSession> session,
								 std::string selectSql,
								 std::vector<std::string> parameters,
								 int64_t limit, int64_t skip,
								 std::shared_ptr<ILogger> logger)
	: session_(std::move(session)), selectSql_(std::move(selectSql)),
	  parameters_(std::move(parameters)), remaining_(limit > 0 ? limit : -1),
	  offset_(skip > 0 ? skip : 0), exhausted_(false), logger_(std::move(logger))
{
}

CollectionResult<std::optional<CBsonDocument>> CPostgresCursor::next()
{
	if (buffer_.empty() && !exhausted_)
	{
		auto fetched = fetchBatch();
		if (!fetched)
			return std::unexpected(fetched.error());
	}

	if (buffer_.empty())
		return std::optional<CBsonDocument>();

	CBsonDocument document = std::move(buffer_.front());
	buffer_.pop_front();
	return std::optional<CBsonDocument>(std::move(document));
}

CollectionResult<void> CPostgresCursor::fetchBatch()
{
	int64_t batch = kBatchSize;
	if (remaining_ >= 0 && remaining_ < batch)
		batch = remaining_;
	if (batch == 0)
	{
		exhausted_ = true;
		return {};
	}

	std::string sql = selectSql_ + " LIMIT " + std::to_string(batch) +
					  " OFFSET " + std::to_string(offset_);
	debug_log("postgres fetch: " + sql);

	std::lock_guard<std::mutex> lock(session_->mutex);
	auto result = session_->libpq.executeQuery(sql, parameters_);
	if (!result || !result->isTuplesOk())
	{
		exhausted_ = true;
		return std::unexpected(postgresError(result.get(), session_->libpq));
	}

	int rows = result->getRowCount();
	for (int row = 0; row < rows; ++row)
	{
		ByteVector raw;
		if (!result->getBytes(row, 0, raw))
			return std::unexpected(CCollectionError(
				COLLECTION_ERROR_INTERNAL, "stored document has no BSON body"));

		auto document = CBsonDocument::fromData(raw.data(), raw.size());
		if (!document)
			return std::unexpected(CCollectionError(
				COLLECTION_ERROR_INTERNAL, "stored document is not valid BSON"));
		buffer_.push_back(std::move(*document));
	}

	offset_ += rows;
	if (remaining_ > 0)
		remaining_ -= rows;
	if (rows < batch || remaining_ == 0)
		exhausted_ = true;
	return {};
}

/*-------------------------------------------------------------------------
 * CPostgresCollection implementation
 *-------------------------------------------------------------------------*/
CPostgresCollection::CPostgresCollection(std::shared_ptr<CPostgresSession> session,
										 const std::string& name,
										 std::shared_ptr<ILogger> logger)
	: session_(std::move(session)), name_(name), table_(quoteIdentifier(name)),
	  tableReady_(false), logger_(std::move(logger))
{
}

const std::string& CPostgresCollection::name() const
{
	return name_;
}

const std::string& CPostgresCollection::tableName() const
{
	return table_;
}

CollectionResult<std::unique_ptr<PLibpqResult>>
CPostgresCollection::execute(const std::string& sql,
							 const std::vector<std::string>& parameters,
							 bool expectTuples)
{
	debug_log("postgres execute: " + sql);

	auto result = session_->libpq.executeQuery(sql, parameters);
	bool ok = result && (expectTuples ? result->isTuplesOk() : result->isCommandOk());
	if (!ok)
	{
		CCollectionError error = postgresError(result.get(), session_->libpq);
		if (error.code == COLLECTION_ERROR_NAMESPACE_NOT_FOUND)
			tableReady_ = false;
		return std::unexpected(error);
	}
	return result;
}

CollectionResult<void> CPostgresCollection::ensureTable()
{
	if (tableReady_)
		return {};

	auto created = execute("CREATE TABLE IF NOT EXISTS " + table_ +
							   " (seq bigserial NOT NULL,"
							   " id text PRIMARY KEY,"
							   " doc jsonb NOT NULL,"
							   " raw bytea NOT NULL)",
						   {}, false);
	if (!created)
		return std::unexpected(created.error());

	tableReady_ = true;
	return {};
}

CollectionResult<CDocumentId>
CPostgresCollection::insertOne(const CBsonDocument& document)
{
	CDocumentId id;
	CBsonDocument stored = withDocumentId(document, id);

	std::lock_guard<std::mutex> lock(session_->mutex);
	auto ready = ensureTable();
	if (!ready)
		return std::unexpected(ready.error());

	auto inserted = execute("INSERT INTO " + table_ +
								" (id, doc, raw) VALUES ($1, $2::jsonb, $3::bytea)",
							{id.canonicalKey(), searchableJson(stored),
							 byteaHex(ByteSpan(stored.data(), stored.size()))},
							false);
	if (!inserted)
		return std::unexpected(inserted.error());
	return id;
}

CollectionResult<int64_t> CPostgresCollection::deleteOne(const CBsonDocument& filter)
{
	CQueryTranslator translator;
	auto condition = translator.translateFilter(filter);
	if (!condition)
		return std::unexpected(condition.error());

	std::lock_guard<std::mutex> lock(session_->mutex);
	auto ready = ensureTable();
	if (!ready)
		return std::unexpected(ready.error());

	auto deleted = execute("DELETE FROM " + table_ + " WHERE seq IN (SELECT seq FROM " +
							   table_ + whereClause(*condition) +
							   " ORDER BY seq LIMIT 1)",
						   translator.parameters(), false);
	if (!deleted)
		return std::unexpected(deleted.error());
	return (*deleted)->getAffectedRows();
}

CollectionResult<int64_t> CPostgresCollection::deleteMany(const CBsonDocument& filter)
{
	CQueryTranslator translator;
	auto condition = translator.translateFilter(filter);
	if (!condition)
		return std::unexpected(condition.error());

	std::lock_guard<std::mutex> lock(session_->mutex);
	auto ready = ensureTable();
	if (!ready)
		return std::unexpected(ready.error());

	auto deleted = execute("DELETE FROM " + table_ + whereClause(*condition),
						   translator.parameters(), false);
	if (!deleted)
		return std::unexpected(deleted.error());
	return (*deleted)->getAffectedRows();
}

CollectionResult<std::unique_ptr<ICursor>>
CPostgresCollection::find(const CBsonDocument& filter, const CFindOptions& options)
{
	CQueryTranslator translator;
	auto condition = translator.translateFilter(filter);
	if (!condition)
		return std::unexpected(condition.error());
	auto order = translator.translateSort(options.sort);
	if (!order)
		return std::unexpected(order.error());

	{
		std::lock_guard<std::mutex> lock(session_->mutex);
		auto ready = ensureTable();
		if (!ready)
			return std::unexpected(ready.error());
	}

	std::string sql = "SELECT raw FROM " + table_ + whereClause(*condition) +
					  " ORDER BY " + (order->empty() ? "" : *order + ", ") + "seq";
	return std::make_unique<CPostgresCursor>(session_, sql, translator.parameters(),
											 options.limit, options.skip, logger_);
}

CollectionResult<std::optional<CBsonDocument>>
CPostgresCollection::findOne(const CBsonDocument& filter)
{
	CFindOptions options;
	options.limit = 1;

	auto cursor = find(filter, options);
	if (!cursor)
		return std::unexpected(cursor.error());
	return (*cursor)->next();
}

CollectionResult<int64_t>
CPostgresCollection::countDocuments(const CBsonDocument& filter)
{
	CQueryTranslator translator;
	auto condition = translator.translateFilter(filter);
	if (!condition)
		return std::unexpected(condition.error());

	std::lock_guard<std::mutex> lock(session_->mutex);
	auto ready = ensureTable();
	if (!ready)
		return std::unexpected(ready.error());

	auto counted = execute("SELECT count(*) FROM " + table_ + whereClause(*condition),
						   translator.parameters(), true);
	if (!counted)
		return std::unexpected(counted.error());
	return std::stoll((*counted)->getValue(0, 0));
}

CollectionResult<void> CPostgresCollection::drop()
{
	std::lock_guard<std::mutex> lock(session_->mutex);

	auto dropped = execute("DROP TABLE IF EXISTS " + table_, {}, false);
	if (!dropped)
		return std::unexpected(dropped.error());

	tableReady_ = false;
	return {};
}

CollectionResult<void> CPostgresCollection::createIndex(const CBsonDocument& keys)
{
	CQueryTranslator translator;
	auto columns = translator.translateIndex(keys);
	if (!columns)
		return std::unexpected(columns.error());

	std::lock_guard<std::mutex> lock(session_->mutex);
	auto ready = ensureTable();
	if (!ready)
		return std::unexpected(ready.error());

	std::string indexName =
		quoteIdentifier(name_ + "_" + indexNameForKeys(keys));
	auto created = execute("CREATE INDEX IF NOT EXISTS " + indexName + " ON " +
							   table_ + " (" + *columns + ")",
						   {}, false);
	if (!created)
		return std::unexpected(created.error());
	return {};
}

/*-------------------------------------------------------------------------
 * CPostgresDatabase implementation
 *-------------------------------------------------------------------------*/
CPostgresDatabase::CPostgresDatabase(const PLibpqConfig& config,
									 std::shared_ptr<ILogger> logger)
	: config_(config), session_(std::make_shared<CPostgresSession>()),
	  status_(CDatabaseStatus::DISCONNECTED), logger_(std::move(logger))
{
}

CPostgresDatabase::~CPostgresDatabase()
{
	disconnect();
}

CollectionResult<void> CPostgresDatabase::connect()
{
	std::lock_guard<std::mutex> lock(session_->mutex);

	status_ = CDatabaseStatus::CONNECTING;
	if (!session_->libpq.connect(config_))
	{
		status_ = CDatabaseStatus::ERROR;
		error_log("PostgreSQL connection failed: " + session_->libpq.getLastError());
		return std::unexpected(CCollectionError(COLLECTION_ERROR_CONNECTION,
												session_->libpq.getLastError()));
	}

	status_ = CDatabaseStatus::CONNECTED;
	info_log("Connected to PostgreSQL " + getConnectionInfo() + " (server " +
			 session_->libpq.getServerVersion() + ")");
	return {};
}

void CPostgresDatabase::disconnect()
{
	std::lock_guard<std::mutex> lock(session_->mutex);

	if (session_->libpq.isConnected())
	{
		session_->libpq.disconnect();
		debug_log("Disconnected from PostgreSQL " + getConnectionInfo());
	}
	status_ = CDatabaseStatus::DISCONNECTED;
}

CDatabaseStatus CPostgresDatabase::getStatus() const
{
	return status_;
}

bool CPostgresDatabase::ping()
{
	std::lock_guard<std::mutex> lock(session_->mutex);
	return session_->libpq.ping();
}

std::shared_ptr<ICollection>
CPostgresDatabase::getCollection(const std::string& name,
								 const CCollectionOptions& /* options */)
{
	return std::make_shared<CPostgresCollection>(session_, name, logger_);
}

std::string CPostgresDatabase::getConnectionInfo() const
{
	return "postgresql://" + config_.username + "@" + config_.host + ":" +
		   config_.port + "/" + config_.database;
}

std::string CPostgresDatabase::getServerVersion() const
{
	return session_->libpq.getServerVersion();
}

} /* namespace DocBucket */
