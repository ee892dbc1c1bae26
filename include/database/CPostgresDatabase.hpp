/*-------------------------------------------------------------------------
 *
 * CPostgresDatabase.hpp
 *      PostgreSQL database implementation for DocBucket.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------*/

#pragma once

#include "../IInterfaces.hpp"
#include "CLibpq.hpp"
#include "IDatabase.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace DocBucket
{

/* One libpq connection shared by every collection and cursor */
struct CPostgresSession
{
	CLibpq libpq;
	std::mutex mutex;
};

/**
 * Reads the result set lazily in batches of LIMIT/OFFSET pages so large
 * chunk sequences are never materialised at once.
 */
class CPostgresCursor : public ICursor
{
public:
	CPostgresCursor(std::shared_ptr<CPostgresSession> session,
					std::string selectSql, std::vector<std::string> parameters,
					int64_t limit, int64_t skip,
					std::shared_ptr<ILogger> logger);

	CollectionResult<std::optional<CBsonDocument>> next() override;

	static constexpr int64_t kBatchSize = 101;

private:
	std::shared_ptr<CPostgresSession> session_;
	std::string selectSql_;
	std::vector<std::string> parameters_;
	int64_t remaining_;
	int64_t offset_;
	bool exhausted_;
	std::deque<CBsonDocument> buffer_;
	std::shared_ptr<ILogger> logger_;

	CollectionResult<void> fetchBatch();
};

/**
 * Each collection is a table
 *     (seq bigserial, id text PRIMARY KEY, doc jsonb, raw bytea)
 * where raw holds the exact BSON, doc the searchable relaxed JSON form
 * without binary values, and seq the insertion order.
 */
class CPostgresCollection : public ICollection
{
public:
	CPostgresCollection(std::shared_ptr<CPostgresSession> session,
						const std::string& name,
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

	const std::string& tableName() const;

private:
	std::shared_ptr<CPostgresSession> session_;
	std::string name_;
	std::string table_;
	bool tableReady_;
	std::shared_ptr<ILogger> logger_;

	/* Caller holds session_->mutex */
	CollectionResult<void> ensureTable();
	CollectionResult<std::unique_ptr<PLibpqResult>>
	execute(const std::string& sql, const std::vector<std::string>& parameters,
			bool expectTuples);
};

class CPostgresDatabase : public IDatabase
{
public:
	explicit CPostgresDatabase(const PLibpqConfig& config,
							   std::shared_ptr<ILogger> logger = nullptr);
	~CPostgresDatabase() override;

	CollectionResult<void> connect() override;
	void disconnect() override;
	CDatabaseStatus getStatus() const override;
	bool ping() override;

	std::shared_ptr<ICollection>
	getCollection(const std::string& name,
				  const CCollectionOptions& options) override;

	std::string getConnectionInfo() const override;
	std::string getServerVersion() const;

private:
	PLibpqConfig config_;
	std::shared_ptr<CPostgresSession> session_;
	CDatabaseStatus status_;
	std::shared_ptr<ILogger> logger_;
};

/* Maps a failed statement to a collection error via its SQLSTATE */
CCollectionError postgresError(const PLibpqResult* result, const CLibpq& libpq);

/* "\x..." text form of a bytea parameter */
std::string byteaHex(ByteSpan bytes);

} // namespace DocBucket
