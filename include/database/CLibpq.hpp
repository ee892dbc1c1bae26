/*-------------------------------------------------------------------------
 *
 * CLibpq.hpp
 *      PostgreSQL libpq wrapper for DocBucket.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <libpq-fe.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "CTypes.hpp"

namespace DocBucket
{

struct PLibpqConfig
{
	/* A full conninfo string wins over the individual fields */
	std::string conninfo;
	std::string host;
	std::string port;
	std::string database;
	std::string username;
	std::string password;
	std::string sslmode;
	std::string applicationName;
	std::string clientEncoding;
	std::chrono::milliseconds connectionTimeout;
	std::chrono::milliseconds statementTimeout;

	PLibpqConfig()
		: conninfo(""), host("localhost"), port("5432"), database("")
		, username("")
		, password("")
		, sslmode("prefer")
		, applicationName("docbucket")
		, clientEncoding("UTF8")
		, connectionTimeout(5000)
		, statementTimeout(0)
	{}
};

class PLibpqResult
{
public:
	explicit PLibpqResult(PGresult* result);
	~PLibpqResult();

	PLibpqResult(const PLibpqResult&) = delete;
	PLibpqResult& operator=(const PLibpqResult&) = delete;

	bool isTuplesOk() const;
	bool isCommandOk() const;
	int getRowCount() const;
	int getColumnCount() const;
	std::string getValue(int rowIndex, int columnIndex) const;
	/* Decodes a bytea column returned in text format */
	bool getBytes(int rowIndex, int columnIndex, ByteVector& out) const;
	int64_t getAffectedRows() const;
	std::string getErrorMessage() const;
	std::string getErrorDetail() const;
	std::string getSqlState() const;

private:
	PGresult* result_;
};

class CLibpq
{
public:
	CLibpq();
	~CLibpq();

	CLibpq(const CLibpq&) = delete;
	CLibpq& operator=(const CLibpq&) = delete;

	bool connect(const PLibpqConfig& config);
	bool connect(const std::string& connectionString);
	void disconnect();
	bool isConnected() const;

	std::unique_ptr<PLibpqResult> executeQuery(const std::string& query);
	std::unique_ptr<PLibpqResult> executeQuery(const std::string& query, const std::vector<std::string>& parameters);

	bool rollbackTransaction();
	bool isTransactionActive() const;

	std::string getServerVersion() const;
	std::string getLastError() const;
	void clearErrors();
	bool ping();

private:
	PGconn* connection_;
	PLibpqConfig config_;
	std::string lastError_;

	void setError(const std::string& error);
	std::string buildConnectionString() const;
	bool setConnectionParameters();
	bool runSetting(const std::string& statement);
};

} /* namespace DocBucket */
