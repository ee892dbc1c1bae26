/*-------------------------------------------------------------------------
 *
 * CLibpq.cpp
 *      PostgreSQL libpq wrapper implementation for DocBucket.
 *      Owns a single connection and the results it produces.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */
#include "database/CLibpq.hpp"

#include <libpq-fe.h>
#include <sstream>

namespace DocBucket
{

namespace
{

/* Quote a conninfo value so spaces and quotes survive */
std::string quoteConninfo(const std::string& value)
{
	std::string quoted = "'";
	for (char c : value)
	{
		if (c == '\'' || c == '\\')
			quoted += '\\';
		quoted += c;
	}
	quoted += '\'';
	return quoted;
}

} /* anonymous namespace */

/*-------------------------------------------------------------------------
 * PLibpqResult implementation
 *-------------------------------------------------------------------------*/
PLibpqResult::PLibpqResult(PGresult* result) : result_(result)
{
}

PLibpqResult::~PLibpqResult()
{
	if (result_)
	{
		PQclear(result_);
	}
}

bool PLibpqResult::isTuplesOk() const
{
	return result_ && PQresultStatus(result_) == PGRES_TUPLES_OK;
}

bool PLibpqResult::isCommandOk() const
{
	return result_ && PQresultStatus(result_) == PGRES_COMMAND_OK;
}

int PLibpqResult::getRowCount() const
{
	return result_ ? PQntuples(result_) : 0;
}

int PLibpqResult::getColumnCount() const
{
	return result_ ? PQnfields(result_) : 0;
}

std::string PLibpqResult::getValue(int rowIndex, int columnIndex) const
{
	if (!result_ || rowIndex < 0 || rowIndex >= getRowCount() ||
		columnIndex < 0 || columnIndex >= getColumnCount())
	{
		return "";
	}
	const char* value = PQgetvalue(result_, rowIndex, columnIndex);
	return value ? value : "";
}

bool PLibpqResult::getBytes(int rowIndex, int columnIndex, ByteVector& out) const
{
	if (!result_ || rowIndex < 0 || rowIndex >= getRowCount() ||
		columnIndex < 0 || columnIndex >= getColumnCount() ||
		PQgetisnull(result_, rowIndex, columnIndex))
	{
		return false;
	}

	size_t length = 0;
	const char* text = PQgetvalue(result_, rowIndex, columnIndex);
	unsigned char* raw =
		PQunescapeBytea(reinterpret_cast<const unsigned char*>(text), &length);
	if (!raw)
	{
		return false;
	}

	out.assign(raw, raw + length);
	PQfreemem(raw);
	return true;
}

int64_t PLibpqResult::getAffectedRows() const
{
	if (!result_)
	{
		return 0;
	}
	const char* tuples = PQcmdTuples(result_);
	if (!tuples || *tuples == '\0')
	{
		return 0;
	}
	return std::stoll(tuples);
}

std::string PLibpqResult::getErrorMessage() const
{
	if (!result_)
	{
		return "no result from server";
	}
	const char* error = PQresultErrorMessage(result_);
	return error ? error : "";
}

std::string PLibpqResult::getErrorDetail() const
{
	if (!result_)
	{
		return "";
	}
	const char* detail = PQresultErrorField(result_, PG_DIAG_MESSAGE_DETAIL);
	return detail ? detail : "";
}

std::string PLibpqResult::getSqlState() const
{
	if (!result_)
	{
		return "";
	}
	const char* state = PQresultErrorField(result_, PG_DIAG_SQLSTATE);
	return state ? state : "";
}

/*-------------------------------------------------------------------------
 * CLibpq implementation
 *-------------------------------------------------------------------------*/
CLibpq::CLibpq() : connection_(nullptr)
{
}

CLibpq::~CLibpq()
{
	disconnect();
}

bool CLibpq::connect(const PLibpqConfig& config)
{
	config_ = config;
	return connect(buildConnectionString());
}

bool CLibpq::connect(const std::string& connectionString)
{
	if (connection_)
	{
		disconnect();
	}

	connection_ = PQconnectdb(connectionString.c_str());
	if (!connection_)
	{
		setError("out of memory allocating PostgreSQL connection");
		return false;
	}
	if (PQstatus(connection_) != CONNECTION_OK)
	{
		setError(PQerrorMessage(connection_));
		PQfinish(connection_);
		connection_ = nullptr;
		return false;
	}

	if (!setConnectionParameters())
	{
		disconnect();
		return false;
	}

	clearErrors();
	return true;
}

void CLibpq::disconnect()
{
	if (connection_)
	{
		if (isTransactionActive())
		{
			rollbackTransaction();
		}

		PQfinish(connection_);
		connection_ = nullptr;
	}
}

bool CLibpq::isConnected() const
{
	return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

std::unique_ptr<PLibpqResult> CLibpq::executeQuery(const std::string& query)
{
	if (!isConnected())
	{
		setError("Not connected to database");
		return nullptr;
	}

	PGresult* result = PQexec(connection_, query.c_str());
	if (!result)
	{
		setError(PQerrorMessage(connection_));
		return nullptr;
	}
	return std::make_unique<PLibpqResult>(result);
}

std::unique_ptr<PLibpqResult>
CLibpq::executeQuery(const std::string& query,
					 const std::vector<std::string>& parameters)
{
	if (!isConnected())
	{
		setError("Not connected to database");
		return nullptr;
	}

	/* Convert string parameters to const char* for PQexecParams */
	std::vector<const char*> paramPtrs;
	paramPtrs.reserve(parameters.size());
	for (const auto& param : parameters)
	{
		paramPtrs.push_back(param.c_str());
	}

	PGresult* result =
		PQexecParams(connection_, query.c_str(),
					 static_cast<int>(parameters.size()), nullptr,
					 paramPtrs.data(), nullptr, nullptr, 0);
	if (!result)
	{
		setError(PQerrorMessage(connection_));
		return nullptr;
	}
	return std::make_unique<PLibpqResult>(result);
}

bool CLibpq::rollbackTransaction()
{
	auto result = executeQuery("ROLLBACK");
	return result && result->isCommandOk();
}

bool CLibpq::isTransactionActive() const
{
	if (!connection_)
	{
		return false;
	}

	PGTransactionStatusType status = PQtransactionStatus(connection_);
	return status == PQTRANS_INTRANS || status == PQTRANS_INERROR;
}

std::string CLibpq::getServerVersion() const
{
	if (!connection_)
	{
		return "";
	}
	int version = PQserverVersion(connection_);
	return version ? std::to_string(version) : "";
}

std::string CLibpq::getLastError() const
{
	return lastError_;
}

void CLibpq::clearErrors()
{
	lastError_.clear();
}

bool CLibpq::ping()
{
	auto result = executeQuery("SELECT 1");
	return result && result->isTuplesOk();
}

void CLibpq::setError(const std::string& error)
{
	lastError_ = error;
	while (!lastError_.empty() && (lastError_.back() == '\n'))
	{
		lastError_.pop_back();
	}
}

std::string CLibpq::buildConnectionString() const
{
	if (!config_.conninfo.empty())
	{
		return config_.conninfo;
	}

	std::ostringstream oss;
	oss << "host=" << quoteConninfo(config_.host)
		<< " port=" << quoteConninfo(config_.port);

	if (!config_.database.empty())
	{
		oss << " dbname=" << quoteConninfo(config_.database);
	}
	if (!config_.username.empty())
	{
		oss << " user=" << quoteConninfo(config_.username);
	}
	if (!config_.password.empty())
	{
		oss << " password=" << quoteConninfo(config_.password);
	}
	if (!config_.sslmode.empty())
	{
		oss << " sslmode=" << config_.sslmode;
	}
	if (!config_.applicationName.empty())
	{
		oss << " application_name=" << quoteConninfo(config_.applicationName);
	}
	if (config_.connectionTimeout.count() > 0)
	{
		/* libpq takes whole seconds, minimum 2 */
		long seconds = static_cast<long>((config_.connectionTimeout.count() + 999) / 1000);
		oss << " connect_timeout=" << (seconds < 2 ? 2 : seconds);
	}

	return oss.str();
}

bool CLibpq::runSetting(const std::string& statement)
{
	auto result = executeQuery(statement);
	if (!result || !result->isCommandOk())
	{
		setError(result ? result->getErrorMessage() : lastError_);
		return false;
	}
	return true;
}

bool CLibpq::setConnectionParameters()
{
	if (!connection_)
	{
		return false;
	}

	if (!config_.clientEncoding.empty() &&
		PQsetClientEncoding(connection_, config_.clientEncoding.c_str()) != 0)
	{
		setError("unable to set client encoding " + config_.clientEncoding);
		return false;
	}

	if (config_.statementTimeout.count() > 0 &&
		!runSetting("SET statement_timeout = " +
					std::to_string(config_.statementTimeout.count())))
	{
		return false;
	}

	return true;
}

} /* namespace DocBucket */
