/*-------------------------------------------------------------------------
 *
 * IInterfaces.hpp
 *      Logger interface shared by the bucket, backends and tools.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */
#pragma once
#include <string>
#include <system_error>

namespace DocBucket
{

/**
 * Log levels, ordered by severity
 */
enum class CLogLevel
{
	TRACE = 0,
	DEBUG = 1,
	INFO = 2,
	WARN = 3,
	ERROR = 4,
	FATAL = 5
};

constexpr const char* logLevelName(CLogLevel level) noexcept
{
	switch (level)
	{
	case CLogLevel::TRACE:
		return "TRACE";
	case CLogLevel::DEBUG:
		return "DEBUG";
	case CLogLevel::INFO:
		return "INFO";
	case CLogLevel::WARN:
		return "WARN";
	case CLogLevel::ERROR:
		return "ERROR";
	case CLogLevel::FATAL:
		return "FATAL";
	}
	return "UNKNOWN";
}

/**
 * Sink for diagnostic messages.  Components hold a possibly null
 * std::shared_ptr<ILogger> named logger_ and log through CLogMacros.hpp.
 */
class ILogger
{
  public:
	virtual ~ILogger() = default;

	virtual void log(CLogLevel level, const std::string& message) = 0;
	virtual void setLogLevel(CLogLevel level) = 0;
	virtual CLogLevel getLogLevel() const noexcept = 0;
	virtual std::error_code initialize() = 0;
	virtual void shutdown() noexcept = 0;

	/* Lets callers skip building messages that would be dropped */
	bool isEnabled(CLogLevel level) const noexcept
	{
		return level >= getLogLevel();
	}
};

} /* namespace DocBucket */
