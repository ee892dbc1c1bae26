/*-------------------------------------------------------------------------
 *
 * CBucketConfig.cpp
 *		  Bucket configuration implementation for DocBucket
 *
 * Maps flattened configuration keys onto the bucket, backend and logging
 * settings, and validates the result.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CBucketConfig.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CBucketConfig.hpp"
#include "CConfig.hpp"

#include <algorithm>
#include <cctype>

namespace DocBucket
{

namespace
{

template <typename T>
T
get_config_value(const CConfig& loader, const std::string& key,
				 const T& defaultValue)
{
	auto value = loader.get(key);

	if (!value)
		return defaultValue;

	if (std::holds_alternative<T>(*value))
		return std::get<T>(*value);

	if (std::holds_alternative<int>(*value))
	{
		if constexpr (std::is_same_v<T, int64_t>)
			return std::get<int>(*value);
		else if constexpr (std::is_same_v<T, bool>)
			return std::get<int>(*value) != 0;
	}

	if (std::holds_alternative<double>(*value))
	{
		if constexpr (std::is_same_v<T, int> || std::is_same_v<T, int64_t>)
			return static_cast<T>(std::get<double>(*value));
	}

	if (std::holds_alternative<std::string>(*value))
	{
		const std::string& str = std::get<std::string>(*value);
		try
		{
			if constexpr (std::is_same_v<T, int>)
				return std::stoi(str);
			else if constexpr (std::is_same_v<T, int64_t>)
				return std::stoll(str);
			else if constexpr (std::is_same_v<T, bool>)
				return str == "true" || str == "1" || str == "yes" || str == "on";
		}
		catch (const std::exception&)
		{
			return defaultValue;
		}
	}

	return defaultValue;
}

std::string
get_config_string(const CConfig& loader, const std::string& key,
				  const std::string& defaultValue)
{
	auto value = loader.get(key);

	if (!value)
		return defaultValue;

	if (std::holds_alternative<std::string>(*value))
		return std::get<std::string>(*value);
	if (std::holds_alternative<int>(*value))
		return std::to_string(std::get<int>(*value));
	if (std::holds_alternative<int64_t>(*value))
		return std::to_string(std::get<int64_t>(*value));

	return defaultValue;
}

} /* anonymous namespace */

/*
 * setDefaults
 *		Reset every setting to its default value
 */
void
CBucketConfig::setDefaults()
{
	*this = CBucketConfig();
}

/*
 * loadFromConfig
 *		Read settings from a loaded configuration file.  Missing keys keep
 *		their current values.
 */
std::error_code
CBucketConfig::loadFromConfig(const CConfig& loader)
{
	std::string backendName;

	bucketName = get_config_string(loader, "bucket.name", bucketName);
	chunkSizeBytes = get_config_value<int>(loader, "bucket.chunk_size",
										   chunkSizeBytes);
	disableMD5 = get_config_value<bool>(loader, "bucket.disable_md5",
										disableMD5);

	backendName = get_config_string(loader, "backend.type",
									backendTypeName(backend));
	if (!parseBackendType(backendName, backend))
		return std::make_error_code(std::errc::invalid_argument);

	pgHost = get_config_string(loader, "postgresql.host", pgHost);
	pgPort = get_config_string(loader, "postgresql.port", pgPort);
	pgDatabase = get_config_string(loader, "postgresql.database", pgDatabase);
	pgUser = get_config_string(loader, "postgresql.user", pgUser);
	pgPassword = get_config_string(loader, "postgresql.password", pgPassword);
	pgTimeout = std::chrono::milliseconds(
		get_config_value<int64_t>(loader, "postgresql.timeout",
								  pgTimeout.count() / 1000) * 1000);

	mongoUri = get_config_string(loader, "mongodb.uri", mongoUri);
	mongoDatabase = get_config_string(loader, "mongodb.database", mongoDatabase);
	mongoReadPreference = get_config_string(loader, "mongodb.read_preference",
											mongoReadPreference);
	mongoWriteConcernW = get_config_value<int>(loader, "mongodb.write_concern_w",
											   mongoWriteConcernW);
	mongoMaxTimeMS = get_config_value<int64_t>(loader, "mongodb.max_time_ms",
											   mongoMaxTimeMS);

	logLevel = get_config_string(loader, "logging.level", logLevel);
	logFile = get_config_string(loader, "logging.file", logFile);
	logToConsole = get_config_value<bool>(loader, "logging.console",
										  logToConsole);

	if (!validate())
		return std::make_error_code(std::errc::invalid_argument);

	return std::error_code{};
}

/*
 * validate
 *		Validate configuration values
 */
bool
CBucketConfig::validate() const
{
	if (bucketName.empty())
		return false;
	if (chunkSizeBytes <= 0)
		return false;
	if (mongoMaxTimeMS < 0)
		return false;
	if (backend == CBackendType::MongoDB && mongoUri.empty())
		return false;
	return true;
}

std::string
backendTypeName(CBackendType type)
{
	switch (type)
	{
	case CBackendType::Memory:
		return "memory";
	case CBackendType::PostgreSQL:
		return "postgresql";
	case CBackendType::MongoDB:
		return "mongodb";
	}
	return "unknown";
}

bool
parseBackendType(const std::string& name, CBackendType& type)
{
	std::string lower = name;

	std::transform(lower.begin(), lower.end(), lower.begin(),
				   [](unsigned char c) { return std::tolower(c); });

	if (lower == "memory")
		type = CBackendType::Memory;
	else if (lower == "postgresql" || lower == "postgres" || lower == "pg")
		type = CBackendType::PostgreSQL;
	else if (lower == "mongodb" || lower == "mongo")
		type = CBackendType::MongoDB;
	else
		return false;
	return true;
}

} /* namespace DocBucket */
