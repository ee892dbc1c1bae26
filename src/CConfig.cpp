/*-------------------------------------------------------------------------
 *
 * CConfig.cpp
 *		  Configuration management implementation for DocBucket
 *
 * Handles loading and processing of configuration files in JSON, YAML and
 * INI/conf formats.  Nested keys are flattened with '.' separators, so
 * "bucket: {name: x}" becomes "bucket.name".
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CConfig.cpp
 *
 *-------------------------------------------------------------------------
 */

#include <fstream>
#include <iterator>
#include <sstream>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "CConfig.hpp"
#include "CLogMacros.hpp"

namespace DocBucket
{

/*
 * CConfig constructor
 *		Initialize configuration manager
 */
CConfig::CConfig()
	: logger_(nullptr)
{
}

CConfig::~CConfig() = default;

/*
 * loadFromFile
 *		Load configuration from file based on extension
 */
std::error_code
CConfig::loadFromFile(const std::string& filename)
{
	std::string		extension;
	std::ifstream	file;
	std::string		content;
	size_t			dot;

	dot = filename.find_last_of('.');
	if (dot == std::string::npos)
		return std::make_error_code(std::errc::invalid_argument);
	extension = filename.substr(dot + 1);

	file.open(filename);
	if (!file.is_open())
		return std::make_error_code(std::errc::no_such_file_or_directory);

	content = std::string((std::istreambuf_iterator<char>(file)),
						  std::istreambuf_iterator<char>());
	file.close();

	if (extension == "json")
		return loadFromJson(content);
	else if (extension == "yaml" || extension == "yml")
		return loadFromYaml(content);
	else if (extension == "ini" || extension == "conf")
		return loadFromIni(content);

	return std::make_error_code(std::errc::invalid_argument);
}

/*
 * loadFromJson
 *		Parse JSON configuration content
 */
std::error_code
CConfig::loadFromJson(const std::string& jsonContent)
{
	if (jsonContent.empty())
		return std::make_error_code(std::errc::invalid_argument);

	try
	{
		nlohmann::json j = nlohmann::json::parse(jsonContent);
		processJsonNode("", j);
		return std::error_code{};
	}
	catch (const nlohmann::json::exception& e)
	{
		error_log(std::string("JSON parsing error: '") + e.what() + "'.");
		return std::make_error_code(std::errc::invalid_argument);
	}
}

/*
 * processJsonNode
 *		Recursively process JSON nodes to flatten nested structure
 */
void
CConfig::processJsonNode(const std::string& prefix, const nlohmann::json& node)
{
	if (node.is_object())
	{
		for (auto it = node.begin(); it != node.end(); ++it)
		{
			std::string key = it.key();
			std::string fullKey = prefix.empty() ? key : prefix + "." + key;
			processJsonNode(fullKey, it.value());
		}
	}
	else if (node.is_string())
	{
		set(prefix, node.get<std::string>(), ConfigSource::FILE);
	}
	else if (node.is_boolean())
	{
		set(prefix, node.get<bool>(), ConfigSource::FILE);
	}
	else if (node.is_number_integer())
	{
		int64_t v = node.get<int64_t>();
		if (v >= INT32_MIN && v <= INT32_MAX)
			set(prefix, static_cast<int>(v), ConfigSource::FILE);
		else
			set(prefix, v, ConfigSource::FILE);
	}
	else if (node.is_number_float())
	{
		set(prefix, node.get<double>(), ConfigSource::FILE);
	}
	else if (node.is_array())
	{
		std::vector<std::string> arrayValues;
		for (const auto& item : node)
		{
			if (item.is_string())
				arrayValues.push_back(item.get<std::string>());
			else
				arrayValues.push_back(item.dump());
		}
		set(prefix, arrayValues, ConfigSource::FILE);
	}
	else
	{
		set(prefix, node.dump(), ConfigSource::FILE);
	}
}

/*
 * loadFromYaml
 *		Parse YAML configuration content
 */
std::error_code
CConfig::loadFromYaml(const std::string& yamlContent)
{
	if (yamlContent.empty())
		return std::make_error_code(std::errc::invalid_argument);

	try
	{
		YAML::Node config = YAML::Load(yamlContent);
		processYamlNode("", config);
		return std::error_code{};
	}
	catch (const YAML::Exception& e)
	{
		error_log(std::string("YAML parsing error: '") + e.what() + "'.");
		return std::make_error_code(std::errc::invalid_argument);
	}
}

/*
 * processYamlNode
 *		Recursively process YAML nodes
 */
void
CConfig::processYamlNode(const std::string& prefix, const YAML::Node& node)
{
	if (node.IsMap())
	{
		for (const auto& pair : node)
		{
			std::string key = pair.first.as<std::string>();
			std::string fullKey = prefix.empty() ? key : prefix + "." + key;
			processYamlNode(fullKey, pair.second);
		}
	}
	else if (node.IsNull())
	{
		set(prefix, std::string(""), ConfigSource::FILE);
	}
	else if (node.IsScalar())
	{
		std::string strValue = node.as<std::string>();

		/* Check if it's a boolean */
		if (strValue == "true" || strValue == "false")
		{
			set(prefix, strValue == "true", ConfigSource::FILE);
			return;
		}

		/* Numbers must parse completely, "5432abc" stays a string */
		try
		{
			size_t consumed = 0;
			if (strValue.find('.') != std::string::npos)
			{
				double d = std::stod(strValue, &consumed);
				if (consumed == strValue.size())
				{
					set(prefix, d, ConfigSource::FILE);
					return;
				}
			}
			else
			{
				int i = std::stoi(strValue, &consumed);
				if (consumed == strValue.size())
				{
					set(prefix, i, ConfigSource::FILE);
					return;
				}
			}
		}
		catch (const std::exception&)
		{
		}
		set(prefix, strValue, ConfigSource::FILE);
	}
	else if (node.IsSequence())
	{
		std::vector<std::string> arrayValues;
		for (const auto& item : node)
		{
			if (item.IsScalar())
			{
				arrayValues.push_back(item.as<std::string>());
			}
			else
			{
				std::stringstream ss;
				ss << item;
				arrayValues.push_back(ss.str());
			}
		}
		set(prefix, arrayValues, ConfigSource::FILE);
	}
}

/*
 * loadFromIni
 *		Parse INI/conf content, "[section]" headers prefix the keys
 */
std::error_code
CConfig::loadFromIni(const std::string& iniContent)
{
	std::istringstream	stream(iniContent);
	std::string			line;
	std::string			currentSection;

	if (iniContent.empty())
		return std::make_error_code(std::errc::invalid_argument);

	while (std::getline(stream, line))
	{
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		if (line.empty() || line[0] == ';' || line[0] == '#')
			continue;

		if (line[0] == '[')
		{
			size_t endBracket = line.find(']');
			if (endBracket != std::string::npos)
				currentSection = line.substr(1, endBracket - 1);
			continue;
		}

		size_t equalPos = line.find('=');
		if (equalPos == std::string::npos)
			continue;

		std::string key = line.substr(0, equalPos);
		std::string value = line.substr(equalPos + 1);

		key.erase(0, key.find_first_not_of(" \t"));
		key.erase(key.find_last_not_of(" \t") + 1);
		value.erase(0, value.find_first_not_of(" \t"));
		value.erase(value.find_last_not_of(" \t") + 1);

		if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
			value = value.substr(1, value.size() - 2);

		if (!key.empty() && !value.empty())
		{
			std::string fullKey =
				currentSection.empty() ? key : currentSection + "." + key;
			set(fullKey, value, ConfigSource::FILE);
		}
	}

	return std::error_code{};
}

void
CConfig::set(const std::string& key, const ConfigValue& value,
			 ConfigSource source)
{
	ConfigEntry entry;

	config_values_[key] = value;

	entry.key = key;
	entry.value = value;
	entry.lastModified = std::chrono::system_clock::now();
	entry.source = source;
	config_metadata_[key] = entry;

	debug_log("Configuration value set: '" + key + "'.");
}

std::optional<ConfigValue>
CConfig::get(const std::string& key) const
{
	auto it = config_values_.find(key);
	if (it != config_values_.end())
		return it->second;
	return std::nullopt;
}

std::optional<ConfigEntry>
CConfig::getEntry(const std::string& key) const
{
	auto it = config_metadata_.find(key);
	if (it != config_metadata_.end())
		return it->second;
	return std::nullopt;
}

bool
CConfig::has(const std::string& key) const
{
	return config_values_.find(key) != config_values_.end();
}

void
CConfig::setLogger(std::shared_ptr<ILogger> logger)
{
	logger_ = std::move(logger);
}

} // namespace DocBucket
