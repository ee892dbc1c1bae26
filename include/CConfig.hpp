/*-------------------------------------------------------------------------
 *
 * CConfig.hpp
 *      Configuration file loader for DocBucket.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "IInterfaces.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <variant>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace DocBucket
{

using ConfigValue = std::variant<std::string, int, int64_t, uint64_t, double,
								 bool, std::vector<std::string>>;

enum class ConfigSource
{
	FILE,
	RUNTIME,
	DEFAULT
};

struct ConfigEntry
{
	std::string key;
	ConfigValue value;
	std::chrono::system_clock::time_point lastModified;
	ConfigSource source;

	ConfigEntry() : source(ConfigSource::DEFAULT) {}
};

class CConfig
{
public:
	CConfig();
	~CConfig();

	std::error_code loadFromFile(const std::string& filename);
	std::error_code loadFromJson(const std::string& jsonContent);
	std::error_code loadFromYaml(const std::string& yamlContent);
	std::error_code loadFromIni(const std::string& iniContent);

	void set(const std::string& key, const ConfigValue& value,
			 ConfigSource source = ConfigSource::RUNTIME);
	std::optional<ConfigValue> get(const std::string& key) const;
	std::optional<ConfigEntry> getEntry(const std::string& key) const;
	bool has(const std::string& key) const;

	void setLogger(std::shared_ptr<ILogger> logger);

private:
	std::shared_ptr<ILogger> logger_;
	std::unordered_map<std::string, ConfigValue> config_values_;
	std::unordered_map<std::string, ConfigEntry> config_metadata_;

	void processJsonNode(const std::string& prefix, const nlohmann::json& node);
	void processYamlNode(const std::string& prefix, const YAML::Node& node);
};

} // namespace DocBucket
