/*-------------------------------------------------------------------------
 *
 * CConfig.hpp
 *      Key/value configuration store for BsonWalk.
 *      Loads JSON, YAML and INI/conf files into dotted keys.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <variant>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace BsonWalk
{

using ConfigValue = std::variant<std::string, int, int64_t, uint64_t, double,
								 bool, std::vector<std::string>>;

class CConfig
{
public:
	CConfig();
	~CConfig();

	std::error_code loadFromFile(const std::string& filename);
	std::error_code loadFromJson(const std::string& jsonContent);
	std::error_code loadFromYaml(const std::string& yamlContent);
	std::error_code loadFromIni(const std::string& iniContent);

	void set(const std::string& key, const ConfigValue& value);
	std::optional<ConfigValue> get(const std::string& key) const;
	bool has(const std::string& key) const;
	std::vector<std::string> keys() const;

	/* Typed lookups; string values are converted when possible */
	std::string getString(const std::string& key,
						  const std::string& defaultValue) const;
	int getInt(const std::string& key, int defaultValue) const;
	bool getBool(const std::string& key, bool defaultValue) const;

	std::string toJson() const;

private:
	std::unordered_map<std::string, ConfigValue> config_values_;

	void processJsonNode(const std::string& prefix, const nlohmann::json& node);
	void processYamlNode(const std::string& prefix, const YAML::Node& node);
};

} // namespace BsonWalk
