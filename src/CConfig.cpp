/*-------------------------------------------------------------------------
 *
 * CConfig.cpp
 *		  Configuration management implementation for BsonWalk
 *
 * Handles loading and processing of configuration files in multiple formats
 * including JSON, YAML and INI/conf files.
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
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "CConfig.hpp"
#include "CLogMacros.hpp"

namespace BsonWalk
{

/*
 * CConfig constructor
 *		Initialize configuration manager
 */
CConfig::CConfig() = default;

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
		set(prefix, node.get<std::string>());
	}
	else if (node.is_number_integer())
	{
		set(prefix, node.get<int>());
	}
	else if (node.is_number_float())
	{
		set(prefix, node.get<double>());
	}
	else if (node.is_boolean())
	{
		set(prefix, node.get<bool>());
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
		set(prefix, arrayValues);
	}
	else
	{
		set(prefix, node.dump());
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
		set(prefix, std::string(""));
	}
	else if (node.IsScalar())
	{
		std::string strValue = node.as<std::string>();

		/* Check if it's a boolean */
		if (strValue == "true" || strValue == "false")
		{
			set(prefix, strValue == "true");
		}
		else
		{
			try
			{
				size_t consumed = 0;
				if (strValue.find('.') != std::string::npos)
				{
					double d = std::stod(strValue, &consumed);
					if (consumed == strValue.size())
						set(prefix, d);
					else
						set(prefix, strValue);
				}
				else
				{
					int i = std::stoi(strValue, &consumed);
					if (consumed == strValue.size())
						set(prefix, i);
					else
						set(prefix, strValue);
				}
			}
			catch (const std::logic_error&)
			{
				/* not numeric */
				set(prefix, strValue);
			}
		}
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
		set(prefix, arrayValues);
	}
}

/*
 * loadFromIni
 *		Parse INI/conf content; sections become key prefixes
 */
std::error_code CConfig::loadFromIni(const std::string& iniContent)
{
    if (iniContent.empty())
    {
        return std::make_error_code(std::errc::invalid_argument);
    }

    std::istringstream stream(iniContent);
    std::string line;
    std::string currentSection;

    while (std::getline(stream, line))
    {
        if (line.empty() || line[0] == ';' || line[0] == '#')
            continue;

        if (line[0] == '[')
        {
            size_t endBracket = line.find(']');
            if (endBracket != std::string::npos)
            {
                currentSection = line.substr(1, endBracket - 1);
            }
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

        if (!key.empty() && !value.empty())
        {
            std::string fullKey =
                currentSection.empty() ? key : currentSection + "." + key;
            set(fullKey, value);
        }
    }

    return std::error_code{};
}

std::string CConfig::toJson() const
{
    nlohmann::json j;

    for (const auto& [key, value] : config_values_)
    {
        std::visit([&j, &key](const auto& v) { j[key] = v; }, value);
    }

    return j.dump(2);
}

void CConfig::set(const std::string& key, const ConfigValue& value)
{
    config_values_[key] = value;
    debug_log("Configuration value set: '" + key + "'.");
}

std::optional<ConfigValue> CConfig::get(const std::string& key) const
{
    auto it = config_values_.find(key);
    if (it != config_values_.end())
    {
        return it->second;
    }
    return std::nullopt;
}

bool CConfig::has(const std::string& key) const
{
    return config_values_.find(key) != config_values_.end();
}

std::vector<std::string> CConfig::keys() const
{
    std::vector<std::string> result;
    result.reserve(config_values_.size());
    for (const auto& [key, _] : config_values_)
    {
        result.push_back(key);
    }
    return result;
}

/*
 * getString
 *		Return a string setting, or the default when absent or not a string
 */
std::string CConfig::getString(const std::string& key,
                               const std::string& defaultValue) const
{
    if (auto value = get(key))
    {
        if (std::holds_alternative<std::string>(*value))
            return std::get<std::string>(*value);
    }
    return defaultValue;
}

/*
 * getInt
 *		Return an integer setting; numeric strings are converted
 */
int CConfig::getInt(const std::string& key, int defaultValue) const
{
    auto value = get(key);
    if (!value)
        return defaultValue;

    if (std::holds_alternative<int>(*value))
        return std::get<int>(*value);
    if (std::holds_alternative<std::string>(*value))
    {
        try
        {
            return std::stoi(std::get<std::string>(*value));
        }
        catch (const std::logic_error&)
        {
            warn_log("Configuration value '" + key + "' is not an integer.");
        }
    }
    return defaultValue;
}

/*
 * getBool
 *		Return a boolean setting; "true", "1" and "yes" strings count as true
 */
bool CConfig::getBool(const std::string& key, bool defaultValue) const
{
    auto value = get(key);
    if (!value)
        return defaultValue;

    if (std::holds_alternative<bool>(*value))
        return std::get<bool>(*value);
    if (std::holds_alternative<int>(*value))
        return std::get<int>(*value) != 0;
    if (std::holds_alternative<std::string>(*value))
    {
        const std::string& val = std::get<std::string>(*value);
        if (val == "true" || val == "1" || val == "yes")
            return true;
        if (val == "false" || val == "0" || val == "no")
            return false;
    }
    return defaultValue;
}

} // namespace BsonWalk
