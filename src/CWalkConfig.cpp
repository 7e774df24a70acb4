/*-------------------------------------------------------------------------
 *
 * CWalkConfig.cpp
 *		  Typed settings of the bsonwalk tool
 *
 * Maps the keys of a loaded CConfig onto the settings struct and checks
 * the enumerated values.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CWalkConfig.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CWalkConfig.hpp"

#include "CConfig.hpp"
#include "CLogMacros.hpp"
#include "CLogger.hpp"

using namespace std;

namespace BsonWalk
{

/*
 * setDefaults
 *		Set default configuration values
 */
void
CWalkConfig::setDefaults()
{
	programName = "bsonwalk";
	logLevel = "INFO";
	logFile = "";
	consoleOutput = true;
	unknownTypePolicy = "sentinel";
	jsonMode = "canonical";
}

namespace
{

/*
 * lookupString
 *		Flat key first, then the key nested under its section
 */
std::string
lookupString(const CConfig& config, const std::string& section,
			 const std::string& key, const std::string& defaultValue)
{
	if (config.has(key))
		return config.getString(key, defaultValue);
	return config.getString(section + "." + key, defaultValue);
}

bool
lookupBool(const CConfig& config, const std::string& section,
		   const std::string& key, bool defaultValue)
{
	if (config.has(key))
		return config.getBool(key, defaultValue);
	return config.getBool(section + "." + key, defaultValue);
}

} /* anonymous namespace */

/*
 * loadFromConfig
 *		Copy recognized keys out of a loaded configuration
 */
std::error_code
CWalkConfig::loadFromConfig(const CConfig& config)
{
	logLevel = lookupString(config, "logging", "log_level", logLevel);
	logFile = lookupString(config, "logging", "log_file", logFile);
	consoleOutput =
		lookupBool(config, "logging", "console_output", consoleOutput);
	unknownTypePolicy = lookupString(config, "document", "unknown_type_policy",
									 unknownTypePolicy);
	jsonMode = lookupString(config, "document", "json_mode", jsonMode);

	if (!validate())
	{
		error_log("invalid configuration values in '" + configFile + "'");
		return std::make_error_code(std::errc::invalid_argument);
	}
	return std::error_code();
}

/*
 * validate
 *		Validate configuration values
 */
bool
CWalkConfig::validate() const
{
	if (!CLogger::parseLevel(logLevel))
		return false;
	if (unknownTypePolicy != "sentinel" && unknownTypePolicy != "fail")
		return false;
	if (jsonMode != "canonical" && jsonMode != "relaxed")
		return false;
	return true;
}

CUnknownTypePolicy
CWalkConfig::policy() const
{
	if (unknownTypePolicy == "fail")
		return CUnknownTypePolicy::Fail;
	return CUnknownTypePolicy::Sentinel;
}

bool
CWalkConfig::relaxedJson() const
{
	return jsonMode == "relaxed";
}

} /* namespace BsonWalk */
