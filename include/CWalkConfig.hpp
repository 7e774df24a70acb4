/*-------------------------------------------------------------------------
 *
 * CWalkConfig.hpp
 *      Runtime settings for the bsonwalk command line tool.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */
#pragma once

#include "document/CBsonWireType.hpp"

#include <string>
#include <system_error>

namespace BsonWalk
{

class CConfig;

struct CWalkConfig
{
    std::string programName;
    std::string logLevel;
    std::string logFile;
    bool consoleOutput;
    std::string unknownTypePolicy;
    std::string jsonMode;
    std::string configFile;

    CWalkConfig()
        : programName("bsonwalk"), logLevel("INFO"), logFile(""),
          consoleOutput(true), unknownTypePolicy("sentinel"),
          jsonMode("canonical"), configFile("")
    {
    }

    void setDefaults();
    std::error_code loadFromConfig(const CConfig& config);
    bool validate() const;

    CUnknownTypePolicy policy() const;
    bool relaxedJson() const;
};

} /* namespace BsonWalk */
