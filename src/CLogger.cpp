/*-------------------------------------------------------------------------
 *
 * CLogger.cpp
 *		  Logging system implementation for BsonWalk
 *
 * Provides leveled logging to the console and an optional log file.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CLogger.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CLogger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace BsonWalk
{

/*
 * CLogger constructor
 *		Initialize logger with configuration
 */
CLogger::CLogger(const CWalkConfig& config)
    : config_(config), logFile_(config.logFile),
      consoleOutput_(config.consoleOutput), fileOutput_(!config.logFile.empty()),
      timestampFormat_("%Y-%m-%d %H:%M:%S"), logLevel_(CLogLevel::INFO),
      initialized_(false)
{
    if (auto level = parseLevel(config.logLevel))
        logLevel_ = *level;
}

/*
 * CLogger destructor
 *		Clean up open file streams
 */
CLogger::~CLogger()
{
    if (fileStream_ && fileStream_->is_open())
        fileStream_->close();
}

/*
 * log
 *		Main logging function - write message if level is sufficient
 */
void CLogger::log(CLogLevel level, const std::string& message)
{
    std::string formattedMessage;

    if (!shouldLog(level))
        return;

    formattedMessage = formatMessage(level, message);

    std::lock_guard<std::mutex> lock(logMutex_);
    if (consoleOutput_)
        writeToConsole(formattedMessage);

    if (fileOutput_ && fileStream_ && fileStream_->is_open())
        writeToFile(formattedMessage);
}

/*
 * setLogLevel
 *		Set minimum log level for output
 */
void CLogger::setLogLevel(CLogLevel level)
{
    logLevel_ = level;
}

/*
 * getLogLevel
 *		Return current log level
 */
CLogLevel CLogger::getLogLevel() const noexcept
{
    return logLevel_;
}

/*
 * initialize
 *		Open the log file when file output is configured
 */
std::error_code CLogger::initialize()
{
    if (initialized_)
        return std::error_code();

    try
    {
        if (fileOutput_ && !logFile_.empty())
        {
            fileStream_ =
                std::make_unique<std::ofstream>(logFile_, std::ios::app);
            if (!fileStream_->is_open())
                return std::make_error_code(std::errc::io_error);
        }

        initialized_ = true;
        return std::error_code();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        return std::make_error_code(std::errc::io_error);
    }
}

/*
 * shutdown
 *		Close file streams and clean up resources
 */
void CLogger::shutdown() noexcept
{
    if (fileStream_ && fileStream_->is_open())
        fileStream_->close();
    initialized_ = false;
}

/*
 * parseLevel
 *		Map a configured level name to a log level, case insensitive
 */
std::optional<CLogLevel> CLogger::parseLevel(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (upper == "TRACE")
        return CLogLevel::TRACE;
    if (upper == "DEBUG")
        return CLogLevel::DEBUG;
    if (upper == "INFO")
        return CLogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING")
        return CLogLevel::WARN;
    if (upper == "ERROR")
        return CLogLevel::ERROR;
    if (upper == "FATAL")
        return CLogLevel::FATAL;
    return std::nullopt;
}

/*
 * writeToConsole
 *		Write formatted message to console
 */
void CLogger::writeToConsole(const std::string& message)
{
    std::cerr << message << std::endl;
}

/*
 * writeToFile
 *		Write formatted message to log file
 */
void CLogger::writeToFile(const std::string& message)
{
    *fileStream_ << message << std::endl;
    fileStream_->flush();
}

/*
 * formatMessage
 *		Format log message with timestamp, level, and metadata
 */
std::string CLogger::formatMessage(CLogLevel level, const std::string& message)
{
    std::stringstream ss;
    int pid = static_cast<int>(getpid());
    std::string timestamp = getTimestamp();
    std::string component =
        config_.programName.empty() ? "bsonwalk" : config_.programName;

    /* ANSI color codes */
    const char* green = "\033[32m";
    const char* red = "\033[31m";
    const char* blue = "\033[34m";
    const char* reset = "\033[0m";

    std::string symbol;
    const char* color = reset;

    if (level == CLogLevel::ERROR || level == CLogLevel::FATAL)
    {
        symbol = "\u2717"; /* ✗ */
        color = red;
    }
    else if (level == CLogLevel::INFO)
    {
        symbol = "\u2713"; /* ✓ */
        color = green;
    }
    else if (level == CLogLevel::DEBUG || level == CLogLevel::TRACE)
    {
        symbol = "\u2139"; /* ℹ */
        color = blue;
    }
    else
    {
        symbol = "!";
        color = reset;
    }

    ss << color << symbol << " - " << pid << " " << timestamp << " "
       << getLevelString(level) << " " << component << ": " << message
       << reset;
    return ss.str();
}

/*
 * getLevelString
 *		Convert log level enum to string representation
 */
std::string CLogger::getLevelString(CLogLevel level)
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
    default:
        return "UNKNOWN";
    }
}

/*
 * getTimestamp
 *		Generate formatted timestamp string
 */
std::string CLogger::getTimestamp() const
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    std::stringstream ss;

    ss << std::put_time(&tm, timestampFormat_.c_str());
    return ss.str();
}

/*
 * shouldLog
 *		Check if message should be logged based on level
 */
bool CLogger::shouldLog(CLogLevel level) const noexcept
{
    return level >= logLevel_.load();
}

} /* namespace BsonWalk */
