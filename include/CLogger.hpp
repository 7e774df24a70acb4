/*-------------------------------------------------------------------------
 *
 * CLogger.hpp
 *      Logging system implementation for BsonWalk.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once
#include "CWalkConfig.hpp"
#include "IInterfaces.hpp"

#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace BsonWalk
{

class CLogger : public ILogger
{
  public:
    explicit CLogger(const CWalkConfig& config);
    virtual ~CLogger();
    void log(CLogLevel level, const std::string& message) override;
    void setLogLevel(CLogLevel level) override;
    CLogLevel getLogLevel() const noexcept override;
    std::error_code initialize() override;
    void shutdown() noexcept override;

    static std::optional<CLogLevel> parseLevel(const std::string& name);
    static std::string getLevelString(CLogLevel level);

  private:
    CWalkConfig config_;
    std::string logFile_;
    bool consoleOutput_;
    bool fileOutput_;
    std::string timestampFormat_;
    std::atomic<CLogLevel> logLevel_;
    std::unique_ptr<std::ofstream> fileStream_;
    std::mutex logMutex_;
    std::atomic<bool> initialized_;
    void writeToConsole(const std::string& message);
    void writeToFile(const std::string& message);
    std::string formatMessage(CLogLevel level, const std::string& message);
    std::string getTimestamp() const;
    bool shouldLog(CLogLevel level) const noexcept;
};

} /* namespace BsonWalk */
