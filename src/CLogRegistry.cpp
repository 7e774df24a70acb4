/*-------------------------------------------------------------------------
 *
 * CLogRegistry.cpp
 *		  Process-wide logger slot for BsonWalk
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CLogRegistry.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CLogRegistry.hpp"

#include <mutex>

namespace BsonWalk
{

namespace
{

std::mutex registryMutex;
std::shared_ptr<ILogger> registeredLogger;

} /* anonymous namespace */

/*
 * set
 *		Install the logger used by the logging macros
 */
void CLogRegistry::set(std::shared_ptr<ILogger> logger)
{
    std::lock_guard<std::mutex> lock(registryMutex);
    registeredLogger = std::move(logger);
}

/*
 * get
 *		Return the installed logger, or null when none is installed
 */
std::shared_ptr<ILogger> CLogRegistry::get()
{
    std::lock_guard<std::mutex> lock(registryMutex);
    return registeredLogger;
}

void CLogRegistry::reset()
{
    std::lock_guard<std::mutex> lock(registryMutex);
    registeredLogger.reset();
}

} /* namespace BsonWalk */
