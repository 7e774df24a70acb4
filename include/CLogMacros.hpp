/*-------------------------------------------------------------------------
 *
 * CLogMacros.hpp
 *      Global logging macros for BsonWalk
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "CLogRegistry.hpp"

/* Global logging macro that handles logger null checks */
#define elog(loglevel, ...)                                                    \
    do                                                                         \
    {                                                                          \
        if (auto logger_ = ::BsonWalk::CLogRegistry::get())                    \
        {                                                                      \
            logger_->log(loglevel, __VA_ARGS__);                               \
        }                                                                      \
    } while (0)

/* Convenience macros for common log levels */
#define debug_log(...) elog(::BsonWalk::CLogLevel::DEBUG, __VA_ARGS__)
#define error_log(...) elog(::BsonWalk::CLogLevel::ERROR, __VA_ARGS__)
#define info_log(...) elog(::BsonWalk::CLogLevel::INFO, __VA_ARGS__)
#define warn_log(...) elog(::BsonWalk::CLogLevel::WARN, __VA_ARGS__)
#define fatal_log(...) elog(::BsonWalk::CLogLevel::FATAL, __VA_ARGS__)
