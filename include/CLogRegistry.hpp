/*-------------------------------------------------------------------------
 *
 * CLogRegistry.hpp
 *      Process-wide logger slot used by the logging macros.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "IInterfaces.hpp"

#include <memory>

namespace BsonWalk
{

/**
 * Holds the logger that library code reports through. Nothing is logged
 * until an application installs one.
 */
class CLogRegistry
{
  public:
    static void set(std::shared_ptr<ILogger> logger);
    static std::shared_ptr<ILogger> get();
    static void reset();
};

} /* namespace BsonWalk */
