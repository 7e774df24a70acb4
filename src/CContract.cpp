/*-------------------------------------------------------------------------
 *
 * CContract.cpp
 *		  Fatal contract violation handler for BsonWalk
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 * IDENTIFICATION
 *		  src/CContract.cpp
 *
 *-------------------------------------------------------------------------
 */

#include "CContract.hpp"
#include "CLogMacros.hpp"

#include <cstdlib>
#include <iostream>

namespace BsonWalk
{

/*
 * contractViolation
 *		Report a programmer error and abort
 */
void contractViolation(const std::string& message, const char* file, int line)
{
    std::string report = "contract violation at " + std::string(file) + ":" +
                         std::to_string(line) + ": " + message;

    if (CLogRegistry::get())
        fatal_log(report);
    else
        std::cerr << report << std::endl;

    std::abort();
}

} /* namespace BsonWalk */
