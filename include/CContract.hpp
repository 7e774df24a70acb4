/*-------------------------------------------------------------------------
 *
 * CContract.hpp
 *      Fatal checks for API misuse.
 *
 * Programmer errors (reading an unpositioned cursor, overwriting with the
 * wrong type, inverted ranges) are not part of the recoverable error set.
 * They are logged at FATAL and terminate the process.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <string>

namespace BsonWalk
{

[[noreturn]] void contractViolation(const std::string& message,
                                    const char* file, int line);

} /* namespace BsonWalk */

#define BSONWALK_REQUIRE(condition, message)                                   \
    do                                                                         \
    {                                                                          \
        if (!(condition))                                                      \
        {                                                                      \
            ::BsonWalk::contractViolation((message), __FILE__, __LINE__);      \
        }                                                                      \
    } while (0)
