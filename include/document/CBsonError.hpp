/*-------------------------------------------------------------------------
 *
 * CBsonError.hpp
 *      Recoverable error codes reported by the document traversal core.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <string>
#include <system_error>

namespace BsonWalk
{

enum class CBsonErrc
{
    Success = 0,
    MalformedHeader = 1,  /* length prefix or terminator inconsistent */
    CorruptElement = 2,   /* truncated key or value payload */
    KeyNotFound = 3,
    UnknownType = 4,
    NotOverwritable = 5,  /* variable width value */
    LengthMismatch = 6,
    InvalidValue = 7      /* value cannot be encoded */
};

const std::error_category& bsonCategory() noexcept;

std::error_code make_error_code(CBsonErrc errc) noexcept;

} /* namespace BsonWalk */

namespace std
{

template <>
struct is_error_code_enum<BsonWalk::CBsonErrc> : true_type
{
};

} /* namespace std */
