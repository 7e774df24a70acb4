/*-------------------------------------------------------------------------
 *
 * CBsonError.cpp
 *      Error category for the document traversal core.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CBsonError.hpp"

namespace BsonWalk
{

namespace
{

class CBsonCategory : public std::error_category
{
  public:
    const char* name() const noexcept override
    {
        return "bsonwalk";
    }

    std::string message(int value) const override
    {
        switch (static_cast<CBsonErrc>(value))
        {
        case CBsonErrc::Success:
            return "success";
        case CBsonErrc::MalformedHeader:
            return "malformed document header";
        case CBsonErrc::CorruptElement:
            return "corrupt element";
        case CBsonErrc::KeyNotFound:
            return "key not found";
        case CBsonErrc::UnknownType:
            return "unknown wire type";
        case CBsonErrc::NotOverwritable:
            return "value is not fixed width";
        case CBsonErrc::LengthMismatch:
            return "encoded length differs from current value";
        case CBsonErrc::InvalidValue:
            return "value cannot be encoded";
        default:
            return "unknown error";
        }
    }
};

} /* anonymous namespace */

const std::error_category& bsonCategory() noexcept
{
    static const CBsonCategory category;
    return category;
}

std::error_code make_error_code(CBsonErrc errc) noexcept
{
    return std::error_code(static_cast<int>(errc), bsonCategory());
}

} /* namespace BsonWalk */
