/*-------------------------------------------------------------------------
 *
 * CBsonWireType.hpp
 *      BSON wire type tags recognized by BsonWalk.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstdint>

namespace BsonWalk
{

/**
 * Wire type tags, matching the type byte that prefixes each element.
 * Invalid shares the end-of-document tag and marks unrecognized types.
 */
enum class CBsonWireType : uint8_t
{
    Invalid = 0x00,
    Double = 0x01,
    String = 0x02,
    Document = 0x03,
    Array = 0x04,
    Binary = 0x05,
    Undefined = 0x06,
    ObjectId = 0x07,
    Boolean = 0x08,
    DateTime = 0x09,
    Null = 0x0A,
    Regex = 0x0B,
    DbPointer = 0x0C,
    Code = 0x0D,
    Symbol = 0x0E,
    CodeWithScope = 0x0F,
    Int32 = 0x10,
    Timestamp = 0x11,
    Int64 = 0x12,
    Decimal128 = 0x13,
    MaxKey = 0x7F,
    MinKey = 0xFF
};

/* Binary subtype whose payload repeats its length in a nested int32 */
constexpr uint8_t kBinarySubtypeBinaryOld = 0x02;

/**
 * What a traversal does when it meets a tag outside the recognized set.
 *
 * Sentinel: the element is surfaced with an Invalid value and the traversal
 * stops at the following advance, since the element's length is unknown.
 * Fail: the advance onto the element fails with UnknownType.
 */
enum class CUnknownTypePolicy : uint8_t
{
    Sentinel = 0,
    Fail = 1
};

} /* namespace BsonWalk */
