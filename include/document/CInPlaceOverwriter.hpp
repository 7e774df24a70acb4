/*-------------------------------------------------------------------------
 *
 * CInPlaceOverwriter.hpp
 *      Same-type, same-length replacement of an element's value bytes.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CBsonValue.hpp"

#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace BsonWalk
{

class CDocumentIterator;

class CInPlaceOverwriter
{
  public:
    /*
     * Replace the value under a writable, positioned iterator. The new
     * value must carry the element's wire type (fatal otherwise).
     * Variable width types return NotOverwritable and leave the bytes
     * untouched.
     */
    static std::error_code overwriteCurrentValue(CDocumentIterator& iter,
                                                 const CBsonValue& value);

    /* Little-endian wire encoding of a fixed width value */
    static std::optional<std::vector<uint8_t>>
    encodeFixedWidth(const CBsonValue& value);
};

} /* namespace BsonWalk */
