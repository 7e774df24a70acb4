/*-------------------------------------------------------------------------
 *
 * CByteCursor.hpp
 *      Bounds-checked element navigation over a BSON document.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CBsonWireType.hpp"
#include "document/CDocument.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace BsonWalk
{

enum class CCursorStatus : uint8_t
{
    BeforeFirst = 0,
    Positioned = 1,
    Exhausted = 2,
    Invalid = 3
};

const char* cursorStatusName(CCursorStatus status) noexcept;

/* Byte range relative to the start of the cursor's document */
struct CValueRange
{
    size_t offset = 0;
    size_t length = 0;
};

/**
 * Walks the elements of one document by offset. Every length read from
 * the buffer is checked against the document end before it is used; any
 * inconsistency moves the cursor to Exhausted with CorruptElement and no
 * further bytes are read.
 */
class CByteCursor
{
  public:
    CByteCursor();

    /* Validate the header; the cursor ends BeforeFirst or Invalid */
    std::error_code init(const CDocument& document,
                         CUnknownTypePolicy policy = CUnknownTypePolicy::Sentinel);

    bool advance();

    CCursorStatus status() const noexcept;
    std::error_code error() const noexcept;
    CUnknownTypePolicy policy() const noexcept;
    const CDocument& document() const noexcept;

    /* Valid only while Positioned */
    std::string_view currentKeyBytes() const;
    uint8_t currentTypeTag() const;
    CValueRange currentValueRange() const;

  private:
    bool fail(std::error_code code, const char* reason);
    std::optional<size_t> findTerminator(size_t from) const;
    std::optional<size_t> measureValue(uint8_t tag, size_t valueOffset) const;
    std::optional<size_t> measureString(size_t valueOffset) const;
    std::optional<size_t> measureDocument(size_t valueOffset) const;
    std::optional<size_t> measureBinary(size_t valueOffset) const;
    std::optional<size_t> measureRegex(size_t valueOffset) const;
    std::optional<size_t> measureCodeWithScope(size_t valueOffset) const;
    std::optional<int32_t> readInt32(size_t at) const;
    size_t remaining(size_t at) const noexcept;

    CDocument document_;
    CUnknownTypePolicy policy_;
    CCursorStatus status_;
    std::error_code error_;

    /* index of the document terminator; elements end at or before it */
    size_t end_;
    size_t next_;

    uint8_t tag_;
    size_t keyOffset_;
    size_t keyLength_;
    CValueRange value_;
    bool unknownPending_;
};

} /* namespace BsonWalk */
