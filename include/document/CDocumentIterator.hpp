/*-------------------------------------------------------------------------
 *
 * CDocumentIterator.hpp
 *      Forward-only traversal of the elements of a BSON document.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CBsonValue.hpp"
#include "document/CBsonWireType.hpp"
#include "document/CByteCursor.hpp"
#include "document/CDocument.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace BsonWalk
{

using CKeyValuePair = std::pair<std::string, CBsonValue>;

/**
 * Stateful, single-pass iterator over one document.
 *
 * BeforeFirst -> Positioned -> ... -> Exhausted. Invalid is terminal and
 * only reached from construction: a malformed header, or a seek
 * constructor whose key is not found. Once Exhausted the iterator never
 * returns to Positioned.
 *
 * Iterators share the document's storage. Overwrites need a writable
 * iterator from forWriting(), which gives the document unique storage
 * first.
 */
class CDocumentIterator
{
  public:
    explicit CDocumentIterator(
        const CDocument& document,
        CUnknownTypePolicy policy = CUnknownTypePolicy::Sentinel);

    /* Positioned on the first element named key, otherwise Invalid */
    CDocumentIterator(const CDocument& document, const std::string& key,
                      CUnknownTypePolicy policy = CUnknownTypePolicy::Sentinel);

    static CDocumentIterator
    forWriting(CDocument& document,
               CUnknownTypePolicy policy = CUnknownTypePolicy::Sentinel);

    CCursorStatus status() const noexcept;
    bool isValid() const noexcept;
    std::error_code lastError() const noexcept;
    bool isWritable() const noexcept;
    CUnknownTypePolicy unknownTypePolicy() const noexcept;

    bool advance();

    /*
     * Scan forward, starting after the current element, for key. Keys
     * already passed are never found again; on a miss the iterator is
     * Exhausted.
     */
    bool move(const std::string& key);

    /* Require Positioned */
    std::string currentKey() const;
    CBsonValue currentValue() const;
    CBsonWireType currentType() const;
    CValueRange currentValueRange() const;

    /*
     * Decode the current value without aborting on a payload the decoder
     * rejects. out receives the Invalid sentinel in that case.
     */
    std::error_code safeCurrentValue(CBsonValue& out) const;

    /* Lazy pull; empty once the iterator is exhausted */
    std::optional<CKeyValuePair> next();

    /* Drain the remaining elements */
    std::vector<std::string> keys();
    std::vector<CBsonValue> values();

    std::error_code overwriteCurrentValue(const CBsonValue& value);

    /* Raw write of the current value range; lengths must match */
    void replaceCurrentValueBytes(const std::vector<uint8_t>& bytes);

    const CDocument& document() const noexcept;

  private:
    CByteCursor cursor_;
    bool invalid_;
    bool writable_;
    std::error_code error_;
};

} /* namespace BsonWalk */
