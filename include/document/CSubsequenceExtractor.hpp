/*-------------------------------------------------------------------------
 *
 * CSubsequenceExtractor.hpp
 *      Copy an ordinal range of elements into a new document.
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
#include <limits>

namespace BsonWalk
{

class CSubsequenceExtractor
{
  public:
    /*
     * Elements at positions [start, end) of document, duplicates kept, in
     * a document with storage of its own. end < start is fatal; an
     * unreadable source or a start past the last element gives the empty
     * document.
     */
    static CDocument
    subsequence(const CDocument& document, size_t start = 0,
                size_t end = std::numeric_limits<size_t>::max(),
                CUnknownTypePolicy policy = CUnknownTypePolicy::Sentinel);
};

} /* namespace BsonWalk */
