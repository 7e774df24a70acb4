/*-------------------------------------------------------------------------
 *
 * CSubsequenceExtractor.cpp
 *      Copy an ordinal range of elements into a new document.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CSubsequenceExtractor.hpp"

#include "CContract.hpp"
#include "CLogMacros.hpp"
#include "document/CDocumentBuilder.hpp"
#include "document/CDocumentIterator.hpp"

namespace BsonWalk
{

CDocument CSubsequenceExtractor::subsequence(const CDocument& document,
                                             size_t start, size_t end,
                                             CUnknownTypePolicy policy)
{
    BSONWALK_REQUIRE(end >= start, "subsequence end " + std::to_string(end) +
                                       " precedes start " +
                                       std::to_string(start));

    CDocumentIterator iter(document, policy);
    if (!iter.isValid())
        return CDocument();

    /* skipped elements are never decoded */
    for (size_t i = 0; i < start; i++)
    {
        if (!iter.advance())
            return CDocument();
    }

    CDocumentBuilder builder;
    size_t wanted = end - start;

    for (size_t copied = 0; copied < wanted; copied++)
    {
        auto pair = iter.next();
        if (!pair)
            break;

        if (pair->second.isInvalid())
        {
            warn_log("subsequence stops at element '" + pair->first +
                     "' which cannot be decoded");
            break;
        }

        if (!builder.append(pair->first, pair->second))
        {
            error_log("subsequence append failed: " + builder.getLastError());
            break;
        }
    }

    return builder.build();
}

} /* namespace BsonWalk */
