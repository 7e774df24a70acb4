/*-------------------------------------------------------------------------
 *
 * CDocumentBuilder.hpp
 *      libbson backed construction of new BSON documents.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CBsonValue.hpp"
#include "document/CDocument.hpp"

#include <bson/bson.h>
#include <cstdint>
#include <string>
#include <vector>

namespace BsonWalk
{

/**
 * Appends elements to a growing bson_t. Documents produced here own their
 * storage and share nothing with the values appended to them.
 *
 * The first failed append puts the builder in an error state; later
 * appends are refused until clear() or clearErrors().
 */
class CDocumentBuilder
{
  public:
    CDocumentBuilder();
    ~CDocumentBuilder();

    CDocumentBuilder(const CDocumentBuilder&) = delete;
    CDocumentBuilder& operator=(const CDocumentBuilder&) = delete;

    bool append(const std::string& key, const CBsonValue& value);

    bool addString(const std::string& key, const std::string& value);
    bool addInt32(const std::string& key, int32_t value);
    bool addInt64(const std::string& key, int64_t value);
    bool addDouble(const std::string& key, double value);
    bool addBool(const std::string& key, bool value);
    bool addNull(const std::string& key);
    bool addObjectId(const std::string& key, const std::string& objectId);
    bool addDateTime(const std::string& key, int64_t millis);
    bool addDecimal128(const std::string& key, const std::string& decimal);
    bool addDocument(const std::string& key, const CDocument& subdoc);
    bool addArray(const std::string& key, const std::vector<CBsonValue>& values);

    CDocument build() const;
    std::vector<uint8_t> getDocument() const;
    size_t getDocumentSize() const;
    bool isEmpty() const;
    void clear();

    std::string getLastError() const;
    void clearErrors();
    bool hasErrors() const;

  private:
    bool appendTo(bson_t* target, const std::string& key,
                  const CBsonValue& value);
    bool checkBsonHandle() const;
    void setError(const std::string& error) const;

    bson_t* bsonDoc_;

    mutable std::string lastError_;
    mutable bool hasErrors_;
};

} /* namespace BsonWalk */
