/*-------------------------------------------------------------------------
 *
 * CDocument.cpp
 *      Shared BSON byte storage and document views over it.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CDocument.hpp"

#include "CContract.hpp"
#include "CLogMacros.hpp"
#include "document/CDocumentIterator.hpp"

#include <algorithm>
#include <bson/bson.h>
#include <cstring>

namespace BsonWalk
{

namespace
{

/* int32 length 5 followed by the terminator */
const std::vector<uint8_t> kEmptyDocument = {0x05, 0x00, 0x00, 0x00, 0x00};

} /* anonymous namespace */

CDocumentStorage::CDocumentStorage(std::vector<uint8_t> bytes)
    : bytes_(std::move(bytes))
{
}

const uint8_t* CDocumentStorage::data() const noexcept
{
    return bytes_.data();
}

uint8_t* CDocumentStorage::mutableData() noexcept
{
    return bytes_.data();
}

size_t CDocumentStorage::size() const noexcept
{
    return bytes_.size();
}

CDocument::CDocument() : CDocument(kEmptyDocument)
{
}

CDocument::CDocument(std::vector<uint8_t> bytes)
    : storage_(std::make_shared<CDocumentStorage>(std::move(bytes))),
      offset_(0), length_(storage_->size())
{
}

CDocument::CDocument(const uint8_t* data, size_t size)
    : CDocument(data ? std::vector<uint8_t>(data, data + size)
                     : std::vector<uint8_t>())
{
}

CDocument::CDocument(std::shared_ptr<CDocumentStorage> storage, size_t offset,
                     size_t length)
    : storage_(std::move(storage)), offset_(offset), length_(length)
{
}

/*
 * view
 *		Share this document's storage for an embedded document
 */
CDocument CDocument::view(size_t offset, size_t length) const
{
    BSONWALK_REQUIRE(offset <= length_ && length <= length_ - offset,
                     "document view out of range");
    return CDocument(storage_, offset_ + offset, length);
}

const uint8_t* CDocument::data() const noexcept
{
    return storage_->data() + offset_;
}

size_t CDocument::size() const noexcept
{
    return length_;
}

size_t CDocument::offset() const noexcept
{
    return offset_;
}

const std::shared_ptr<CDocumentStorage>& CDocument::storage() const noexcept
{
    return storage_;
}

std::vector<uint8_t> CDocument::bytes() const
{
    return std::vector<uint8_t>(data(), data() + length_);
}

size_t CDocument::count() const
{
    CDocumentIterator iter(*this);
    size_t elements = 0;

    while (iter.advance())
        elements++;
    return elements;
}

bool CDocument::isEmpty() const
{
    CDocumentIterator iter(*this);
    return !iter.advance();
}

/*
 * ensureUniqueStorage
 *		Copy-on-write step taken before any in-place mutation
 */
bool CDocument::ensureUniqueStorage()
{
    if (storage_.use_count() == 1 && offset_ == 0 &&
        length_ == storage_->size())
        return false;

    storage_ = std::make_shared<CDocumentStorage>(bytes());
    offset_ = 0;
    debug_log("document storage copied for exclusive write access (" +
              std::to_string(length_) + " bytes)");
    return true;
}

/*
 * toJson
 *		Render canonical or relaxed extended JSON
 */
std::string CDocument::toJson(bool relaxed) const
{
    bson_t doc;
    size_t len = 0;
    char* json;

    if (!bson_init_static(&doc, data(), length_))
        return std::string();

    if (relaxed)
        json = bson_as_relaxed_extended_json(&doc, &len);
    else
        json = bson_as_canonical_extended_json(&doc, &len);
    if (!json)
        return std::string();

    std::string s(json, len);
    bson_free(json);
    return s;
}

bool CDocument::operator==(const CDocument& other) const
{
    return length_ == other.length_ &&
           std::equal(data(), data() + length_, other.data());
}

} /* namespace BsonWalk */
