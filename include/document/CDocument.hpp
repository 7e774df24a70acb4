/*-------------------------------------------------------------------------
 *
 * CDocument.hpp
 *      Shared BSON byte storage and document views over it.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace BsonWalk
{

/**
 * Owned byte buffer holding one or more BSON documents.
 * Never resized after construction.
 */
class CDocumentStorage
{
  public:
    explicit CDocumentStorage(std::vector<uint8_t> bytes);

    const uint8_t* data() const noexcept;
    uint8_t* mutableData() noexcept;
    size_t size() const noexcept;

  private:
    std::vector<uint8_t> bytes_;
};

/**
 * A document is a view of [offset, offset + length) inside a shared
 * storage. Top level documents span their whole storage; embedded
 * documents and arrays decoded from a parent share the parent's storage.
 *
 * The bytes are not validated here. Iterators validate the framing when
 * they are constructed and while they advance.
 */
class CDocument
{
  public:
    /* Empty document: length 5, no elements */
    CDocument();
    explicit CDocument(std::vector<uint8_t> bytes);
    CDocument(const uint8_t* data, size_t size);

    /* View of a sub-range of this document, offsets relative to data() */
    CDocument view(size_t offset, size_t length) const;

    const uint8_t* data() const noexcept;
    size_t size() const noexcept;
    size_t offset() const noexcept;
    const std::shared_ptr<CDocumentStorage>& storage() const noexcept;
    std::vector<uint8_t> bytes() const;

    /* Number of elements; 0 when the document cannot be iterated */
    size_t count() const;
    bool isEmpty() const;

    /*
     * Give this document storage that nobody else references. Copies the
     * viewed bytes when the storage is shared or larger than the view.
     * Returns true when a copy was made.
     */
    bool ensureUniqueStorage();

    /* Extended JSON rendering through libbson; empty on invalid bytes */
    std::string toJson(bool relaxed = false) const;

    bool operator==(const CDocument& other) const;

  private:
    CDocument(std::shared_ptr<CDocumentStorage> storage, size_t offset,
              size_t length);

    std::shared_ptr<CDocumentStorage> storage_;
    size_t offset_;
    size_t length_;
};

} /* namespace BsonWalk */
