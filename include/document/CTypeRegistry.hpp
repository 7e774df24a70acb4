/*-------------------------------------------------------------------------
 *
 * CTypeRegistry.hpp
 *      Process-wide table from wire type tag to decoder and width.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CBsonValue.hpp"
#include "document/CBsonWireType.hpp"
#include "document/CDocument.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace BsonWalk
{

/*
 * Decodes the value payload at [offset, offset + length) of owner.
 * Composite results are views into owner's storage.
 */
using CValueDecoder = CBsonValue (*)(const CDocument& owner, size_t offset,
                                     size_t length);

/* Sentinel width for types whose payload carries its own length */
inline constexpr int kVariableWidth = -1;

struct CTypeEntry
{
    CBsonWireType type = CBsonWireType::Invalid;
    const char* name = "invalid";
    CValueDecoder decoder = nullptr;
    int fixedWidth = kVariableWidth;
    bool recognized = false;
};

/**
 * Immutable registry built once on first use. Tags outside the recognized
 * set map to an entry whose decoder yields the CBsonInvalid sentinel.
 */
class CTypeRegistry
{
  public:
    static const CTypeRegistry& instance();

    CTypeRegistry(const CTypeRegistry&) = delete;
    CTypeRegistry& operator=(const CTypeRegistry&) = delete;

    CBsonValue decode(uint8_t tag, const CDocument& owner, size_t offset,
                      size_t length) const;

    const CTypeEntry& entry(uint8_t tag) const noexcept;
    bool isRecognized(uint8_t tag) const noexcept;
    std::optional<size_t> fixedWidth(uint8_t tag) const noexcept;
    const char* typeName(uint8_t tag) const noexcept;
    const char* typeName(CBsonWireType type) const noexcept;

  private:
    CTypeRegistry();

    void add(CBsonWireType type, const char* name, CValueDecoder decoder,
             int fixedWidth);

    std::array<CTypeEntry, 256> entries_;
};

} /* namespace BsonWalk */
