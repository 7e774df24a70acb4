/*-------------------------------------------------------------------------
 *
 * CBsonValue.hpp
 *      Decoded BSON values tagged with their wire type.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CBsonWireType.hpp"
#include "document/CDocument.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace BsonWalk
{

class CBsonValue;

struct CBsonBinary
{
    uint8_t subtype = 0;
    std::vector<uint8_t> data;

    bool operator==(const CBsonBinary&) const = default;
};

struct CBsonObjectId
{
    std::array<uint8_t, 12> bytes{};

    std::string toHex() const;
    static std::optional<CBsonObjectId> fromHex(const std::string& hex);

    bool operator==(const CBsonObjectId&) const = default;
};

/* Milliseconds since the Unix epoch, UTC */
struct CBsonDateTime
{
    int64_t millis = 0;

    bool operator==(const CBsonDateTime&) const = default;
};

struct CBsonRegex
{
    std::string pattern;
    std::string options;

    bool operator==(const CBsonRegex&) const = default;
};

struct CBsonDbPointer
{
    std::string collection;
    CBsonObjectId id;

    bool operator==(const CBsonDbPointer&) const = default;
};

struct CBsonCode
{
    std::string code;

    bool operator==(const CBsonCode&) const = default;
};

struct CBsonSymbol
{
    std::string symbol;

    bool operator==(const CBsonSymbol&) const = default;
};

struct CBsonCodeWithScope
{
    std::string code;
    CDocument scope;

    bool operator==(const CBsonCodeWithScope&) const = default;
};

/* Wire order: increment in the low word, seconds in the high word */
struct CBsonTimestamp
{
    uint32_t timestamp = 0;
    uint32_t increment = 0;

    bool operator==(const CBsonTimestamp&) const = default;
};

/* IEEE 754-2008 decimal128, BID encoding, kept as its two halves */
struct CBsonDecimal128
{
    uint64_t low = 0;
    uint64_t high = 0;

    std::string toString() const;
    static std::optional<CBsonDecimal128> fromString(const std::string& text);

    bool operator==(const CBsonDecimal128&) const = default;
};

struct CBsonMinKey
{
    bool operator==(const CBsonMinKey&) const = default;
};

struct CBsonMaxKey
{
    bool operator==(const CBsonMaxKey&) const = default;
};

struct CBsonNull
{
    bool operator==(const CBsonNull&) const = default;
};

struct CBsonUndefined
{
    bool operator==(const CBsonUndefined&) const = default;
};

/* Sentinel for an element whose tag is not recognized */
struct CBsonInvalid
{
    uint8_t tag = 0;

    bool operator==(const CBsonInvalid&) const = default;
};

/**
 * An array is a document keyed "0", "1", ... ; it shares the storage of
 * the document it was decoded from.
 */
struct CBsonArray
{
    CDocument elements;

    std::vector<CBsonValue> values() const;
    size_t size() const;

    bool operator==(const CBsonArray&) const = default;
};

class CBsonValue
{
  public:
    using Storage =
        std::variant<CBsonInvalid, double, std::string, CDocument, CBsonArray,
                     CBsonBinary, CBsonObjectId, bool, CBsonDateTime,
                     CBsonRegex, CBsonDbPointer, CBsonCode, CBsonSymbol,
                     CBsonCodeWithScope, int32_t, CBsonTimestamp, int64_t,
                     CBsonDecimal128, CBsonMinKey, CBsonMaxKey, CBsonNull,
                     CBsonUndefined>;

    CBsonValue();
    CBsonValue(double value);
    CBsonValue(std::string value);
    CBsonValue(const char* value);
    CBsonValue(CDocument value);
    CBsonValue(CBsonArray value);
    CBsonValue(CBsonBinary value);
    CBsonValue(CBsonObjectId value);
    CBsonValue(bool value);
    CBsonValue(CBsonDateTime value);
    CBsonValue(CBsonRegex value);
    CBsonValue(CBsonDbPointer value);
    CBsonValue(CBsonCode value);
    CBsonValue(CBsonSymbol value);
    CBsonValue(CBsonCodeWithScope value);
    CBsonValue(int32_t value);
    CBsonValue(CBsonTimestamp value);
    CBsonValue(int64_t value);
    CBsonValue(CBsonDecimal128 value);
    CBsonValue(CBsonMinKey value);
    CBsonValue(CBsonMaxKey value);
    CBsonValue(CBsonNull value);
    CBsonValue(CBsonUndefined value);
    CBsonValue(CBsonInvalid value);

    CBsonWireType type() const noexcept;
    bool isInvalid() const noexcept;

    template <typename T> bool is() const noexcept
    {
        return std::holds_alternative<T>(value_);
    }

    /* Throws std::bad_variant_access when the value holds another type */
    template <typename T> const T& as() const
    {
        return std::get<T>(value_);
    }

    const Storage& storage() const noexcept;

    bool operator==(const CBsonValue& other) const;

  private:
    CBsonWireType type_;
    Storage value_;
};

} /* namespace BsonWalk */
