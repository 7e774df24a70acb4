/*-------------------------------------------------------------------------
 *
 * CBsonValue.cpp
 *      Decoded BSON values tagged with their wire type.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CBsonValue.hpp"

#include "document/CDocumentIterator.hpp"

#include <bson/bson.h>
#include <cstring>

namespace BsonWalk
{

/*-------------------------------------------------------------------------
 * CBsonObjectId / CBsonDecimal128 text forms, delegated to libbson
 *-------------------------------------------------------------------------*/
std::string CBsonObjectId::toHex() const
{
    bson_oid_t oid;
    char str[25];

    std::memcpy(oid.bytes, bytes.data(), bytes.size());
    bson_oid_to_string(&oid, str);
    return std::string(str);
}

std::optional<CBsonObjectId> CBsonObjectId::fromHex(const std::string& hex)
{
    bson_oid_t oid;
    CBsonObjectId result;

    if (!bson_oid_is_valid(hex.c_str(), hex.length()))
        return std::nullopt;
    bson_oid_init_from_string(&oid, hex.c_str());
    std::memcpy(result.bytes.data(), oid.bytes, result.bytes.size());
    return result;
}

std::string CBsonDecimal128::toString() const
{
    bson_decimal128_t dec;
    char str[BSON_DECIMAL128_STRING];

    dec.low = low;
    dec.high = high;
    bson_decimal128_to_string(&dec, str);
    return std::string(str);
}

std::optional<CBsonDecimal128>
CBsonDecimal128::fromString(const std::string& text)
{
    bson_decimal128_t dec;

    if (!bson_decimal128_from_string(text.c_str(), &dec))
        return std::nullopt;
    return CBsonDecimal128{dec.low, dec.high};
}

/*
 * values
 *		Decode every element of the array in order
 */
std::vector<CBsonValue> CBsonArray::values() const
{
    CDocumentIterator iter(elements);
    return iter.values();
}

size_t CBsonArray::size() const
{
    return elements.count();
}

/*-------------------------------------------------------------------------
 * CBsonValue
 *-------------------------------------------------------------------------*/
CBsonValue::CBsonValue() : type_(CBsonWireType::Invalid), value_(CBsonInvalid{})
{
}

CBsonValue::CBsonValue(double value)
    : type_(CBsonWireType::Double), value_(std::in_place_type<double>, value)
{
}

CBsonValue::CBsonValue(std::string value)
    : type_(CBsonWireType::String),
      value_(std::in_place_type<std::string>, std::move(value))
{
}

CBsonValue::CBsonValue(const char* value)
    : type_(CBsonWireType::String),
      value_(std::in_place_type<std::string>, value ? value : "")
{
}

CBsonValue::CBsonValue(CDocument value)
    : type_(CBsonWireType::Document), value_(std::move(value))
{
}

CBsonValue::CBsonValue(CBsonArray value)
    : type_(CBsonWireType::Array), value_(std::move(value))
{
}

CBsonValue::CBsonValue(CBsonBinary value)
    : type_(CBsonWireType::Binary), value_(std::move(value))
{
}

CBsonValue::CBsonValue(CBsonObjectId value)
    : type_(CBsonWireType::ObjectId), value_(value)
{
}

CBsonValue::CBsonValue(bool value)
    : type_(CBsonWireType::Boolean), value_(std::in_place_type<bool>, value)
{
}

CBsonValue::CBsonValue(CBsonDateTime value)
    : type_(CBsonWireType::DateTime), value_(value)
{
}

CBsonValue::CBsonValue(CBsonRegex value)
    : type_(CBsonWireType::Regex), value_(std::move(value))
{
}

CBsonValue::CBsonValue(CBsonDbPointer value)
    : type_(CBsonWireType::DbPointer), value_(std::move(value))
{
}

CBsonValue::CBsonValue(CBsonCode value)
    : type_(CBsonWireType::Code), value_(std::move(value))
{
}

CBsonValue::CBsonValue(CBsonSymbol value)
    : type_(CBsonWireType::Symbol), value_(std::move(value))
{
}

CBsonValue::CBsonValue(CBsonCodeWithScope value)
    : type_(CBsonWireType::CodeWithScope), value_(std::move(value))
{
}

CBsonValue::CBsonValue(int32_t value)
    : type_(CBsonWireType::Int32), value_(std::in_place_type<int32_t>, value)
{
}

CBsonValue::CBsonValue(CBsonTimestamp value)
    : type_(CBsonWireType::Timestamp), value_(value)
{
}

CBsonValue::CBsonValue(int64_t value)
    : type_(CBsonWireType::Int64), value_(std::in_place_type<int64_t>, value)
{
}

CBsonValue::CBsonValue(CBsonDecimal128 value)
    : type_(CBsonWireType::Decimal128), value_(value)
{
}

CBsonValue::CBsonValue(CBsonMinKey value)
    : type_(CBsonWireType::MinKey), value_(value)
{
}

CBsonValue::CBsonValue(CBsonMaxKey value)
    : type_(CBsonWireType::MaxKey), value_(value)
{
}

CBsonValue::CBsonValue(CBsonNull value)
    : type_(CBsonWireType::Null), value_(value)
{
}

CBsonValue::CBsonValue(CBsonUndefined value)
    : type_(CBsonWireType::Undefined), value_(value)
{
}

CBsonValue::CBsonValue(CBsonInvalid value)
    : type_(CBsonWireType::Invalid), value_(value)
{
}

CBsonWireType CBsonValue::type() const noexcept
{
    return type_;
}

bool CBsonValue::isInvalid() const noexcept
{
    return type_ == CBsonWireType::Invalid;
}

const CBsonValue::Storage& CBsonValue::storage() const noexcept
{
    return value_;
}

bool CBsonValue::operator==(const CBsonValue& other) const
{
    return type_ == other.type_ && value_ == other.value_;
}

} /* namespace BsonWalk */
