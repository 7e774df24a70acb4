/*-------------------------------------------------------------------------
 *
 * CInPlaceOverwriter.cpp
 *      Same-type, same-length replacement of an element's value bytes.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CInPlaceOverwriter.hpp"

#include "CContract.hpp"
#include "CLogMacros.hpp"
#include "document/CBsonError.hpp"
#include "document/CByteOrder.hpp"
#include "document/CDocumentIterator.hpp"
#include "document/CTypeRegistry.hpp"

namespace BsonWalk
{

/*
 * overwriteCurrentValue
 *		Encode value and copy it over the current value range
 */
std::error_code CInPlaceOverwriter::overwriteCurrentValue(
    CDocumentIterator& iter, const CBsonValue& value)
{
    const CTypeRegistry& registry = CTypeRegistry::instance();

    BSONWALK_REQUIRE(iter.status() == CCursorStatus::Positioned,
                     std::string("overwrite while iterator is ") +
                         cursorStatusName(iter.status()));
    BSONWALK_REQUIRE(iter.isWritable(),
                     "overwrite of '" + iter.currentKey() +
                         "' through an iterator not obtained from "
                         "forWriting()");

    CBsonWireType current = iter.currentType();
    BSONWALK_REQUIRE(value.type() == current,
                     "Cannot overwrite '" + iter.currentKey() +
                         "' of BSON type " + registry.typeName(current) +
                         " with a value of type " +
                         registry.typeName(value.type()));

    if (!registry.fixedWidth(static_cast<uint8_t>(current)))
    {
        debug_log("value of '" + iter.currentKey() + "' has variable width " +
                  registry.typeName(current) + " and cannot be overwritten");
        return make_error_code(CBsonErrc::NotOverwritable);
    }

    auto bytes = encodeFixedWidth(value);
    if (!bytes)
        return make_error_code(CBsonErrc::InvalidValue);

    if (bytes->size() != iter.currentValueRange().length)
        return make_error_code(CBsonErrc::LengthMismatch);

    iter.replaceCurrentValueBytes(*bytes);
    return std::error_code();
}

std::optional<std::vector<uint8_t>>
CInPlaceOverwriter::encodeFixedWidth(const CBsonValue& value)
{
    std::vector<uint8_t> out;

    switch (value.type())
    {
    case CBsonWireType::Double:
        putDoubleLE(out, value.as<double>());
        break;
    case CBsonWireType::ObjectId:
    {
        const auto& oid = value.as<CBsonObjectId>().bytes;
        out.assign(oid.begin(), oid.end());
        break;
    }
    case CBsonWireType::Boolean:
        out.push_back(value.as<bool>() ? 1 : 0);
        break;
    case CBsonWireType::DateTime:
        putUInt64LE(out,
                    static_cast<uint64_t>(value.as<CBsonDateTime>().millis));
        break;
    case CBsonWireType::Int32:
        putUInt32LE(out, static_cast<uint32_t>(value.as<int32_t>()));
        break;
    case CBsonWireType::Timestamp:
    {
        const CBsonTimestamp& ts = value.as<CBsonTimestamp>();
        putUInt32LE(out, ts.increment);
        putUInt32LE(out, ts.timestamp);
        break;
    }
    case CBsonWireType::Int64:
        putUInt64LE(out, static_cast<uint64_t>(value.as<int64_t>()));
        break;
    case CBsonWireType::Decimal128:
    {
        const CBsonDecimal128& dec = value.as<CBsonDecimal128>();
        putUInt64LE(out, dec.low);
        putUInt64LE(out, dec.high);
        break;
    }
    case CBsonWireType::Null:
    case CBsonWireType::Undefined:
    case CBsonWireType::MinKey:
    case CBsonWireType::MaxKey:
        break;
    default:
        return std::nullopt;
    }

    return out;
}

} /* namespace BsonWalk */
