/*-------------------------------------------------------------------------
 *
 * CTypeRegistry.cpp
 *      Wire type decoders and the process-wide registry that maps each
 *      tag to its decoder.
 *
 * The decoders trust the byte cursor for the element's outer bounds and
 * only ever read inside [offset, offset + length). A payload whose inner
 * lengths disagree with that range decodes to the Invalid sentinel.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CTypeRegistry.hpp"

#include "CContract.hpp"
#include "document/CByteOrder.hpp"

#include <cstring>

namespace BsonWalk
{

namespace
{

/*
 * readCString
 *		Read a NUL-terminated string starting at p, not reaching past limit
 */
bool readCString(const uint8_t* p, size_t limit, std::string& out,
                 size_t& consumed)
{
    const void* nul = std::memchr(p, 0, limit);
    if (!nul)
        return false;
    size_t len = static_cast<const uint8_t*>(nul) - p;
    out.assign(reinterpret_cast<const char*>(p), len);
    consumed = len + 1;
    return true;
}

/*
 * readLengthPrefixedString
 *		int32 length (including the NUL) followed by the bytes and a NUL
 */
bool readLengthPrefixedString(const uint8_t* p, size_t limit, std::string& out,
                              size_t& consumed)
{
    if (limit < 4)
        return false;
    int32_t len = readInt32LE(p);
    if (len < 1 || static_cast<size_t>(len) > limit - 4 || p[4 + len - 1] != 0)
        return false;
    out.assign(reinterpret_cast<const char*>(p + 4),
               static_cast<size_t>(len) - 1);
    consumed = 4 + static_cast<size_t>(len);
    return true;
}

CBsonValue decodeDouble(const CDocument& owner, size_t offset, size_t length)
{
    if (length < 8)
        return CBsonInvalid{};
    return readDoubleLE(owner.data() + offset);
}

CBsonValue decodeString(const CDocument& owner, size_t offset, size_t length)
{
    std::string value;
    size_t consumed;

    if (!readLengthPrefixedString(owner.data() + offset, length, value,
                                  consumed))
        return CBsonInvalid{};
    return value;
}

CBsonValue decodeDocument(const CDocument& owner, size_t offset, size_t length)
{
    return owner.view(offset, length);
}

CBsonValue decodeArray(const CDocument& owner, size_t offset, size_t length)
{
    return CBsonArray{owner.view(offset, length)};
}

CBsonValue decodeBinary(const CDocument& owner, size_t offset, size_t length)
{
    const uint8_t* p = owner.data() + offset;
    CBsonBinary binary;

    if (length < 5)
        return CBsonInvalid{};
    int32_t len = readInt32LE(p);
    if (len < 0 || static_cast<size_t>(len) > length - 5)
        return CBsonInvalid{};

    binary.subtype = p[4];
    const uint8_t* payload = p + 5;
    size_t payloadLength = static_cast<size_t>(len);

    if (binary.subtype == kBinarySubtypeBinaryOld)
    {
        if (payloadLength < 4)
            return CBsonInvalid{};
        int32_t inner = readInt32LE(payload);
        if (inner < 0 || static_cast<size_t>(inner) != payloadLength - 4)
            return CBsonInvalid{};
        payload += 4;
        payloadLength -= 4;
    }

    binary.data.assign(payload, payload + payloadLength);
    return binary;
}

CBsonValue decodeUndefined(const CDocument&, size_t, size_t)
{
    return CBsonUndefined{};
}

CBsonValue decodeObjectId(const CDocument& owner, size_t offset, size_t length)
{
    CBsonObjectId oid;

    if (length < oid.bytes.size())
        return CBsonInvalid{};
    std::memcpy(oid.bytes.data(), owner.data() + offset, oid.bytes.size());
    return oid;
}

CBsonValue decodeBoolean(const CDocument& owner, size_t offset, size_t length)
{
    if (length < 1)
        return CBsonInvalid{};
    return owner.data()[offset] != 0;
}

CBsonValue decodeDateTime(const CDocument& owner, size_t offset, size_t length)
{
    if (length < 8)
        return CBsonInvalid{};
    return CBsonDateTime{readInt64LE(owner.data() + offset)};
}

CBsonValue decodeNull(const CDocument&, size_t, size_t)
{
    return CBsonNull{};
}

CBsonValue decodeRegex(const CDocument& owner, size_t offset, size_t length)
{
    const uint8_t* p = owner.data() + offset;
    CBsonRegex regex;
    size_t patternBytes;
    size_t optionBytes;

    if (!readCString(p, length, regex.pattern, patternBytes))
        return CBsonInvalid{};
    if (!readCString(p + patternBytes, length - patternBytes, regex.options,
                     optionBytes))
        return CBsonInvalid{};
    return regex;
}

CBsonValue decodeDbPointer(const CDocument& owner, size_t offset, size_t length)
{
    const uint8_t* p = owner.data() + offset;
    CBsonDbPointer pointer;
    size_t consumed;

    if (!readLengthPrefixedString(p, length, pointer.collection, consumed))
        return CBsonInvalid{};
    if (length - consumed < pointer.id.bytes.size())
        return CBsonInvalid{};
    std::memcpy(pointer.id.bytes.data(), p + consumed, pointer.id.bytes.size());
    return pointer;
}

CBsonValue decodeCode(const CDocument& owner, size_t offset, size_t length)
{
    CBsonCode code;
    size_t consumed;

    if (!readLengthPrefixedString(owner.data() + offset, length, code.code,
                                  consumed))
        return CBsonInvalid{};
    return code;
}

CBsonValue decodeSymbol(const CDocument& owner, size_t offset, size_t length)
{
    CBsonSymbol symbol;
    size_t consumed;

    if (!readLengthPrefixedString(owner.data() + offset, length, symbol.symbol,
                                  consumed))
        return CBsonInvalid{};
    return symbol;
}

/*
 * decodeCodeWithScope
 *		int32 total length, length-prefixed code string, scope document
 */
CBsonValue decodeCodeWithScope(const CDocument& owner, size_t offset,
                               size_t length)
{
    const uint8_t* p = owner.data() + offset;
    std::string code;
    size_t consumed;

    if (length < 4)
        return CBsonInvalid{};
    if (!readLengthPrefixedString(p + 4, length - 4, code, consumed))
        return CBsonInvalid{};

    size_t scopeOffset = 4 + consumed;
    if (length - scopeOffset < 5)
        return CBsonInvalid{};
    return CBsonCodeWithScope{code,
                              owner.view(offset + scopeOffset,
                                         length - scopeOffset)};
}

CBsonValue decodeInt32(const CDocument& owner, size_t offset, size_t length)
{
    if (length < 4)
        return CBsonInvalid{};
    return readInt32LE(owner.data() + offset);
}

CBsonValue decodeTimestamp(const CDocument& owner, size_t offset, size_t length)
{
    const uint8_t* p = owner.data() + offset;

    if (length < 8)
        return CBsonInvalid{};
    return CBsonTimestamp{readUInt32LE(p + 4), readUInt32LE(p)};
}

CBsonValue decodeInt64(const CDocument& owner, size_t offset, size_t length)
{
    if (length < 8)
        return CBsonInvalid{};
    return readInt64LE(owner.data() + offset);
}

CBsonValue decodeDecimal128(const CDocument& owner, size_t offset,
                            size_t length)
{
    const uint8_t* p = owner.data() + offset;

    if (length < 16)
        return CBsonInvalid{};
    return CBsonDecimal128{readUInt64LE(p), readUInt64LE(p + 8)};
}

CBsonValue decodeMinKey(const CDocument&, size_t, size_t)
{
    return CBsonMinKey{};
}

CBsonValue decodeMaxKey(const CDocument&, size_t, size_t)
{
    return CBsonMaxKey{};
}

} /* anonymous namespace */

/*
 * instance
 *		The single registry, built on first use
 */
const CTypeRegistry& CTypeRegistry::instance()
{
    static const CTypeRegistry registry;
    return registry;
}

CTypeRegistry::CTypeRegistry()
{
    add(CBsonWireType::Double, "double", decodeDouble, 8);
    add(CBsonWireType::String, "string", decodeString, kVariableWidth);
    add(CBsonWireType::Document, "document", decodeDocument, kVariableWidth);
    add(CBsonWireType::Array, "array", decodeArray, kVariableWidth);
    add(CBsonWireType::Binary, "binary", decodeBinary, kVariableWidth);
    add(CBsonWireType::Undefined, "undefined", decodeUndefined, 0);
    add(CBsonWireType::ObjectId, "objectId", decodeObjectId, 12);
    add(CBsonWireType::Boolean, "bool", decodeBoolean, 1);
    add(CBsonWireType::DateTime, "date", decodeDateTime, 8);
    add(CBsonWireType::Null, "null", decodeNull, 0);
    add(CBsonWireType::Regex, "regex", decodeRegex, kVariableWidth);
    add(CBsonWireType::DbPointer, "dbPointer", decodeDbPointer, kVariableWidth);
    add(CBsonWireType::Code, "javascript", decodeCode, kVariableWidth);
    add(CBsonWireType::Symbol, "symbol", decodeSymbol, kVariableWidth);
    add(CBsonWireType::CodeWithScope, "javascriptWithScope",
        decodeCodeWithScope, kVariableWidth);
    add(CBsonWireType::Int32, "int", decodeInt32, 4);
    add(CBsonWireType::Timestamp, "timestamp", decodeTimestamp, 8);
    add(CBsonWireType::Int64, "long", decodeInt64, 8);
    add(CBsonWireType::Decimal128, "decimal", decodeDecimal128, 16);
    add(CBsonWireType::MinKey, "minKey", decodeMinKey, 0);
    add(CBsonWireType::MaxKey, "maxKey", decodeMaxKey, 0);
}

void CTypeRegistry::add(CBsonWireType type, const char* name,
                        CValueDecoder decoder, int fixedWidth)
{
    CTypeEntry& e = entries_[static_cast<uint8_t>(type)];

    e.type = type;
    e.name = name;
    e.decoder = decoder;
    e.fixedWidth = fixedWidth;
    e.recognized = true;
}

/*
 * decode
 *		Dispatch a value payload to the decoder registered for its tag
 */
CBsonValue CTypeRegistry::decode(uint8_t tag, const CDocument& owner,
                                 size_t offset, size_t length) const
{
    BSONWALK_REQUIRE(offset <= owner.size() && length <= owner.size() - offset,
                     "value range outside document");

    const CTypeEntry& e = entries_[tag];
    if (!e.recognized)
        return CBsonInvalid{tag};

    CBsonValue value = e.decoder(owner, offset, length);
    if (value.isInvalid())
        return CBsonInvalid{tag};
    return value;
}

const CTypeEntry& CTypeRegistry::entry(uint8_t tag) const noexcept
{
    return entries_[tag];
}

bool CTypeRegistry::isRecognized(uint8_t tag) const noexcept
{
    return entries_[tag].recognized;
}

std::optional<size_t> CTypeRegistry::fixedWidth(uint8_t tag) const noexcept
{
    const CTypeEntry& e = entries_[tag];
    if (!e.recognized || e.fixedWidth == kVariableWidth)
        return std::nullopt;
    return static_cast<size_t>(e.fixedWidth);
}

const char* CTypeRegistry::typeName(uint8_t tag) const noexcept
{
    return entries_[tag].name;
}

const char* CTypeRegistry::typeName(CBsonWireType type) const noexcept
{
    return typeName(static_cast<uint8_t>(type));
}

} /* namespace BsonWalk */
