/*-------------------------------------------------------------------------
 *
 * CDocumentBuilder.cpp
 *      libbson backed construction of new BSON documents.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CDocumentBuilder.hpp"

#include "CLogMacros.hpp"
#include "document/CByteOrder.hpp"
#include "document/CTypeRegistry.hpp"

#include <cstring>

namespace BsonWalk
{

namespace
{

/* Read-only bson_t over the bytes of a document view */
bool staticBson(const CDocument& doc, bson_t* out)
{
    return bson_init_static(out, doc.data(), doc.size());
}

void toOid(const CBsonObjectId& id, bson_oid_t* out)
{
    std::memcpy(out->bytes, id.bytes.data(), id.bytes.size());
}

/* <len:i32><bytes><0x00> with len counting the NUL */
void putString(std::vector<uint8_t>& out, const std::string& s)
{
    putUInt32LE(out, static_cast<uint32_t>(s.size() + 1));
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(0);
}

/*
 * appendElement
 *		Frame one element from its encoded value and concatenate it onto
 *		target. Used where the bson_append_* call would rewrite the value:
 *		NUL-terminated code and collection arguments, and code with an
 *		empty scope being emitted as plain code.
 */
bool appendElement(bson_t* target, CBsonWireType type, const std::string& key,
                   const std::vector<uint8_t>& value)
{
    if (key.find('\0') != std::string::npos)
        return false;

    std::vector<uint8_t> frame;
    frame.reserve(4 + 1 + key.size() + 1 + value.size() + 1);
    putUInt32LE(frame, static_cast<uint32_t>(4 + 1 + key.size() + 1 +
                                             value.size() + 1));
    frame.push_back(static_cast<uint8_t>(type));
    frame.insert(frame.end(), key.begin(), key.end());
    frame.push_back(0);
    frame.insert(frame.end(), value.begin(), value.end());
    frame.push_back(0);

    bson_t element;
    if (!bson_init_static(&element, frame.data(), frame.size()))
        return false;
    return bson_concat(target, &element);
}

} /* anonymous namespace */

CDocumentBuilder::CDocumentBuilder()
    : bsonDoc_(nullptr), lastError_(), hasErrors_(false)
{
    bsonDoc_ = bson_new();
    if (!bsonDoc_)
        setError("Failed to create BSON document");
}

CDocumentBuilder::~CDocumentBuilder()
{
    if (bsonDoc_)
        bson_destroy(bsonDoc_);
}

bool CDocumentBuilder::append(const std::string& key, const CBsonValue& value)
{
    if (!checkBsonHandle())
        return false;
    return appendTo(bsonDoc_, key, value);
}

/*
 * appendTo
 *		Map a decoded value onto the matching bson_append_* call
 */
bool CDocumentBuilder::appendTo(bson_t* target, const std::string& key,
                                const CBsonValue& value)
{
    const char* k = key.c_str();
    int kl = static_cast<int>(key.size());
    bool ok = false;

    switch (value.type())
    {
    case CBsonWireType::Double:
        ok = bson_append_double(target, k, kl, value.as<double>());
        break;
    case CBsonWireType::String:
    {
        const std::string& s = value.as<std::string>();
        ok = bson_append_utf8(target, k, kl, s.c_str(),
                              static_cast<int>(s.size()));
        break;
    }
    case CBsonWireType::Document:
    {
        bson_t sub;
        ok = staticBson(value.as<CDocument>(), &sub) &&
             bson_append_document(target, k, kl, &sub);
        break;
    }
    case CBsonWireType::Array:
    {
        bson_t sub;
        ok = staticBson(value.as<CBsonArray>().elements, &sub) &&
             bson_append_array(target, k, kl, &sub);
        break;
    }
    case CBsonWireType::Binary:
    {
        const CBsonBinary& bin = value.as<CBsonBinary>();
        ok = bson_append_binary(target, k, kl,
                                static_cast<bson_subtype_t>(bin.subtype),
                                bin.data.data(),
                                static_cast<uint32_t>(bin.data.size()));
        break;
    }
    case CBsonWireType::Undefined:
        ok = bson_append_undefined(target, k, kl);
        break;
    case CBsonWireType::ObjectId:
    {
        bson_oid_t oid;
        toOid(value.as<CBsonObjectId>(), &oid);
        ok = bson_append_oid(target, k, kl, &oid);
        break;
    }
    case CBsonWireType::Boolean:
        ok = bson_append_bool(target, k, kl, value.as<bool>());
        break;
    case CBsonWireType::DateTime:
        ok = bson_append_date_time(target, k, kl,
                                   value.as<CBsonDateTime>().millis);
        break;
    case CBsonWireType::Null:
        ok = bson_append_null(target, k, kl);
        break;
    case CBsonWireType::Regex:
    {
        const CBsonRegex& re = value.as<CBsonRegex>();
        ok = bson_append_regex(target, k, kl, re.pattern.c_str(),
                               re.options.c_str());
        break;
    }
    case CBsonWireType::DbPointer:
    {
        const CBsonDbPointer& ptr = value.as<CBsonDbPointer>();
        std::vector<uint8_t> bytes;
        putString(bytes, ptr.collection);
        bytes.insert(bytes.end(), ptr.id.bytes.begin(), ptr.id.bytes.end());
        ok = appendElement(target, CBsonWireType::DbPointer, key, bytes);
        break;
    }
    case CBsonWireType::Code:
    {
        std::vector<uint8_t> bytes;
        putString(bytes, value.as<CBsonCode>().code);
        ok = appendElement(target, CBsonWireType::Code, key, bytes);
        break;
    }
    case CBsonWireType::Symbol:
    {
        const std::string& sym = value.as<CBsonSymbol>().symbol;
        ok = bson_append_symbol(target, k, kl, sym.c_str(),
                                static_cast<int>(sym.size()));
        break;
    }
    case CBsonWireType::CodeWithScope:
    {
        /* <total:i32><code:string><scope:document> */
        const CBsonCodeWithScope& cws = value.as<CBsonCodeWithScope>();
        std::vector<uint8_t> bytes;
        putUInt32LE(bytes, static_cast<uint32_t>(4 + 4 + cws.code.size() + 1 +
                                                 cws.scope.size()));
        putString(bytes, cws.code);
        bytes.insert(bytes.end(), cws.scope.data(),
                     cws.scope.data() + cws.scope.size());
        ok = appendElement(target, CBsonWireType::CodeWithScope, key, bytes);
        break;
    }
    case CBsonWireType::Int32:
        ok = bson_append_int32(target, k, kl, value.as<int32_t>());
        break;
    case CBsonWireType::Timestamp:
    {
        const CBsonTimestamp& ts = value.as<CBsonTimestamp>();
        ok = bson_append_timestamp(target, k, kl, ts.timestamp, ts.increment);
        break;
    }
    case CBsonWireType::Int64:
        ok = bson_append_int64(target, k, kl, value.as<int64_t>());
        break;
    case CBsonWireType::Decimal128:
    {
        const CBsonDecimal128& d = value.as<CBsonDecimal128>();
        bson_decimal128_t dec;
        dec.low = d.low;
        dec.high = d.high;
        ok = bson_append_decimal128(target, k, kl, &dec);
        break;
    }
    case CBsonWireType::MinKey:
        ok = bson_append_minkey(target, k, kl);
        break;
    case CBsonWireType::MaxKey:
        ok = bson_append_maxkey(target, k, kl);
        break;
    case CBsonWireType::Invalid:
    default:
        setError("Cannot append value of unrecognized type under key '" + key +
                 "'");
        return false;
    }

    if (!ok)
        setError(std::string("Failed to add ") +
                 CTypeRegistry::instance().typeName(value.type()) +
                 " under key '" + key + "'");
    return ok;
}

bool CDocumentBuilder::addString(const std::string& key,
                                 const std::string& value)
{
    return append(key, CBsonValue(value));
}

bool CDocumentBuilder::addInt32(const std::string& key, int32_t value)
{
    return append(key, CBsonValue(value));
}

bool CDocumentBuilder::addInt64(const std::string& key, int64_t value)
{
    return append(key, CBsonValue(value));
}

bool CDocumentBuilder::addDouble(const std::string& key, double value)
{
    return append(key, CBsonValue(value));
}

bool CDocumentBuilder::addBool(const std::string& key, bool value)
{
    return append(key, CBsonValue(value));
}

bool CDocumentBuilder::addNull(const std::string& key)
{
    return append(key, CBsonValue(CBsonNull{}));
}

bool CDocumentBuilder::addObjectId(const std::string& key,
                                   const std::string& objectId)
{
    if (!checkBsonHandle())
        return false;

    auto oid = CBsonObjectId::fromHex(objectId);
    if (!oid)
    {
        setError("Invalid ObjectId format");
        return false;
    }
    return append(key, CBsonValue(*oid));
}

bool CDocumentBuilder::addDateTime(const std::string& key, int64_t millis)
{
    return append(key, CBsonValue(CBsonDateTime{millis}));
}

bool CDocumentBuilder::addDecimal128(const std::string& key,
                                     const std::string& decimal)
{
    if (!checkBsonHandle())
        return false;

    auto dec = CBsonDecimal128::fromString(decimal);
    if (!dec)
    {
        setError("Invalid Decimal128 format");
        return false;
    }
    return append(key, CBsonValue(*dec));
}

bool CDocumentBuilder::addDocument(const std::string& key,
                                   const CDocument& subdoc)
{
    return append(key, CBsonValue(subdoc));
}

/*
 * addArray
 *		Append values under keys "0", "1", ...
 */
bool CDocumentBuilder::addArray(const std::string& key,
                                const std::vector<CBsonValue>& values)
{
    if (!checkBsonHandle())
        return false;

    bson_t child;
    if (!bson_append_array_begin(bsonDoc_, key.c_str(),
                                 static_cast<int>(key.size()), &child))
    {
        setError("Failed to begin array '" + key + "'");
        return false;
    }

    bool ok = true;
    for (size_t i = 0; i < values.size() && ok; i++)
        ok = appendTo(&child, std::to_string(i), values[i]);

    if (!bson_append_array_end(bsonDoc_, &child))
    {
        setError("Failed to end array '" + key + "'");
        return false;
    }
    return ok;
}

CDocument CDocumentBuilder::build() const
{
    return CDocument(getDocument());
}

std::vector<uint8_t> CDocumentBuilder::getDocument() const
{
    if (!bsonDoc_)
        return {};

    const uint8_t* data = bson_get_data(bsonDoc_);
    return std::vector<uint8_t>(data, data + bsonDoc_->len);
}

size_t CDocumentBuilder::getDocumentSize() const
{
    if (!bsonDoc_)
        return 0;
    return bsonDoc_->len;
}

bool CDocumentBuilder::isEmpty() const
{
    if (!bsonDoc_)
        return true;

    /* Empty BSON document is 5 bytes */
    return bsonDoc_->len == 5;
}

void CDocumentBuilder::clear()
{
    if (bsonDoc_)
        bson_reinit(bsonDoc_);
    else
        bsonDoc_ = bson_new();
    clearErrors();
}

std::string CDocumentBuilder::getLastError() const
{
    return lastError_;
}

void CDocumentBuilder::clearErrors()
{
    lastError_.clear();
    hasErrors_ = false;
}

bool CDocumentBuilder::hasErrors() const
{
    return hasErrors_;
}

void CDocumentBuilder::setError(const std::string& error) const
{
    lastError_ = error;
    hasErrors_ = true;
    debug_log("document builder: " + error);
}

bool CDocumentBuilder::checkBsonHandle() const
{
    return bsonDoc_ != nullptr && !hasErrors_;
}

} /* namespace BsonWalk */
