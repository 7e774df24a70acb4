/*-------------------------------------------------------------------------
 *
 * CDocumentIterator.cpp
 *      Forward-only traversal of the elements of a BSON document.
 *      Part of the BsonWalk BSON document traversal library.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CDocumentIterator.hpp"

#include "CContract.hpp"
#include "CLogMacros.hpp"
#include "document/CBsonError.hpp"
#include "document/CInPlaceOverwriter.hpp"
#include "document/CTypeRegistry.hpp"

#include <cstring>

namespace BsonWalk
{

CDocumentIterator::CDocumentIterator(const CDocument& document,
                                     CUnknownTypePolicy policy)
    : cursor_(), invalid_(false), writable_(false), error_()
{
    if (cursor_.init(document, policy))
        invalid_ = true;
}

CDocumentIterator::CDocumentIterator(const CDocument& document,
                                     const std::string& key,
                                     CUnknownTypePolicy policy)
    : CDocumentIterator(document, policy)
{
    if (invalid_)
        return;

    if (!move(key))
    {
        invalid_ = true;
        debug_log("seek key '" + key + "' not found");
    }
}

/*
 * forWriting
 *		Writable iterator over storage owned by this document alone
 */
CDocumentIterator CDocumentIterator::forWriting(CDocument& document,
                                                CUnknownTypePolicy policy)
{
    document.ensureUniqueStorage();

    CDocumentIterator iter(document, policy);
    iter.writable_ = true;
    return iter;
}

CCursorStatus CDocumentIterator::status() const noexcept
{
    if (invalid_)
        return CCursorStatus::Invalid;
    return cursor_.status();
}

bool CDocumentIterator::isValid() const noexcept
{
    return status() != CCursorStatus::Invalid;
}

/*
 * lastError
 *		Traversal errors take precedence over a key lookup miss
 */
std::error_code CDocumentIterator::lastError() const noexcept
{
    if (cursor_.error())
        return cursor_.error();
    return error_;
}

bool CDocumentIterator::isWritable() const noexcept
{
    return writable_;
}

CUnknownTypePolicy CDocumentIterator::unknownTypePolicy() const noexcept
{
    return cursor_.policy();
}

bool CDocumentIterator::advance()
{
    if (invalid_)
        return false;
    return cursor_.advance();
}

bool CDocumentIterator::move(const std::string& key)
{
    while (advance())
    {
        if (cursor_.currentKeyBytes() == key)
            return true;
    }

    if (!cursor_.error())
        error_ = make_error_code(CBsonErrc::KeyNotFound);
    return false;
}

std::string CDocumentIterator::currentKey() const
{
    return std::string(cursor_.currentKeyBytes());
}

CBsonValue CDocumentIterator::currentValue() const
{
    CBsonValue value;
    std::error_code ec = safeCurrentValue(value);

    BSONWALK_REQUIRE(!ec, "cannot decode value of '" + currentKey() +
                              "': " + ec.message());
    return value;
}

CBsonWireType CDocumentIterator::currentType() const
{
    uint8_t tag = cursor_.currentTypeTag();

    if (!CTypeRegistry::instance().isRecognized(tag))
        return CBsonWireType::Invalid;
    return static_cast<CBsonWireType>(tag);
}

CValueRange CDocumentIterator::currentValueRange() const
{
    return cursor_.currentValueRange();
}

/*
 * safeCurrentValue
 *		Unrecognized tags decode to the sentinel without error; a
 *		recognized tag whose payload is inconsistent is CorruptElement
 */
std::error_code CDocumentIterator::safeCurrentValue(CBsonValue& out) const
{
    const CTypeRegistry& registry = CTypeRegistry::instance();
    uint8_t tag = cursor_.currentTypeTag();
    CValueRange range = cursor_.currentValueRange();

    out = registry.decode(tag, cursor_.document(), range.offset, range.length);
    if (out.isInvalid() && registry.isRecognized(tag))
        return make_error_code(CBsonErrc::CorruptElement);
    return std::error_code();
}

std::optional<CKeyValuePair> CDocumentIterator::next()
{
    if (!advance())
        return std::nullopt;

    CBsonValue value;
    std::error_code ec = safeCurrentValue(value);
    if (ec)
        debug_log("value of '" + currentKey() + "' yielded as invalid: " +
                  ec.message());

    return CKeyValuePair(currentKey(), std::move(value));
}

std::vector<std::string> CDocumentIterator::keys()
{
    std::vector<std::string> result;

    while (advance())
        result.push_back(currentKey());
    return result;
}

std::vector<CBsonValue> CDocumentIterator::values()
{
    std::vector<CBsonValue> result;

    while (auto pair = next())
        result.push_back(std::move(pair->second));
    return result;
}

std::error_code CDocumentIterator::overwriteCurrentValue(const CBsonValue& value)
{
    return CInPlaceOverwriter::overwriteCurrentValue(*this, value);
}

/*
 * replaceCurrentValueBytes
 *		Copy bytes over the current value range of the shared storage
 */
void CDocumentIterator::replaceCurrentValueBytes(
    const std::vector<uint8_t>& bytes)
{
    BSONWALK_REQUIRE(writable_,
                     "overwrite through an iterator not obtained from "
                     "forWriting()");

    CValueRange range = cursor_.currentValueRange();
    BSONWALK_REQUIRE(bytes.size() == range.length,
                     "replacement of " + std::to_string(bytes.size()) +
                         " bytes for a value of " +
                         std::to_string(range.length) + " bytes");

    const CDocument& doc = cursor_.document();
    if (bytes.empty())
        return;
    std::memcpy(doc.storage()->mutableData() + doc.offset() + range.offset,
                bytes.data(), bytes.size());
}

const CDocument& CDocumentIterator::document() const noexcept
{
    return cursor_.document();
}

} /* namespace BsonWalk */
