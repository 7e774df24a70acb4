/*-------------------------------------------------------------------------
 *
 * CByteCursor.cpp
 *      Bounds-checked element navigation over a BSON document.
 *
 * Element layout: <type:u8><key:cstring><value>. The document itself is
 * <length:i32><elements...><0x00>. Offsets here are relative to the start
 * of the document; end_ is the index of its terminating byte, so every
 * element, including its value, must finish at or before end_.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#include "document/CByteCursor.hpp"

#include "CContract.hpp"
#include "CLogMacros.hpp"
#include "document/CBsonError.hpp"
#include "document/CByteOrder.hpp"
#include "document/CTypeRegistry.hpp"

#include <cstring>

namespace BsonWalk
{

namespace
{

/* <length:i32><0x00> */
constexpr size_t kMinDocumentSize = 5;

/* <total:i32><code length:i32><code:1 byte NUL><scope:5 bytes> */
constexpr size_t kMinCodeWithScopeSize = 14;

constexpr size_t kObjectIdSize = 12;

} /* anonymous namespace */

const char* cursorStatusName(CCursorStatus status) noexcept
{
    switch (status)
    {
    case CCursorStatus::BeforeFirst:
        return "BeforeFirst";
    case CCursorStatus::Positioned:
        return "Positioned";
    case CCursorStatus::Exhausted:
        return "Exhausted";
    case CCursorStatus::Invalid:
        return "Invalid";
    default:
        return "Unknown";
    }
}

CByteCursor::CByteCursor()
    : document_(), policy_(CUnknownTypePolicy::Sentinel),
      status_(CCursorStatus::Invalid), error_(), end_(0), next_(0), tag_(0),
      keyOffset_(0), keyLength_(0), value_(), unknownPending_(false)
{
}

/*
 * init
 *		Check the length prefix and terminator of the document
 */
std::error_code CByteCursor::init(const CDocument& document,
                                  CUnknownTypePolicy policy)
{
    document_ = document;
    policy_ = policy;
    status_ = CCursorStatus::Invalid;
    error_.clear();
    end_ = 0;
    next_ = 0;
    tag_ = 0;
    keyOffset_ = 0;
    keyLength_ = 0;
    value_ = CValueRange{};
    unknownPending_ = false;

    size_t size = document_.size();
    if (size < kMinDocumentSize)
    {
        error_ = make_error_code(CBsonErrc::MalformedHeader);
        warn_log("document of " + std::to_string(size) +
                 " bytes is shorter than a BSON header");
        return error_;
    }

    const uint8_t* data = document_.data();
    int64_t declared = readInt32LE(data);
    if (declared != static_cast<int64_t>(size) || data[size - 1] != 0)
    {
        error_ = make_error_code(CBsonErrc::MalformedHeader);
        warn_log("document length prefix " + std::to_string(declared) +
                 " does not frame " + std::to_string(size) + " bytes");
        return error_;
    }

    end_ = size - 1;
    next_ = 4;
    status_ = CCursorStatus::BeforeFirst;
    return error_;
}

/*
 * advance
 *		Move to the next element, or to Exhausted at the terminator
 */
bool CByteCursor::advance()
{
    const CTypeRegistry& registry = CTypeRegistry::instance();

    if (status_ == CCursorStatus::Invalid || status_ == CCursorStatus::Exhausted)
        return false;

    if (unknownPending_)
        return fail(make_error_code(CBsonErrc::UnknownType),
                    "cannot step over an element of unknown type");

    if (next_ == end_)
    {
        status_ = CCursorStatus::Exhausted;
        return false;
    }
    if (next_ > end_)
        return fail(make_error_code(CBsonErrc::CorruptElement),
                    "element runs past the document terminator");

    const uint8_t* data = document_.data();
    uint8_t tag = data[next_];
    if (tag == 0)
        return fail(make_error_code(CBsonErrc::CorruptElement),
                    "terminator before the end of the document");

    auto keyEnd = findTerminator(next_ + 1);
    if (!keyEnd)
        return fail(make_error_code(CBsonErrc::CorruptElement),
                    "unterminated key");

    size_t valueOffset = *keyEnd + 1;

    if (!registry.isRecognized(tag))
    {
        if (policy_ == CUnknownTypePolicy::Fail)
            return fail(make_error_code(CBsonErrc::UnknownType),
                        "unrecognized wire type");

        debug_log("unrecognized wire type " + std::to_string(tag) +
                  " at offset " + std::to_string(next_) +
                  "; traversal stops after this element");
        tag_ = tag;
        keyOffset_ = next_ + 1;
        keyLength_ = *keyEnd - keyOffset_;
        value_ = CValueRange{valueOffset, end_ - valueOffset};
        unknownPending_ = true;
        next_ = end_;
        status_ = CCursorStatus::Positioned;
        return true;
    }

    auto valueLength = measureValue(tag, valueOffset);
    if (!valueLength)
        return fail(make_error_code(CBsonErrc::CorruptElement),
                    "truncated or inconsistent value");

    tag_ = tag;
    keyOffset_ = next_ + 1;
    keyLength_ = *keyEnd - keyOffset_;
    value_ = CValueRange{valueOffset, *valueLength};
    next_ = valueOffset + *valueLength;
    status_ = CCursorStatus::Positioned;
    return true;
}

CCursorStatus CByteCursor::status() const noexcept
{
    return status_;
}

std::error_code CByteCursor::error() const noexcept
{
    return error_;
}

CUnknownTypePolicy CByteCursor::policy() const noexcept
{
    return policy_;
}

const CDocument& CByteCursor::document() const noexcept
{
    return document_;
}

std::string_view CByteCursor::currentKeyBytes() const
{
    BSONWALK_REQUIRE(status_ == CCursorStatus::Positioned,
                     std::string("key read while cursor is ") +
                         cursorStatusName(status_));
    return std::string_view(
        reinterpret_cast<const char*>(document_.data() + keyOffset_),
        keyLength_);
}

uint8_t CByteCursor::currentTypeTag() const
{
    BSONWALK_REQUIRE(status_ == CCursorStatus::Positioned,
                     std::string("type read while cursor is ") +
                         cursorStatusName(status_));
    return tag_;
}

CValueRange CByteCursor::currentValueRange() const
{
    BSONWALK_REQUIRE(status_ == CCursorStatus::Positioned,
                     std::string("value read while cursor is ") +
                         cursorStatusName(status_));
    return value_;
}

/*
 * fail
 *		Close the cursor after a traversal error
 */
bool CByteCursor::fail(std::error_code code, const char* reason)
{
    debug_log(std::string("document traversal stopped at offset ") +
              std::to_string(next_) + ": " + reason);
    status_ = CCursorStatus::Exhausted;
    error_ = code;
    return false;
}

size_t CByteCursor::remaining(size_t at) const noexcept
{
    return at <= end_ ? end_ - at : 0;
}

/*
 * findTerminator
 *		Index of the first NUL in [from, end_)
 */
std::optional<size_t> CByteCursor::findTerminator(size_t from) const
{
    size_t avail = remaining(from);
    if (avail == 0)
        return std::nullopt;

    const uint8_t* start = document_.data() + from;
    const void* nul = std::memchr(start, 0, avail);
    if (!nul)
        return std::nullopt;
    return from + static_cast<size_t>(static_cast<const uint8_t*>(nul) - start);
}

std::optional<int32_t> CByteCursor::readInt32(size_t at) const
{
    if (remaining(at) < 4)
        return std::nullopt;
    return readInt32LE(document_.data() + at);
}

/*
 * measureValue
 *		Byte length of the value starting at valueOffset, if it fits
 */
std::optional<size_t> CByteCursor::measureValue(uint8_t tag,
                                                size_t valueOffset) const
{
    if (auto width = CTypeRegistry::instance().fixedWidth(tag))
    {
        if (*width > remaining(valueOffset))
            return std::nullopt;
        return *width;
    }

    switch (static_cast<CBsonWireType>(tag))
    {
    case CBsonWireType::String:
    case CBsonWireType::Code:
    case CBsonWireType::Symbol:
        return measureString(valueOffset);
    case CBsonWireType::Document:
    case CBsonWireType::Array:
        return measureDocument(valueOffset);
    case CBsonWireType::Binary:
        return measureBinary(valueOffset);
    case CBsonWireType::Regex:
        return measureRegex(valueOffset);
    case CBsonWireType::DbPointer:
    {
        auto len = measureString(valueOffset);
        if (!len || remaining(valueOffset + *len) < kObjectIdSize)
            return std::nullopt;
        return *len + kObjectIdSize;
    }
    case CBsonWireType::CodeWithScope:
        return measureCodeWithScope(valueOffset);
    default:
        return std::nullopt;
    }
}

/* <length:i32><bytes><0x00>, length counts the NUL */
std::optional<size_t> CByteCursor::measureString(size_t valueOffset) const
{
    auto len = readInt32(valueOffset);
    if (!len || *len < 1)
        return std::nullopt;

    size_t total = 4 + static_cast<size_t>(*len);
    if (total > remaining(valueOffset))
        return std::nullopt;
    if (document_.data()[valueOffset + total - 1] != 0)
        return std::nullopt;
    return total;
}

std::optional<size_t> CByteCursor::measureDocument(size_t valueOffset) const
{
    auto len = readInt32(valueOffset);
    if (!len || *len < static_cast<int32_t>(kMinDocumentSize))
        return std::nullopt;

    size_t total = static_cast<size_t>(*len);
    if (total > remaining(valueOffset))
        return std::nullopt;
    if (document_.data()[valueOffset + total - 1] != 0)
        return std::nullopt;
    return total;
}

/*
 * measureBinary
 *		<length:i32><subtype:u8><bytes>; the old binary subtype nests a
 *		second int32 that must equal length - 4
 */
std::optional<size_t> CByteCursor::measureBinary(size_t valueOffset) const
{
    auto len = readInt32(valueOffset);
    if (!len || *len < 0)
        return std::nullopt;

    size_t total = 5 + static_cast<size_t>(*len);
    if (total > remaining(valueOffset))
        return std::nullopt;

    if (document_.data()[valueOffset + 4] == kBinarySubtypeBinaryOld)
    {
        auto inner = readInt32(valueOffset + 5);
        if (*len < 4 || !inner || *inner != *len - 4)
            return std::nullopt;
    }
    return total;
}

/* <pattern:cstring><options:cstring> */
std::optional<size_t> CByteCursor::measureRegex(size_t valueOffset) const
{
    auto patternEnd = findTerminator(valueOffset);
    if (!patternEnd)
        return std::nullopt;
    auto optionsEnd = findTerminator(*patternEnd + 1);
    if (!optionsEnd)
        return std::nullopt;
    return *optionsEnd + 1 - valueOffset;
}

/*
 * measureCodeWithScope
 *		<total:i32><code:string><scope:document>; the inner lengths must
 *		add up to the total exactly
 */
std::optional<size_t>
CByteCursor::measureCodeWithScope(size_t valueOffset) const
{
    auto total = readInt32(valueOffset);
    if (!total || *total < static_cast<int32_t>(kMinCodeWithScopeSize))
        return std::nullopt;
    size_t totalLength = static_cast<size_t>(*total);
    if (totalLength > remaining(valueOffset))
        return std::nullopt;

    auto codeLength = readInt32(valueOffset + 4);
    if (!codeLength || *codeLength < 1)
        return std::nullopt;
    size_t codeBytes = static_cast<size_t>(*codeLength);
    if (codeBytes + 8 + kMinDocumentSize > totalLength)
        return std::nullopt;
    if (document_.data()[valueOffset + 8 + codeBytes - 1] != 0)
        return std::nullopt;

    size_t scopeOffset = valueOffset + 8 + codeBytes;
    auto scopeLength = readInt32(scopeOffset);
    if (!scopeLength || *scopeLength < static_cast<int32_t>(kMinDocumentSize))
        return std::nullopt;
    if (scopeOffset + static_cast<size_t>(*scopeLength) !=
        valueOffset + totalLength)
        return std::nullopt;
    if (document_.data()[valueOffset + totalLength - 1] != 0)
        return std::nullopt;
    return totalLength;
}

} /* namespace BsonWalk */
