/*-------------------------------------------------------------------------
 *
 * CRawDocument.hpp
 *      Byte level document writer for regression tests.
 *      Builds well formed and deliberately broken BSON by hand.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include "document/CDocument.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace BsonWalk
{
namespace Regression
{

inline std::vector<uint8_t> le32(int32_t v)
{
    uint32_t u = static_cast<uint32_t>(v);
    return {static_cast<uint8_t>(u), static_cast<uint8_t>(u >> 8),
            static_cast<uint8_t>(u >> 16), static_cast<uint8_t>(u >> 24)};
}

inline std::vector<uint8_t> le64(int64_t v)
{
    uint64_t u = static_cast<uint64_t>(v);
    std::vector<uint8_t> out;
    for (int i = 0; i < 8; i++)
        out.push_back(static_cast<uint8_t>(u >> (8 * i)));
    return out;
}

inline std::vector<uint8_t> cat(std::vector<uint8_t> a,
                                const std::vector<uint8_t>& b)
{
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

/* <len:i32><bytes><0x00> with len counting the NUL */
inline std::vector<uint8_t> bsonString(const std::string& s)
{
    std::vector<uint8_t> out = le32(static_cast<int32_t>(s.size() + 1));
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(0);
    return out;
}

/**
 * Appends raw elements; bytes() frames them with a length prefix and
 * terminator unless the caller asks for the body alone.
 */
class CRawDocument
{
  public:
    CRawDocument& element(uint8_t tag, const std::string& key,
                          const std::vector<uint8_t>& payload)
    {
        body_.push_back(tag);
        body_.insert(body_.end(), key.begin(), key.end());
        body_.push_back(0);
        body_.insert(body_.end(), payload.begin(), payload.end());
        return *this;
    }

    CRawDocument& int32(const std::string& key, int32_t v)
    {
        return element(0x10, key, le32(v));
    }

    CRawDocument& int64(const std::string& key, int64_t v)
    {
        return element(0x12, key, le64(v));
    }

    CRawDocument& real(const std::string& key, double v)
    {
        int64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        return element(0x01, key, le64(bits));
    }

    CRawDocument& string(const std::string& key, const std::string& s)
    {
        return element(0x02, key, bsonString(s));
    }

    CRawDocument& boolean(const std::string& key, bool v)
    {
        return element(0x08, key, {static_cast<uint8_t>(v ? 1 : 0)});
    }

    CRawDocument& document(const std::string& key, const CRawDocument& sub)
    {
        return element(0x03, key, sub.bytes());
    }

    CRawDocument& array(const std::string& key, const CRawDocument& sub)
    {
        return element(0x04, key, sub.bytes());
    }

    CRawDocument& raw(const std::vector<uint8_t>& bytes)
    {
        body_.insert(body_.end(), bytes.begin(), bytes.end());
        return *this;
    }

    std::vector<uint8_t> bytes() const
    {
        std::vector<uint8_t> out =
            le32(static_cast<int32_t>(body_.size() + 5));
        out.insert(out.end(), body_.begin(), body_.end());
        out.push_back(0);
        return out;
    }

    CDocument build() const
    {
        return CDocument(bytes());
    }

  private:
    std::vector<uint8_t> body_;
};

} /* namespace Regression */
} /* namespace BsonWalk */
