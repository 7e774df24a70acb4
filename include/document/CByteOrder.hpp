/*-------------------------------------------------------------------------
 *
 * CByteOrder.hpp
 *      Little-endian reads and writes for BSON payloads.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

namespace BsonWalk
{

inline uint32_t readUInt32LE(const uint8_t* p) noexcept
{
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline int32_t readInt32LE(const uint8_t* p) noexcept
{
    return static_cast<int32_t>(readUInt32LE(p));
}

inline uint64_t readUInt64LE(const uint8_t* p) noexcept
{
    return static_cast<uint64_t>(readUInt32LE(p)) |
           (static_cast<uint64_t>(readUInt32LE(p + 4)) << 32);
}

inline int64_t readInt64LE(const uint8_t* p) noexcept
{
    return static_cast<int64_t>(readUInt64LE(p));
}

inline double readDoubleLE(const uint8_t* p) noexcept
{
    uint64_t bits = readUInt64LE(p);
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

inline void putUInt32LE(std::vector<uint8_t>& out, uint32_t v)
{
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xff));
}

inline void putUInt64LE(std::vector<uint8_t>& out, uint64_t v)
{
    putUInt32LE(out, static_cast<uint32_t>(v & 0xffffffffu));
    putUInt32LE(out, static_cast<uint32_t>(v >> 32));
}

inline void putDoubleLE(std::vector<uint8_t>& out, double v)
{
    uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    putUInt64LE(out, bits);
}

} /* namespace BsonWalk */
