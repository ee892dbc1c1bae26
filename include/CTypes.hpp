/*-------------------------------------------------------------------------
 *
 * CTypes.hpp
 *      Common type aliases for DocBucket.
 *
 * Copyright (c) 2024-2025, pgElephant, Inc.
 *
 *-------------------------------------------------------------------------
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace DocBucket
{

using String = std::string;
using StringVector = std::vector<std::string>;
using StringMap = std::unordered_map<std::string, std::string>;
using ByteVector = std::vector<uint8_t>;
using ByteSpan = std::span<const uint8_t>;

/* BSON datetimes are milliseconds since the Unix epoch */
using DateTimeMs = int64_t;

inline DateTimeMs currentDateTimeMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

inline ByteSpan asBytes(const std::string& str)
{
    return ByteSpan(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

inline std::string toString(ByteSpan bytes)
{
    return std::string(reinterpret_cast<const char*>(bytes.data()),
                       bytes.size());
}

} /* namespace DocBucket */
