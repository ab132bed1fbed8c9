/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file types.hpp
 * @brief Fundamental sizes and value types shared by every bsonoid component.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace bsonoid::core {

/// @brief Size of an identifier in raw bytes.
constexpr std::size_t kIdSize = 12;

/// @brief Length of the canonical hexadecimal rendering.
constexpr std::size_t kHexLength = 24;

/// @brief Length of the base64 rendering (12 bytes encode without padding).
constexpr std::size_t kBase64Length = 16;

/// @brief Length of the process-unique segment (bytes 4-8).
constexpr std::size_t kProcessUniqueSize = 5;

/// @brief Counter modulus: the counter occupies 3 bytes.
constexpr std::uint32_t kCounterMask = 0xFFFFFF;

/**
 * @brief The raw 12-byte identifier.
 *
 * | bytes | meaning |
 * |-------|---------|
 * | 0-3   | seconds since the Unix epoch, big-endian |
 * | 4-8   | process-unique random value |
 * | 9-11  | counter, big-endian |
 */
using Bytes = std::array<std::uint8_t, kIdSize>;

/// @brief The 5-byte process-unique segment.
using ProcessUnique = std::array<std::uint8_t, kProcessUniqueSize>;

/**
 * @struct IdOptions
 * @brief Per-instance construction options.
 */
struct IdOptions {
    /// @brief Keep the raw bytes alongside the canonical hex string.
    bool cache_bytes = false;
};

/// @brief Output encoding for `ObjectId::to_string`.
enum class Encoding { HEX, BASE64 };

} // namespace bsonoid::core
