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
 * @file endian.hpp
 * @brief Host-independent big-endian integer packing.
 *
 * @details
 * Identifier fields are stored big-endian regardless of the host byte order, so
 * values are assembled byte by byte rather than through `memcpy`.
 */

#pragma once

#include <cstdint>

namespace bsonoid::codec {

/**
 * @class Endian
 * @brief Static big-endian readers and writers.
 */
class Endian {
  public:
    /// @brief Writes @p value into `out[0..4)`, most significant byte first.
    static void write_u32_be(std::uint8_t* out, std::uint32_t value);

    /// @brief Writes the low 24 bits of @p value into `out[0..3)`.
    static void write_u24_be(std::uint8_t* out, std::uint32_t value);

    /// @brief Reads `in[0..4)` as an unsigned big-endian integer.
    static std::uint32_t read_u32_be(const std::uint8_t* in);

    /// @brief Reads `in[0..3)` as an unsigned big-endian 24-bit integer.
    static std::uint32_t read_u24_be(const std::uint8_t* in);
};

} // namespace bsonoid::codec
