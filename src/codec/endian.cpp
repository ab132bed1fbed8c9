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
 * @file endian.cpp
 * @brief Implementation of the big-endian packing helpers.
 */

#include "bsonoid/codec/endian.hpp"

namespace bsonoid::codec {

void Endian::write_u32_be(std::uint8_t* out, std::uint32_t value)
{
    out[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
    out[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    out[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    out[3] = static_cast<std::uint8_t>(value & 0xFF);
}

void Endian::write_u24_be(std::uint8_t* out, std::uint32_t value)
{
    out[0] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    out[1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    out[2] = static_cast<std::uint8_t>(value & 0xFF);
}

std::uint32_t Endian::read_u32_be(const std::uint8_t* in)
{
    return (static_cast<std::uint32_t>(in[0]) << 24) | (static_cast<std::uint32_t>(in[1]) << 16) |
           (static_cast<std::uint32_t>(in[2]) << 8) | static_cast<std::uint32_t>(in[3]);
}

std::uint32_t Endian::read_u24_be(const std::uint8_t* in)
{
    return (static_cast<std::uint32_t>(in[0]) << 16) | (static_cast<std::uint32_t>(in[1]) << 8) |
           static_cast<std::uint32_t>(in[2]);
}

} // namespace bsonoid::codec
