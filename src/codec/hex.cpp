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
 * @file hex.cpp
 * @brief Implementation of the hexadecimal identifier codec.
 */

#include "bsonoid/codec/hex.hpp"

#include "bsonoid/infra/string.hpp"

namespace bsonoid::codec {

namespace {

constexpr char kDigits[] = "0123456789abcdef";

} // namespace

int Hex::nibble(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

bool Hex::is_valid(std::string_view input)
{
    if (input.size() != core::kHexLength) {
        return false;
    }
    for (char c : input) {
        if (nibble(c) < 0) {
            return false;
        }
    }
    return true;
}

bool Hex::is_canonical(std::string_view input)
{
    if (input.size() != core::kHexLength) {
        return false;
    }
    for (char c : input) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Validates and normalizes a hexadecimal identifier.
 *
 * The common case (already lowercase) is returned without a second pass.
 */
std::optional<std::string> Hex::validate(std::string_view input)
{
    if (is_canonical(input)) {
        return std::string(input);
    }
    if (!is_valid(input)) {
        return std::nullopt;
    }
    return infra::String::to_lower(input);
}

core::Bytes Hex::to_bytes(std::string_view hex)
{
    core::Bytes bytes{};
    std::size_t pairs = hex.size() / 2;
    if (pairs > core::kIdSize) {
        pairs = core::kIdSize;
    }

    for (std::size_t i = 0; i < pairs; ++i) {
        int hi = nibble(hex[i * 2]);
        int lo = nibble(hex[i * 2 + 1]);
        bytes[i] = static_cast<std::uint8_t>(((hi < 0 ? 0 : hi) << 4) | (lo < 0 ? 0 : lo));
    }
    return bytes;
}

std::string Hex::from_bytes(const core::Bytes& bytes)
{
    std::string out(core::kHexLength, '0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kDigits[(bytes[i] >> 4) & 0x0F];
        out[i * 2 + 1] = kDigits[bytes[i] & 0x0F];
    }
    return out;
}

} // namespace bsonoid::codec
