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
 * @file base64.cpp
 * @brief Implementation of the fixed-width base64 codec.
 *
 * @details
 * Each 3-byte group maps to 4 sextets:
 * `[aaaaaabb][bbbbcccc][ccdddddd]` -> `a b c d`
 */

#include "bsonoid/codec/base64.hpp"

namespace bsonoid::codec {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int sextet(char c)
{
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '+')
        return 62;
    if (c == '/')
        return 63;
    return -1;
}

} // namespace

std::string Base64::encode(const core::Bytes& bytes)
{
    std::string out;
    out.reserve(core::kBase64Length);

    for (std::size_t i = 0; i < bytes.size(); i += 3) {
        std::uint32_t group = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                              (static_cast<std::uint32_t>(bytes[i + 1]) << 8) |
                              static_cast<std::uint32_t>(bytes[i + 2]);

        out.push_back(kAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kAlphabet[(group >> 12) & 0x3F]);
        out.push_back(kAlphabet[(group >> 6) & 0x3F]);
        out.push_back(kAlphabet[group & 0x3F]);
    }
    return out;
}

std::optional<core::Bytes> Base64::decode(std::string_view text)
{
    if (text.size() != core::kBase64Length) {
        return std::nullopt;
    }

    core::Bytes bytes{};
    for (std::size_t in = 0, out = 0; in < text.size(); in += 4, out += 3) {
        std::uint32_t group = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            int value = sextet(text[in + k]);
            if (value < 0) {
                return std::nullopt;
            }
            group = (group << 6) | static_cast<std::uint32_t>(value);
        }

        bytes[out] = static_cast<std::uint8_t>((group >> 16) & 0xFF);
        bytes[out + 1] = static_cast<std::uint8_t>((group >> 8) & 0xFF);
        bytes[out + 2] = static_cast<std::uint8_t>(group & 0xFF);
    }
    return bytes;
}

} // namespace bsonoid::codec
