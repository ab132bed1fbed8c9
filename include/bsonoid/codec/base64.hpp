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
 * @file base64.hpp
 * @brief Fixed-width base64 codec for identifiers.
 *
 * @details
 * Uses the standard RFC 4648 alphabet (`A-Z a-z 0-9 + /`). Twelve bytes are four
 * complete 3-byte groups, so the encoding is always exactly 16 characters and
 * never carries `=` padding.
 */

#pragma once

#include "bsonoid/core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace bsonoid::codec {

/**
 * @class Base64
 * @brief Static conversions between identifier bytes and their 16-character base64 form.
 */
class Base64 {
  public:
    /// @brief Encodes 12 bytes into 16 base64 characters.
    static std::string encode(const core::Bytes& bytes);

    /**
     * @brief Decodes a 16-character base64 string.
     *
     * @return The 12 bytes, or `std::nullopt` if the length is not 16 or any
     * character lies outside the alphabet (padding included).
     */
    static std::optional<core::Bytes> decode(std::string_view text);
};

} // namespace bsonoid::codec
