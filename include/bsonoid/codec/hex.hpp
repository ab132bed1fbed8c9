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
 * @file hex.hpp
 * @brief Canonical hexadecimal codec for identifiers.
 *
 * @details
 * The canonical form of an identifier is exactly 24 lowercase hexadecimal
 * characters. Validation accepts either case and normalizes to lowercase so that
 * case never reaches the canonical store.
 */

#pragma once

#include "bsonoid/core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace bsonoid::codec {

/**
 * @class Hex
 * @brief Static conversions between raw identifier bytes and hexadecimal text.
 */
class Hex {
  public:
    /**
     * @brief Validates a candidate hexadecimal identifier.
     *
     * **Rejection Rules:**
     * - Length other than 24 characters.
     * - Any character outside `[0-9a-fA-F]`.
     *
     * @param input The candidate string.
     * @return The lowercased string on success, `std::nullopt` otherwise.
     *
     * @code
     * auto hex = bsonoid::codec::Hex::validate("5F1D7F3B9C6A2E001F3A4B5C");
     * // *hex == "5f1d7f3b9c6a2e001f3a4b5c"
     * @endcode
     */
    static std::optional<std::string> validate(std::string_view input);

    /**
     * @brief Predicate form of `validate` that performs no allocation.
     */
    static bool is_valid(std::string_view input);

    /**
     * @brief True if every character of @p input is already canonical (`[0-9a-f]`)
     * and the length is 24.
     */
    static bool is_canonical(std::string_view input);

    /**
     * @brief Decodes hexadecimal text into identifier bytes.
     *
     * Exact inverse of `from_bytes` for canonical input. For any other input the
     * decode is still total: an unrecognized digit contributes a zero nibble and
     * bytes beyond the end of a short input remain zero.
     */
    static core::Bytes to_bytes(std::string_view hex);

    /**
     * @brief Encodes identifier bytes as 24 lowercase hexadecimal characters.
     */
    static std::string from_bytes(const core::Bytes& bytes);

  private:
    /// @brief Maps one hexadecimal digit to its value, or -1.
    static int nibble(char c);
};

} // namespace bsonoid::codec
