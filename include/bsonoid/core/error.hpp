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
 * @file error.hpp
 * @brief Construction failure reported by the identifier factories.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace bsonoid::core {

/**
 * @enum ErrorKind
 * @brief The condition that rejected an input.
 */
enum class ErrorKind {
    MALFORMED_HEX,       ///< Wrong length or non-hexadecimal characters.
    MALFORMED_BASE64,    ///< Wrong length or characters outside the base64 alphabet.
    INVALID_BYTE_LENGTH, ///< Raw byte input that is not exactly 12 bytes.
    UNSUPPORTED_INPUT    ///< An input shape that no factory accepts.
};

/**
 * @class Error
 * @brief Exception thrown synchronously by identifier construction.
 *
 * Only construction throws. Equality, conversion, timestamp extraction and
 * serialization operate on an existing instance and never fail.
 */
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    /// @brief The rejected condition.
    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

} // namespace bsonoid::core
