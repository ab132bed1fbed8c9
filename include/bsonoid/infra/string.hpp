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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Static helpers used when normalizing externally supplied text: configuration
 * values read from the environment and mixed-case hexadecimal identifiers.
 */

#pragma once

#include <string>
#include <string_view>

namespace bsonoid::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed copy; empty if @p s is empty or only whitespace.
     *
     * @code
     * std::string level = bsonoid::infra::String::trim("  debug \n"); // "debug"
     * @endcode
     */
    static std::string trim(std::string_view s);

    /**
     * @brief Returns an ASCII-lowercased copy of @p s.
     *
     * Only `A-Z` are mapped; every other byte is copied unchanged, so the result
     * never depends on the active locale.
     */
    static std::string to_lower(std::string_view s);
};

} // namespace bsonoid::infra
