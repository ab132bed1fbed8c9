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
 * @file object_id_like.hpp
 * @brief Capability interface for foreign identifier-like values.
 *
 * @details
 * Types owned by other subsystems (driver handles, cached documents, wrappers) can
 * take part in identifier construction and comparison by implementing this
 * interface. A value qualifies through either capability:
 * - a hexadecimal rendering (`to_hex_string`), or
 * - an `id` field holding a hex string or 12 raw bytes.
 *
 * When both are present, `to_hex_string` wins.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bsonoid::core {

/// @brief Content of an `id` field: absent, a hex string, or raw bytes.
using IdField = std::variant<std::monostate, std::string, std::vector<std::uint8_t>>;

/**
 * @class ObjectIdLike
 * @brief Abstract source of an identifier.
 *
 * Both capabilities default to "absent"; implementors override whichever they have.
 */
class ObjectIdLike {
  public:
    virtual ~ObjectIdLike() = default;

    /**
     * @brief Hexadecimal rendering of the identifier, if this value can produce one.
     *
     * Case is not significant; callers lowercase before comparing.
     */
    virtual std::optional<std::string> to_hex_string() const { return std::nullopt; }

    /**
     * @brief The raw `id` field, if this value carries one.
     */
    virtual IdField id() const { return std::monostate{}; }
};

} // namespace bsonoid::core
