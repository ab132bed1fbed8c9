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
 * @file object_id.hpp
 * @brief The 12-byte document identifier value type.
 *
 * @details
 * `ObjectId` is the primary key type of the document format. Each instance keeps its
 * canonical 24-character lowercase hexadecimal rendering as the source of truth and,
 * when asked to through `IdOptions::cache_bytes`, a byte-for-byte consistent copy of
 * the raw 12 bytes.
 *
 * Instances are created only through named factories. Each one either returns a
 * well-formed identifier or throws `bsonoid::core::Error`:
 *
 * | Factory                   | Input                           | Failure             |
 * |---------------------------|---------------------------------|---------------------|
 * | `ObjectId()`, `generate`  | nothing / seconds timestamp     | never               |
 * | `from_hex`                | 24 hex chars, any case          | MALFORMED_HEX       |
 * | `from_bytes`              | 12 raw bytes                    | INVALID_BYTE_LENGTH |
 * | `from_like`               | `ObjectIdLike` capability       | any of the above    |
 * | `create_from_time`        | seconds timestamp (sentinel)    | never               |
 * | `create_from_hex_string`  | 24 hex chars                    | MALFORMED_HEX       |
 * | `create_from_base64`      | 16 base64 chars                 | MALFORMED_BASE64    |
 * | `from_extended_json`      | `{"$oid": ...}` (not validated) | never               |
 */

#pragma once

#include "bsonoid/core/generator.hpp"
#include "bsonoid/core/object_id_like.hpp"
#include "bsonoid/core/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace bsonoid::core {

/**
 * @struct ObjectIdExtended
 * @brief The extended-JSON shape `{"$oid": "<hex>"}`.
 */
struct ObjectIdExtended {
    std::string oid;
};

/**
 * @class ObjectId
 * @brief Immutable-by-default 12-byte identifier.
 */
class ObjectId {
  public:
    /**
     * @brief Generates a new identifier from the current time and the process state.
     */
    ObjectId();

    // ========================================================================
    // Factories
    // ========================================================================

    /**
     * @brief Generates a new identifier.
     *
     * @param time Seconds since the Unix epoch; the current second when absent.
     * @param options Per-instance options.
     */
    static ObjectId generate(std::optional<std::uint32_t> time = std::nullopt,
                             IdOptions options = {});

    /**
     * @brief Generates a new identifier from an injected generator state.
     */
    static ObjectId generate(GeneratorState& state, std::optional<std::uint32_t> time = std::nullopt,
                             IdOptions options = {});

    /**
     * @brief Parses a hexadecimal identifier, validating it first.
     *
     * Mixed or upper case is accepted and normalized to lowercase.
     *
     * @throws Error `MALFORMED_HEX` on wrong length or non-hex characters.
     */
    static ObjectId from_hex(std::string_view hex, IdOptions options = {});

    /**
     * @brief Adopts @p hex verbatim, without validation.
     *
     * Reserved for decode paths that already guarantee well-formed lowercase hex.
     * A malformed string is stored as given: `to_hex_string()` returns it unchanged,
     * `is_valid()` on the instance reports false and `id()` decodes it leniently.
     */
    static ObjectId from_trusted_hex(std::string hex, IdOptions options = {});

    /// @brief Adopts 12 raw bytes.
    static ObjectId from_bytes(const Bytes& bytes, IdOptions options = {});

    /**
     * @brief Adopts a raw byte sequence.
     * @throws Error `INVALID_BYTE_LENGTH` unless @p size is exactly 12.
     */
    static ObjectId from_bytes(const std::uint8_t* data, std::size_t size, IdOptions options = {});

    /// @copydoc from_bytes(const std::uint8_t*, std::size_t, IdOptions)
    static ObjectId from_bytes(const std::vector<std::uint8_t>& bytes, IdOptions options = {});

    /**
     * @brief Builds an identifier from a foreign identifier-like value.
     *
     * **Resolution Order:**
     * 1. `to_hex_string()` present: validated as hex.
     * 2. `id()` holds a string: validated as hex.
     * 3. `id()` holds bytes: must be exactly 12.
     * 4. Otherwise: `UNSUPPORTED_INPUT`.
     */
    static ObjectId from_like(const ObjectIdLike& like, IdOptions options = {});

    /**
     * @brief Range sentinel: @p time in bytes 0-3, remaining bytes zero.
     */
    static ObjectId create_from_time(std::uint32_t time);

    /**
     * @brief Parses a 24-character hexadecimal string.
     * @throws Error `MALFORMED_HEX` if the length is not 24 or validation fails.
     */
    static ObjectId create_from_hex_string(std::string_view hex);

    /**
     * @brief Decodes a 16-character base64 string.
     * @throws Error `MALFORMED_BASE64` if the length is not 16 or decoding fails.
     */
    static ObjectId create_from_base64(std::string_view base64);

    /// @brief Primary-key factory used by document encoders.
    static ObjectId create_pk();

    /**
     * @brief Builds an identifier from its extended-JSON shape.
     *
     * @warning `doc.oid` is not validated. The extended-JSON decoder upstream is
     * trusted to produce well-formed hex; see `from_trusted_hex`.
     */
    static ObjectId from_extended_json(const ObjectIdExtended& doc, IdOptions options = {});

    // ========================================================================
    // Accessors & Conversions
    // ========================================================================

    /// @brief Canonical 24-character lowercase hexadecimal rendering.
    const std::string& to_hex_string() const;

    /// @brief The raw 12 bytes (cached copy, or decoded from hex).
    Bytes id() const;

    /**
     * @brief Replaces the identifier with @p bytes.
     *
     * The hex string and the byte cache are computed before either is assigned, so an
     * observer never sees the two disagree.
     */
    void set_id(const Bytes& bytes);

    /// @brief True if this instance keeps a byte cache.
    bool has_cached_bytes() const;

    /// @brief Hex (default) or base64 rendering.
    std::string to_string(Encoding encoding = Encoding::HEX) const;

    /// @brief JSON rendering: the canonical hex string.
    std::string to_json() const;

    /// @brief `{"$oid": "<hex>"}`.
    ObjectIdExtended to_extended_json() const;

    /// @brief Bytes 0-3 as an unsigned big-endian seconds value.
    std::uint32_t timestamp_seconds() const;

    /**
     * @brief Generation time at one-second resolution.
     *
     * Identifiers generated within the same second are indistinguishable here.
     */
    std::chrono::system_clock::time_point get_timestamp() const;

    /**
     * @brief Copies the 12 bytes into `target[offset .. offset + 12)`.
     *
     * @warning No bounds checking is performed. The document encoder owning
     * @p target guarantees at least `offset + 12` bytes of capacity.
     *
     * @return Always 12.
     */
    std::size_t serialize_into(std::uint8_t* target, std::size_t offset) const;

    // ========================================================================
    // Equality
    // ========================================================================

    /// @brief Exact comparison of canonical hex strings.
    bool equals(const ObjectId& other) const;

    /// @brief Null compares unequal; otherwise as `equals(const ObjectId&)`.
    bool equals(const ObjectId* other) const;

    /// @brief Matches the canonical hex exactly or after lowercasing @p other.
    bool equals(std::string_view other) const;

    /// @brief Compares the lowercased `to_hex_string()` of @p other; false if absent.
    bool equals(const ObjectIdLike& other) const;

    /// @brief Always false.
    bool equals(std::nullptr_t) const;

    // ========================================================================
    // Validity
    // ========================================================================

    /// @brief Hex validation as a predicate.
    static bool is_valid(std::string_view hex);

    /// @brief True only for exactly 12 bytes.
    static bool is_valid(const std::uint8_t* data, std::size_t size);

    /// @brief True only for exactly 12 bytes.
    static bool is_valid(const std::vector<std::uint8_t>& bytes);

    /// @brief Always true.
    static bool is_valid(const Bytes& bytes);

    /// @brief Always true: any seconds timestamp generates an identifier.
    static bool is_valid(std::uint32_t time);

    /// @brief Validity of @p id's canonical hex (false for unvalidated trusted input).
    static bool is_valid(const ObjectId& id);

    /// @brief Applies the `from_like` resolution rules without constructing.
    static bool is_valid(const ObjectIdLike& like);

    /// @brief Always false.
    static bool is_valid(std::nullptr_t);

    friend bool operator==(const ObjectId& lhs, const ObjectId& rhs);
    friend bool operator!=(const ObjectId& lhs, const ObjectId& rhs);
    friend bool operator<(const ObjectId& lhs, const ObjectId& rhs);
    friend std::ostream& operator<<(std::ostream& os, const ObjectId& id);

  private:
    ObjectId(std::string hex, const std::optional<Bytes>& bytes, IdOptions options);

    /// @brief Canonical hex: the source of truth.
    std::string hex_;

    /// @brief Optional byte cache, always equal to `Hex::to_bytes(hex_)` when engaged.
    std::optional<Bytes> bytes_;
};

bool operator==(const ObjectId& lhs, const ObjectId& rhs);
bool operator!=(const ObjectId& lhs, const ObjectId& rhs);
bool operator<(const ObjectId& lhs, const ObjectId& rhs);
std::ostream& operator<<(std::ostream& os, const ObjectId& id);

} // namespace bsonoid::core

namespace std {

template <> struct hash<bsonoid::core::ObjectId> {
    size_t operator()(const bsonoid::core::ObjectId& id) const noexcept
    {
        return hash<string>()(id.to_hex_string());
    }
};

} // namespace std
