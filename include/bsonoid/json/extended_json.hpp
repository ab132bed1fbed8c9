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
 * @file extended_json.hpp
 * @brief Extended-JSON adapter for identifiers.
 *
 * @details
 * The textual encoding of the document format represents an identifier as
 * `{"$oid": "<24 lowercase hex chars>"}`. This adapter converts between `ObjectId`
 * and cJSON trees or text, and resolves JSON values of unknown shape into
 * identifiers.
 *
 * **Trust Boundary:**
 * The `$oid` value is taken without hex validation. The extended-JSON decoder is
 * assumed to have produced well-formed hex already; skipping the second pass keeps
 * decode throughput up. A malformed `$oid` therefore yields an `ObjectId` whose
 * canonical string fails `ObjectId::is_valid`, rather than an exception.
 */

#pragma once

#include "bsonoid/core/object_id.hpp"
#include "bsonoid/core/types.hpp"

#include <cJSON.h>
#include <string>

namespace bsonoid::json {

/**
 * @class ExtendedJson
 * @brief Static conversions between `ObjectId` and extended JSON.
 */
class ExtendedJson {
  public:
    /// @brief Key under which the hex string is stored.
    static constexpr const char* kOidKey = "$oid";

    /**
     * @brief Builds a `{"$oid": "<hex>"}` object.
     *
     * @return cJSON* A new object. Ownership passes to the caller, who must release
     * it with `cJSON_Delete` or attach it to a parent.
     */
    static cJSON* to_cjson(const core::ObjectId& id);

    /**
     * @brief Renders the unformatted extended-JSON text.
     *
     * @code
     * // {"$oid":"5f1d7f3b9c6a2e001f3a4b5c"}
     * std::string text = bsonoid::json::ExtendedJson::serialize(id);
     * @endcode
     */
    static std::string serialize(const core::ObjectId& id);

    /**
     * @brief Reads the `$oid` member of an extended-JSON object.
     *
     * @throws core::Error `UNSUPPORTED_INPUT` if @p doc is not an object with a string
     * `$oid` member. The string itself is not validated.
     */
    static core::ObjectId from_cjson(const cJSON* doc, core::IdOptions options = {});

    /**
     * @brief Parses extended-JSON text.
     *
     * @throws core::Error `UNSUPPORTED_INPUT` on unparsable text or a missing `$oid`.
     */
    static core::ObjectId parse(const std::string& text, core::IdOptions options = {});

    /**
     * @brief Resolves a JSON value of unknown shape into an identifier.
     *
     * **Resolution Order:**
     * 1. Object with a string `$oid`: extended-JSON fast path (not validated).
     * 2. Object with an `id` member: a string is validated as hex, an array must hold
     *    12 byte values; any other `id` is rejected.
     * 3. String: validated as hex.
     * 4. Null (or a null pointer): a new identifier. Number: a new identifier with
     *    that seconds timestamp.
     * 5. Array: exactly 12 integers in `[0, 255]`.
     * 6. Anything else: `UNSUPPORTED_INPUT`.
     *
     * @throws core::Error describing the first rule that rejected the value.
     */
    static core::ObjectId resolve(const cJSON* value, core::IdOptions options = {});

    /**
     * @brief Predicate form of `resolve`; never throws.
     *
     * A null pointer is not valid here, although `resolve` generates for it.
     */
    static bool is_valid(const cJSON* value);
};

} // namespace bsonoid::json
