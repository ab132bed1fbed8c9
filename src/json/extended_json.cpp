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
 * @file extended_json.cpp
 * @brief Implementation of the extended-JSON adapter on top of cJSON.
 */

#include "bsonoid/json/extended_json.hpp"

#include "bsonoid/codec/hex.hpp"
#include "bsonoid/core/error.hpp"
#include "bsonoid/infra/logger.hpp"

#include <cmath>
#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <vector>

namespace bsonoid::json {

namespace {

constexpr const char* kIdKey = "id";

using CJsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

/**
 * @brief Collects a JSON array of byte values.
 *
 * @return The values in order, or `std::nullopt` if any element is not an integer
 * in `[0, 255]`. The length is not checked here.
 */
std::optional<std::vector<std::uint8_t>> byte_array(const cJSON* array)
{
    std::vector<std::uint8_t> bytes;
    const cJSON* element = nullptr;
    cJSON_ArrayForEach(element, array)
    {
        if (!cJSON_IsNumber(element)) {
            return std::nullopt;
        }
        double v = element->valuedouble;
        if (v < 0 || v > 255 || std::floor(v) != v) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<std::uint8_t>(v));
    }
    return bytes;
}

/// @brief Converts a JSON number to a seconds timestamp if it fits `uint32_t` exactly.
std::optional<std::uint32_t> seconds(const cJSON* number)
{
    double v = number->valuedouble;
    if (v < 0 || v > 4294967295.0 || std::floor(v) != v) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(v);
}

[[noreturn]] void reject(const char* message)
{
    throw core::Error(core::ErrorKind::UNSUPPORTED_INPUT, message);
}

} // namespace

cJSON* ExtendedJson::to_cjson(const core::ObjectId& id)
{
    cJSON* doc = cJSON_CreateObject();
    if (doc == nullptr) {
        throw std::bad_alloc();
    }
    cJSON_AddStringToObject(doc, kOidKey, id.to_hex_string().c_str());
    return doc;
}

std::string ExtendedJson::serialize(const core::ObjectId& id)
{
    CJsonPtr doc(to_cjson(id), cJSON_Delete);

    char* raw = cJSON_PrintUnformatted(doc.get());
    if (raw == nullptr) {
        throw std::bad_alloc();
    }
    std::string text(raw);
    cJSON_free(raw);
    return text;
}

core::ObjectId ExtendedJson::from_cjson(const cJSON* doc, core::IdOptions options)
{
    if (!cJSON_IsObject(doc)) {
        reject("extended JSON identifier must be an object");
    }

    const cJSON* oid = cJSON_GetObjectItemCaseSensitive(doc, kOidKey);
    if (!cJSON_IsString(oid) || oid->valuestring == nullptr) {
        reject("extended JSON identifier must have a string $oid member");
    }

    return core::ObjectId::from_extended_json(core::ObjectIdExtended{oid->valuestring}, options);
}

core::ObjectId ExtendedJson::parse(const std::string& text, core::IdOptions options)
{
    CJsonPtr doc(cJSON_Parse(text.c_str()), cJSON_Delete);
    if (!doc) {
        infra::Logger::log(infra::LogLevel::WARN, "ExtendedJson: Rejected unparsable document");
        reject("extended JSON identifier is not valid JSON");
    }
    return from_cjson(doc.get(), options);
}

/**
 * @brief Resolves an arbitrary JSON value.
 *
 * Operational Logic:
 * 1. **Objects**: `$oid` first (trusted), then `id` (validated).
 * 2. **Scalars**: strings are hex, null generates, numbers generate with a timestamp.
 * 3. **Arrays**: raw bytes, length enforced by `ObjectId::from_bytes`.
 */
core::ObjectId ExtendedJson::resolve(const cJSON* value, core::IdOptions options)
{
    if (value == nullptr || cJSON_IsNull(value)) {
        return core::ObjectId::generate(std::nullopt, options);
    }

    if (cJSON_IsObject(value)) {
        const cJSON* oid = cJSON_GetObjectItemCaseSensitive(value, kOidKey);
        if (cJSON_IsString(oid) && oid->valuestring != nullptr) {
            return core::ObjectId::from_extended_json(core::ObjectIdExtended{oid->valuestring},
                                                      options);
        }

        const cJSON* id = cJSON_GetObjectItemCaseSensitive(value, kIdKey);
        if (id == nullptr) {
            reject("argument passed in does not match the accepted types");
        }
        if (cJSON_IsString(id) && id->valuestring != nullptr) {
            return core::ObjectId::from_hex(id->valuestring, options);
        }
        if (cJSON_IsArray(id)) {
            if (auto bytes = byte_array(id)) {
                return core::ObjectId::from_bytes(*bytes, options);
            }
        }
        reject("argument passed in must have an id that is of type string or byte array");
    }

    if (cJSON_IsString(value) && value->valuestring != nullptr) {
        return core::ObjectId::from_hex(value->valuestring, options);
    }

    if (cJSON_IsNumber(value)) {
        if (auto time = seconds(value)) {
            return core::ObjectId::generate(*time, options);
        }
        reject("timestamp must be an integer number of seconds within 32 bits");
    }

    if (cJSON_IsArray(value)) {
        if (auto bytes = byte_array(value)) {
            return core::ObjectId::from_bytes(*bytes, options);
        }
        reject("byte array elements must be integers in [0, 255]");
    }

    reject("argument passed in does not match the accepted types");
}

bool ExtendedJson::is_valid(const cJSON* value)
{
    if (value == nullptr || cJSON_IsNull(value)) {
        return false;
    }

    if (cJSON_IsObject(value)) {
        const cJSON* oid = cJSON_GetObjectItemCaseSensitive(value, kOidKey);
        if (cJSON_IsString(oid) && oid->valuestring != nullptr) {
            return codec::Hex::is_valid(oid->valuestring);
        }

        const cJSON* id = cJSON_GetObjectItemCaseSensitive(value, kIdKey);
        if (cJSON_IsString(id) && id->valuestring != nullptr) {
            return codec::Hex::is_valid(id->valuestring);
        }
        if (cJSON_IsArray(id)) {
            auto bytes = byte_array(id);
            return bytes && bytes->size() == core::kIdSize;
        }
        return false;
    }

    if (cJSON_IsString(value) && value->valuestring != nullptr) {
        return codec::Hex::is_valid(value->valuestring);
    }

    if (cJSON_IsNumber(value)) {
        return seconds(value).has_value();
    }

    if (cJSON_IsArray(value)) {
        auto bytes = byte_array(value);
        return bytes && bytes->size() == core::kIdSize;
    }

    return false;
}

} // namespace bsonoid::json
