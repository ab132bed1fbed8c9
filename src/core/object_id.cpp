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
 * @file object_id.cpp
 * @brief Implementation of the identifier value type.
 *
 * @details
 * Every factory funnels into the private constructor, which is the only place the
 * byte cache is populated. Validation is shared between the throwing factories and
 * the `is_valid` predicates through `codec::Hex`, so neither path depends on the
 * other.
 */

#include "bsonoid/core/object_id.hpp"

#include "bsonoid/codec/base64.hpp"
#include "bsonoid/codec/endian.hpp"
#include "bsonoid/codec/hex.hpp"
#include "bsonoid/core/error.hpp"
#include "bsonoid/infra/logger.hpp"
#include "bsonoid/infra/string.hpp"

#include <algorithm>
#include <utility>

namespace bsonoid::core {

namespace {

const char* const kInvalidInputMessage =
    "input must be a 24 character hex string, 12 byte array, or an integer";

} // namespace

ObjectId::ObjectId(std::string hex, const std::optional<Bytes>& bytes, IdOptions options)
    : hex_(std::move(hex))
{
    if (options.cache_bytes) {
        bytes_ = bytes ? *bytes : codec::Hex::to_bytes(hex_);
    }
}

ObjectId::ObjectId() : ObjectId(generate()) {}

// ============================================================================
// Factories
// ============================================================================

ObjectId ObjectId::generate(std::optional<std::uint32_t> time, IdOptions options)
{
    return generate(GeneratorState::process(), time, options);
}

ObjectId ObjectId::generate(GeneratorState& state, std::optional<std::uint32_t> time,
                            IdOptions options)
{
    Bytes bytes = Generator::generate(state, time);
    return ObjectId(codec::Hex::from_bytes(bytes), bytes, options);
}

ObjectId ObjectId::from_hex(std::string_view hex, IdOptions options)
{
    auto valid = codec::Hex::validate(hex);
    if (!valid) {
        throw Error(ErrorKind::MALFORMED_HEX, kInvalidInputMessage);
    }
    return ObjectId(std::move(*valid), std::nullopt, options);
}

/**
 * @brief Trusted construction: the string is stored exactly as received.
 *
 * The canonical check below costs one pass and is only made when TRACE is enabled,
 * so the fast path stays a single move.
 */
ObjectId ObjectId::from_trusted_hex(std::string hex, IdOptions options)
{
    if (infra::Logger::enabled(infra::LogLevel::TRACE) && !codec::Hex::is_canonical(hex)) {
        infra::Logger::log(infra::LogLevel::TRACE,
                           "ObjectId: Trusted hex '" + hex + "' is not canonical; stored as-is");
    }
    return ObjectId(std::move(hex), std::nullopt, options);
}

ObjectId ObjectId::from_bytes(const Bytes& bytes, IdOptions options)
{
    return ObjectId(codec::Hex::from_bytes(bytes), bytes, options);
}

ObjectId ObjectId::from_bytes(const std::uint8_t* data, std::size_t size, IdOptions options)
{
    if (data == nullptr || size != kIdSize) {
        throw Error(ErrorKind::INVALID_BYTE_LENGTH, kInvalidInputMessage);
    }
    Bytes bytes{};
    std::copy(data, data + kIdSize, bytes.begin());
    return from_bytes(bytes, options);
}

ObjectId ObjectId::from_bytes(const std::vector<std::uint8_t>& bytes, IdOptions options)
{
    return from_bytes(bytes.data(), bytes.size(), options);
}

/**
 * @brief Resolves a foreign identifier-like value.
 *
 * `to_hex_string()` takes precedence over the `id` field, matching how identifier
 * wrappers expose their canonical form.
 */
ObjectId ObjectId::from_like(const ObjectIdLike& like, IdOptions options)
{
    if (auto hex = like.to_hex_string()) {
        return from_hex(*hex, options);
    }

    IdField field = like.id();
    if (auto* hex = std::get_if<std::string>(&field)) {
        return from_hex(*hex, options);
    }
    if (auto* bytes = std::get_if<std::vector<std::uint8_t>>(&field)) {
        return from_bytes(*bytes, options);
    }

    throw Error(ErrorKind::UNSUPPORTED_INPUT,
                "argument passed in must have an id that is of type string or byte array");
}

ObjectId ObjectId::create_from_time(std::uint32_t time)
{
    return from_bytes(Generator::from_time(time));
}

ObjectId ObjectId::create_from_hex_string(std::string_view hex)
{
    if (hex.size() != kHexLength) {
        throw Error(ErrorKind::MALFORMED_HEX, "hex string must be 24 characters");
    }
    return from_hex(hex);
}

ObjectId ObjectId::create_from_base64(std::string_view base64)
{
    if (base64.size() != kBase64Length) {
        throw Error(ErrorKind::MALFORMED_BASE64, "base64 string must be 16 characters");
    }

    auto bytes = codec::Base64::decode(base64);
    if (!bytes) {
        throw Error(ErrorKind::MALFORMED_BASE64, "base64 string contains invalid characters");
    }
    return from_bytes(*bytes);
}

ObjectId ObjectId::create_pk()
{
    return ObjectId();
}

ObjectId ObjectId::from_extended_json(const ObjectIdExtended& doc, IdOptions options)
{
    return from_trusted_hex(doc.oid, options);
}

// ============================================================================
// Accessors & Conversions
// ============================================================================

const std::string& ObjectId::to_hex_string() const
{
    return hex_;
}

Bytes ObjectId::id() const
{
    return bytes_ ? *bytes_ : codec::Hex::to_bytes(hex_);
}

void ObjectId::set_id(const Bytes& bytes)
{
    std::string hex = codec::Hex::from_bytes(bytes);

    // Both assignments below are non-throwing once `hex` exists.
    if (bytes_) {
        *bytes_ = bytes;
    }
    hex_.swap(hex);
}

bool ObjectId::has_cached_bytes() const
{
    return bytes_.has_value();
}

std::string ObjectId::to_string(Encoding encoding) const
{
    if (encoding == Encoding::BASE64) {
        return codec::Base64::encode(id());
    }
    return hex_;
}

std::string ObjectId::to_json() const
{
    return hex_;
}

ObjectIdExtended ObjectId::to_extended_json() const
{
    return ObjectIdExtended{hex_};
}

std::uint32_t ObjectId::timestamp_seconds() const
{
    Bytes bytes = id();
    return codec::Endian::read_u32_be(bytes.data());
}

std::chrono::system_clock::time_point ObjectId::get_timestamp() const
{
    return std::chrono::system_clock::time_point(std::chrono::seconds(timestamp_seconds()));
}

std::size_t ObjectId::serialize_into(std::uint8_t* target, std::size_t offset) const
{
    Bytes bytes = id();
    std::copy(bytes.begin(), bytes.end(), target + offset);
    return kIdSize;
}

// ============================================================================
// Equality
// ============================================================================

bool ObjectId::equals(const ObjectId& other) const
{
    return hex_ == other.hex_;
}

bool ObjectId::equals(const ObjectId* other) const
{
    return other != nullptr && equals(*other);
}

bool ObjectId::equals(std::string_view other) const
{
    if (other == hex_) {
        return true;
    }
    return other.size() == hex_.size() && infra::String::to_lower(other) == hex_;
}

bool ObjectId::equals(const ObjectIdLike& other) const
{
    auto hex = other.to_hex_string();
    return hex && infra::String::to_lower(*hex) == hex_;
}

bool ObjectId::equals(std::nullptr_t) const
{
    return false;
}

// ============================================================================
// Validity
// ============================================================================

bool ObjectId::is_valid(std::string_view hex)
{
    return codec::Hex::is_valid(hex);
}

bool ObjectId::is_valid(const std::uint8_t* data, std::size_t size)
{
    return data != nullptr && size == kIdSize;
}

bool ObjectId::is_valid(const std::vector<std::uint8_t>& bytes)
{
    return bytes.size() == kIdSize;
}

bool ObjectId::is_valid(const Bytes&)
{
    return true;
}

bool ObjectId::is_valid(std::uint32_t)
{
    return true;
}

bool ObjectId::is_valid(const ObjectId& id)
{
    return codec::Hex::is_valid(id.hex_);
}

bool ObjectId::is_valid(const ObjectIdLike& like)
{
    if (auto hex = like.to_hex_string()) {
        return codec::Hex::is_valid(*hex);
    }

    IdField field = like.id();
    if (auto* hex = std::get_if<std::string>(&field)) {
        return codec::Hex::is_valid(*hex);
    }
    if (auto* bytes = std::get_if<std::vector<std::uint8_t>>(&field)) {
        return bytes->size() == kIdSize;
    }
    return false;
}

bool ObjectId::is_valid(std::nullptr_t)
{
    return false;
}

bool operator==(const ObjectId& lhs, const ObjectId& rhs)
{
    return lhs.equals(rhs);
}

bool operator!=(const ObjectId& lhs, const ObjectId& rhs)
{
    return !lhs.equals(rhs);
}

// Lowercase hex order is byte order.
bool operator<(const ObjectId& lhs, const ObjectId& rhs)
{
    return lhs.hex_ < rhs.hex_;
}

std::ostream& operator<<(std::ostream& os, const ObjectId& id)
{
    return os << id.hex_;
}

} // namespace bsonoid::core
