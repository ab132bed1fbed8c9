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
 * @file object_id_test.cpp
 * @brief Unit tests for the `ObjectId` value type.
 *
 * @details
 * Covers every factory and its failure mode, equality across input shapes, the
 * validity predicates, timestamp extraction, binary serialization and the optional
 * byte cache.
 */

#include "bsonoid/core/error.hpp"
#include "bsonoid/core/object_id.hpp"
#include "framework.hpp"

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

using bsonoid::core::Bytes;
using bsonoid::core::Encoding;
using bsonoid::core::Error;
using bsonoid::core::ErrorKind;
using bsonoid::core::GeneratorState;
using bsonoid::core::IdField;
using bsonoid::core::IdOptions;
using bsonoid::core::ObjectId;
using bsonoid::core::ObjectIdLike;
using bsonoid::core::ProcessUnique;

namespace {

const std::string kHex = "5f1d7f3b9c6a2e001f3a4b5c";

/// @brief Identifier-like value exposing only a hex rendering.
class HexOnly : public ObjectIdLike {
  public:
    explicit HexOnly(std::string hex) : hex_(std::move(hex)) {}
    std::optional<std::string> to_hex_string() const override { return hex_; }

  private:
    std::string hex_;
};

/// @brief Identifier-like value exposing only an `id` field.
class IdOnly : public ObjectIdLike {
  public:
    explicit IdOnly(IdField field) : field_(std::move(field)) {}
    IdField id() const override { return field_; }

  private:
    IdField field_;
};

/// @brief Identifier-like value exposing both; the hex rendering must win.
class Both : public ObjectIdLike {
  public:
    std::optional<std::string> to_hex_string() const override { return kHex; }
    IdField id() const override { return std::string("000000000000000000000000"); }
};

/// @brief Identifier-like value exposing nothing.
class Nothing : public ObjectIdLike {};

ErrorKind kind_of(void (*action)())
{
    try {
        action();
    } catch (const Error& e) {
        return e.kind();
    }
    throw std::runtime_error("expected bsonoid::core::Error");
}

} // namespace

/**
 * @brief Scenario: a lowercase hex string survives construction unchanged.
 */
void test_oid_create_from_hex_string()
{
    ObjectId id = ObjectId::create_from_hex_string(kHex);
    ASSERT_EQ(id.to_hex_string(), kHex);
    ASSERT_EQ(id.to_string(), kHex);
    ASSERT_EQ(id.to_json(), kHex);
}

/**
 * @brief Mixed-case input is normalized; bad input fails with the right kind.
 */
void test_oid_from_hex_validation()
{
    ObjectId upper = ObjectId::from_hex("5F1D7F3B9C6A2E001F3A4B5C");
    ASSERT_EQ(upper.to_hex_string(), kHex);

    ASSERT_THROWS(Error, ObjectId::from_hex("zzzzzzzzzzzzzzzzzzzzzzzz"));
    ASSERT_THROWS(Error, ObjectId::create_from_hex_string("5f1d7f3b9c6a2e001f3a4b5"));

    ASSERT_TRUE(kind_of([] { ObjectId::from_hex("5f1d7f3b9c6a2e001f3a4b5g"); }) ==
                ErrorKind::MALFORMED_HEX);
    ASSERT_TRUE(kind_of([] { ObjectId::create_from_hex_string("abc"); }) ==
                ErrorKind::MALFORMED_HEX);
}

/**
 * @brief Scenario: the time sentinel zeroes bytes 4-11 and reports its instant.
 */
void test_oid_create_from_time()
{
    ObjectId sentinel = ObjectId::create_from_time(1609459200u);
    Bytes bytes = sentinel.id();

    ASSERT_EQ(static_cast<int>(bytes[0]), 0x5f);
    ASSERT_EQ(static_cast<int>(bytes[1]), 0xee);
    ASSERT_EQ(static_cast<int>(bytes[2]), 0x66);
    ASSERT_EQ(static_cast<int>(bytes[3]), 0x00);
    for (std::size_t i = 4; i < bytes.size(); ++i) {
        ASSERT_EQ(static_cast<int>(bytes[i]), 0);
    }

    // 2021-01-01T00:00:00Z
    auto expected = std::chrono::system_clock::time_point(std::chrono::seconds(1609459200));
    ASSERT_TRUE(sentinel.get_timestamp() == expected);
    ASSERT_EQ(sentinel.timestamp_seconds(), 1609459200u);
}

/**
 * @brief Scenario: consecutive identifiers differ only in the counter.
 */
void test_oid_generate_sequence()
{
    GeneratorState state(ProcessUnique{0x10, 0x20, 0x30, 0x40, 0x50}, 0x00ABCD);

    ObjectId a = ObjectId::generate(state, 1595768635u);
    ObjectId b = ObjectId::generate(state, 1595768635u);

    ASSERT_EQ(a.to_hex_string(), std::string("5f1d7f3b102030405000abcd"));
    ASSERT_EQ(b.to_hex_string(), std::string("5f1d7f3b102030405000abce"));
    ASSERT_TRUE(a != b);
    ASSERT_TRUE(a < b);

    ObjectId generated;
    ASSERT_TRUE(ObjectId::is_valid(generated));
    ASSERT_TRUE(ObjectId::create_pk() != generated);
}

/**
 * @brief Raw bytes are adopted only at exactly 12 bytes.
 */
void test_oid_from_bytes()
{
    std::vector<std::uint8_t> raw = {0x5f, 0x1d, 0x7f, 0x3b, 0x9c, 0x6a,
                                     0x2e, 0x00, 0x1f, 0x3a, 0x4b, 0x5c};
    ObjectId id = ObjectId::from_bytes(raw);
    ASSERT_EQ(id.to_hex_string(), kHex);

    std::vector<std::uint8_t> short_raw(11, 0);
    ASSERT_THROWS(Error, ObjectId::from_bytes(short_raw));
    ASSERT_TRUE(kind_of([] {
                    std::vector<std::uint8_t> long_raw(13, 0);
                    ObjectId::from_bytes(long_raw);
                }) == ErrorKind::INVALID_BYTE_LENGTH);
    ASSERT_THROWS(Error, ObjectId::from_bytes(nullptr, 12));
}

/**
 * @brief Base64 input must be 16 characters from the standard alphabet.
 */
void test_oid_base64()
{
    ObjectId id = ObjectId::create_from_base64("Xx1/O5xqLgAfOktc");
    ASSERT_EQ(id.to_hex_string(), kHex);
    ASSERT_EQ(id.to_string(Encoding::BASE64), std::string("Xx1/O5xqLgAfOktc"));
    ASSERT_EQ(id.to_string(Encoding::HEX), kHex);

    ASSERT_TRUE(kind_of([] { ObjectId::create_from_base64("Xx1/O5xqLgAfOk"); }) ==
                ErrorKind::MALFORMED_BASE64);
    ASSERT_TRUE(kind_of([] { ObjectId::create_from_base64("Xx1/O5xqLgAfOk=="); }) ==
                ErrorKind::MALFORMED_BASE64);
}

/**
 * @brief Identifier-like values resolve by `to_hex_string`, then `id`.
 */
void test_oid_from_like()
{
    ASSERT_EQ(ObjectId::from_like(HexOnly("5F1D7F3B9C6A2E001F3A4B5C")).to_hex_string(), kHex);
    ASSERT_EQ(ObjectId::from_like(IdOnly(std::string(kHex))).to_hex_string(), kHex);
    ASSERT_EQ(ObjectId::from_like(Both()).to_hex_string(), kHex);

    IdOnly bytes(std::vector<std::uint8_t>{0x5f, 0x1d, 0x7f, 0x3b, 0x9c, 0x6a, 0x2e, 0x00, 0x1f,
                                           0x3a, 0x4b, 0x5c});
    ASSERT_EQ(ObjectId::from_like(bytes).to_hex_string(), kHex);

    ObjectId copy(ObjectId::from_like(HexOnly(kHex)));
    ASSERT_TRUE(copy == ObjectId::from_hex(kHex));

    ASSERT_THROWS(Error, ObjectId::from_like(HexOnly("not-hex")));
    ASSERT_TRUE(kind_of([] { ObjectId::from_like(Nothing()); }) == ErrorKind::UNSUPPORTED_INPUT);
    ASSERT_TRUE(kind_of([] { ObjectId::from_like(IdOnly(std::vector<std::uint8_t>(5, 1))); }) ==
                ErrorKind::INVALID_BYTE_LENGTH);
}

/**
 * @brief Scenario: equality accepts upper-case hex and never throws on odd shapes.
 */
void test_oid_equality()
{
    ObjectId id = ObjectId::from_hex(kHex);

    ASSERT_TRUE(id.equals("5F1D7F3B9C6A2E001F3A4B5C"));
    ASSERT_TRUE(id.equals(kHex));
    ASSERT_TRUE(id.equals(ObjectId::create_from_hex_string(kHex)));
    ASSERT_TRUE(id.equals(HexOnly("5f1D7F3b9c6a2e001f3a4b5C")));

    ASSERT_FALSE(id.equals(nullptr));
    ASSERT_FALSE(id.equals(static_cast<const ObjectId*>(nullptr)));
    ASSERT_FALSE(id.equals("5f1d7f3b9c6a2e001f3a4b5d"));
    ASSERT_FALSE(id.equals("short"));
    ASSERT_FALSE(id.equals(Nothing()));
    ASSERT_FALSE(id.equals(IdOnly(std::string(kHex))));

    ObjectId other = ObjectId::from_hex(kHex);
    ASSERT_TRUE(id.equals(&other));
    ASSERT_EQ(id, other);
}

/**
 * @brief Scenario: validity never throws and follows the construction rules.
 */
void test_oid_is_valid()
{
    ASSERT_FALSE(ObjectId::is_valid("zzzzzzzzzzzzzzzzzzzzzzzz"));
    ASSERT_FALSE(ObjectId::is_valid("5f1d7f3b9c6a2e001f3a4b5"));
    ASSERT_FALSE(ObjectId::is_valid("5f1d7f3b9c6a2e001f3a4b5-"));
    ASSERT_TRUE(ObjectId::is_valid(kHex));
    ASSERT_TRUE(ObjectId::is_valid("5F1D7F3B9C6A2E001F3A4B5C"));

    ASSERT_TRUE(ObjectId::is_valid(std::vector<std::uint8_t>(12, 0)));
    ASSERT_FALSE(ObjectId::is_valid(std::vector<std::uint8_t>(11, 0)));
    ASSERT_TRUE(ObjectId::is_valid(Bytes{}));
    ASSERT_TRUE(ObjectId::is_valid(1609459200u));
    ASSERT_FALSE(ObjectId::is_valid(nullptr));

    ASSERT_TRUE(ObjectId::is_valid(HexOnly(kHex)));
    ASSERT_FALSE(ObjectId::is_valid(HexOnly("xyz")));
    ASSERT_TRUE(ObjectId::is_valid(IdOnly(std::vector<std::uint8_t>(12, 7))));
    ASSERT_FALSE(ObjectId::is_valid(IdOnly(std::vector<std::uint8_t>(3, 7))));
    ASSERT_FALSE(ObjectId::is_valid(Nothing()));

    ASSERT_TRUE(ObjectId::is_valid(ObjectId::from_hex(kHex)));
    ASSERT_FALSE(ObjectId::is_valid(ObjectId::from_trusted_hex("not a hex string")));
}

/**
 * @brief Scenario: serialization writes exactly twelve bytes at the offset.
 */
void test_oid_serialize_into()
{
    ObjectId id = ObjectId::from_hex(kHex);

    std::vector<std::uint8_t> buffer(20, 0xEE);
    std::size_t written = id.serialize_into(buffer.data(), 4);
    ASSERT_EQ(written, static_cast<std::size_t>(12));

    for (std::size_t i = 0; i < 4; ++i) {
        ASSERT_EQ(static_cast<int>(buffer[i]), 0xEE);
    }
    Bytes expected = id.id();
    for (std::size_t i = 0; i < 12; ++i) {
        ASSERT_EQ(static_cast<int>(buffer[4 + i]), static_cast<int>(expected[i]));
    }
    for (std::size_t i = 16; i < 20; ++i) {
        ASSERT_EQ(static_cast<int>(buffer[i]), 0xEE);
    }
}

/**
 * @brief The byte cache is opt-in per instance and always matches the hex string.
 */
void test_oid_byte_cache()
{
    IdOptions cached;
    cached.cache_bytes = true;

    ObjectId plain = ObjectId::from_hex(kHex);
    ASSERT_FALSE(plain.has_cached_bytes());

    ObjectId with_cache = ObjectId::from_hex(kHex, cached);
    ASSERT_TRUE(with_cache.has_cached_bytes());
    ASSERT_TRUE(with_cache.id() == plain.id());
    ASSERT_EQ(with_cache.timestamp_seconds(), 1595768635u);

    ObjectId generated = ObjectId::generate(std::nullopt, cached);
    ASSERT_TRUE(generated.has_cached_bytes());
    ASSERT_TRUE(ObjectId::from_bytes(generated.id()).equals(generated));
}

/**
 * @brief `set_id` rewrites the hex and the cache together.
 */
void test_oid_set_id()
{
    IdOptions cached;
    cached.cache_bytes = true;
    ObjectId id = ObjectId::from_hex(kHex, cached);

    Bytes replacement{};
    replacement.fill(0xab);
    id.set_id(replacement);

    ASSERT_EQ(id.to_hex_string(), std::string("abababababababababababab"));
    ASSERT_TRUE(id.id() == replacement);

    ObjectId uncached = ObjectId::from_hex(kHex);
    uncached.set_id(replacement);
    ASSERT_EQ(uncached.to_hex_string(), std::string("abababababababababababab"));
    ASSERT_FALSE(uncached.has_cached_bytes());
}

/**
 * @brief Ordering follows byte order and hashing makes identifiers usable as keys.
 */
void test_oid_ordering_and_hash()
{
    ObjectId early = ObjectId::create_from_time(1000u);
    ObjectId late = ObjectId::create_from_time(2000u);
    ObjectId between = ObjectId::generate(1500u);

    ASSERT_TRUE(early < between);
    ASSERT_TRUE(between < late);
    ASSERT_FALSE(late < early);

    std::set<ObjectId> ordered = {late, early, between};
    ASSERT_EQ(*ordered.begin(), early);

    std::unordered_set<ObjectId> keys;
    keys.insert(ObjectId::from_hex(kHex));
    keys.insert(ObjectId::from_hex("5F1D7F3B9C6A2E001F3A4B5C"));
    ASSERT_EQ(keys.size(), static_cast<std::size_t>(1));
}
