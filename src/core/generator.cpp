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
 * @file generator.cpp
 * @brief Implementation of identifier generation.
 *
 * @details
 * Entropy comes from `std::random_device`, which reads the kernel CSPRNG on Linux.
 * It is consulted once for the process-unique segment and once for the counter
 * start; every later identifier costs one atomic increment.
 */

#include "bsonoid/core/generator.hpp"

#include "bsonoid/codec/endian.hpp"
#include "bsonoid/infra/logger.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace bsonoid::core {

namespace {

std::uint32_t random_counter_start()
{
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<std::uint32_t> dis(0, kCounterMask);
    return dis(gen);
}

} // namespace

GeneratorState::GeneratorState()
    : initialized_(false), process_unique_{}, counter_(random_counter_start())
{
}

GeneratorState::GeneratorState(const ProcessUnique& process_unique, std::uint32_t counter_seed)
    : initialized_(false), process_unique_{}, counter_(counter_seed & kCounterMask)
{
    std::call_once(once_, [this, &process_unique] {
        process_unique_ = process_unique;
        initialized_.store(true, std::memory_order_release);
    });
}

GeneratorState& GeneratorState::process()
{
    // Function-local static: initialization is thread-safe since C++11.
    static GeneratorState state;
    return state;
}

/**
 * @brief Returns the process-unique segment, drawing it exactly once.
 *
 * Losers of a concurrent first call block inside `std::call_once` until the winner
 * has finished writing all five bytes.
 */
const ProcessUnique& GeneratorState::process_unique()
{
    std::call_once(once_, [this] {
        std::random_device rd;
        for (auto& b : process_unique_) {
            b = static_cast<std::uint8_t>(rd() & 0xFF);
        }
        initialized_.store(true, std::memory_order_release);

        if (infra::Logger::enabled(infra::LogLevel::DEBUG)) {
            std::stringstream ss;
            ss << std::hex << std::setfill('0');
            for (auto b : process_unique_) {
                ss << std::setw(2) << static_cast<int>(b);
            }
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Generator: Process-unique value initialized (" + ss.str() + ")");
        }
    });
    return process_unique_;
}

bool GeneratorState::initialized() const
{
    return initialized_.load(std::memory_order_acquire);
}

std::uint32_t GeneratorState::next_counter()
{
    std::uint32_t value = counter_.fetch_add(1, std::memory_order_relaxed) & kCounterMask;
    if (value == kCounterMask) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Generator: Counter wrapping to zero");
    }
    return value;
}

std::uint32_t Generator::now_seconds()
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

Bytes Generator::generate(std::optional<std::uint32_t> time)
{
    return generate(GeneratorState::process(), time);
}

/**
 * @brief Lays out a fresh identifier.
 *
 * Layout: `[time:4 BE][process unique:5][counter:3 BE]`
 */
Bytes Generator::generate(GeneratorState& state, std::optional<std::uint32_t> time)
{
    Bytes bytes{};

    codec::Endian::write_u32_be(bytes.data(), time ? *time : now_seconds());

    const ProcessUnique& unique = state.process_unique();
    std::copy(unique.begin(), unique.end(), bytes.begin() + 4);

    codec::Endian::write_u24_be(bytes.data() + 9, state.next_counter());

    return bytes;
}

Bytes Generator::from_time(std::uint32_t time)
{
    Bytes bytes{};
    codec::Endian::write_u32_be(bytes.data(), time);
    return bytes;
}

} // namespace bsonoid::core
