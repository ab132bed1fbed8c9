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
 * @file generator.hpp
 * @brief Identifier generation from time, process-unique value and counter.
 *
 * @details
 * This file declares `GeneratorState`, the only shared mutable state in bsonoid,
 * and `Generator`, the stateless routine that lays out a fresh 12-byte identifier.
 * The process-wide state is a well-scoped singleton; tests inject their own
 * `GeneratorState` to obtain deterministic output.
 */

#pragma once

#include "bsonoid/core/types.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>

namespace bsonoid::core {

/**
 * @class GeneratorState
 * @brief Process-unique value plus a wrapping 24-bit counter.
 *
 * @details
 * **Concurrency Model:**
 * - The 5-byte process-unique value is produced at most once, under `std::call_once`,
 *   so concurrent first use cannot observe two different or partially written values.
 * - The counter is a `std::atomic` advanced with `fetch_add`. The unsigned 32-bit
 *   wraparound is a multiple of 2^24, so masking the fetched value yields a sequence
 *   that wraps cleanly modulo 2^24.
 */
class GeneratorState {
  public:
    /**
     * @brief Creates a state with a lazily drawn process-unique value and a random
     * counter start in `[0, 2^24)`.
     */
    GeneratorState();

    /**
     * @brief Creates a deterministic state.
     *
     * @param process_unique The fixed 5-byte segment to emit.
     * @param counter_seed The first counter value to emit (masked to 24 bits).
     */
    GeneratorState(const ProcessUnique& process_unique, std::uint32_t counter_seed);

    GeneratorState(const GeneratorState&) = delete;
    GeneratorState& operator=(const GeneratorState&) = delete;

    /**
     * @brief The state shared by every default generation in this process.
     */
    static GeneratorState& process();

    /**
     * @brief Returns the process-unique segment, drawing it on first call.
     */
    const ProcessUnique& process_unique();

    /// @brief True once the process-unique segment has been drawn or injected.
    bool initialized() const;

    /**
     * @brief Atomically returns the current counter value and advances it.
     * @return A value in `[0, 2^24)`.
     */
    std::uint32_t next_counter();

  private:
    std::once_flag once_;
    std::atomic<bool> initialized_;
    ProcessUnique process_unique_;
    std::atomic<std::uint32_t> counter_;
};

/**
 * @class Generator
 * @brief Static identifier layout routines.
 */
class Generator {
  public:
    /**
     * @brief Generates a new identifier using the process-wide state.
     *
     * @param time Seconds since the Unix epoch. The current wall-clock second is
     * used when absent.
     * @return The 12 identifier bytes.
     *
     * @code
     * bsonoid::core::Bytes raw = bsonoid::core::Generator::generate();
     * @endcode
     */
    static Bytes generate(std::optional<std::uint32_t> time = std::nullopt);

    /**
     * @brief Generates a new identifier from an explicit state.
     */
    static Bytes generate(GeneratorState& state, std::optional<std::uint32_t> time = std::nullopt);

    /**
     * @brief Lays out a range sentinel: @p time in bytes 0-3, zero elsewhere.
     *
     * The result is never unique; it is meant for ordering and range comparisons
     * against generated identifiers.
     */
    static Bytes from_time(std::uint32_t time);

    /// @brief Current wall-clock time truncated to whole seconds and 32 bits.
    static std::uint32_t now_seconds();
};

} // namespace bsonoid::core
