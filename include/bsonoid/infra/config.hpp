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
 * @file config.hpp
 * @brief Runtime configuration for the bsonoid front-end.
 *
 * @details
 * Configuration is read once from the environment and then passed explicitly to
 * whoever needs it. Nothing here is consulted implicitly by the library: the byte
 * cache setting only takes effect through the `IdOptions` handed to a constructor.
 *
 * | Variable              | Values                                        | Default |
 * |-----------------------|-----------------------------------------------|---------|
 * | `BSONOID_LOG_LEVEL`   | trace, debug, info, warn, error, fatal        | info    |
 * | `BSONOID_CACHE_BYTES` | 1, true, yes, on / 0, false, no, off          | off     |
 */

#pragma once

#include "bsonoid/core/types.hpp"
#include "bsonoid/infra/logger.hpp"

#include <optional>
#include <string_view>

namespace bsonoid::infra {

/**
 * @struct Config
 * @brief Resolved settings for a single process.
 */
struct Config {
    LogLevel log_level = LogLevel::INFO;
    bool cache_bytes = false;

    /**
     * @brief Builds a configuration from `BSONOID_*` environment variables.
     *
     * Unset variables keep their defaults. Unrecognized values are reported with a
     * WARN entry and also keep their defaults.
     */
    static Config from_env();

    /**
     * @brief Parses a severity name (case-insensitive, surrounding whitespace ignored).
     * @return The level, or `std::nullopt` for an unknown name.
     */
    static std::optional<LogLevel> parse_level(std::string_view value);

    /**
     * @brief Parses a boolean switch such as `on`, `false` or `1`.
     * @return The flag, or `std::nullopt` for an unknown spelling.
     */
    static std::optional<bool> parse_flag(std::string_view value);

    /// @brief Construction options derived from this configuration.
    core::IdOptions id_options() const;
};

} // namespace bsonoid::infra
