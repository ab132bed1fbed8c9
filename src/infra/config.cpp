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
 * @file config.cpp
 * @brief Environment-driven configuration loading.
 */

#include "bsonoid/infra/config.hpp"

#include "bsonoid/infra/string.hpp"

#include <cstdlib>
#include <string>

namespace bsonoid::infra {

std::optional<LogLevel> Config::parse_level(std::string_view value)
{
    std::string name = String::to_lower(String::trim(value));

    if (name == "trace")
        return LogLevel::TRACE;
    if (name == "debug")
        return LogLevel::DEBUG;
    if (name == "info")
        return LogLevel::INFO;
    if (name == "warn" || name == "warning")
        return LogLevel::WARN;
    if (name == "error")
        return LogLevel::ERROR;
    if (name == "fatal")
        return LogLevel::FATAL;
    return std::nullopt;
}

std::optional<bool> Config::parse_flag(std::string_view value)
{
    std::string flag = String::to_lower(String::trim(value));

    if (flag == "1" || flag == "true" || flag == "yes" || flag == "on")
        return true;
    if (flag == "0" || flag == "false" || flag == "no" || flag == "off")
        return false;
    return std::nullopt;
}

/**
 * @brief Resolves the process configuration.
 *
 * Each variable is handled independently so that one bad value does not discard
 * the others.
 */
Config Config::from_env()
{
    Config config;

    if (const char* raw = std::getenv("BSONOID_LOG_LEVEL")) {
        if (auto level = parse_level(raw)) {
            config.log_level = *level;
        } else {
            Logger::log(LogLevel::WARN, "Config: Ignoring unknown BSONOID_LOG_LEVEL '" +
                                            std::string(raw) + "'");
        }
    }

    if (const char* raw = std::getenv("BSONOID_CACHE_BYTES")) {
        if (auto flag = parse_flag(raw)) {
            config.cache_bytes = *flag;
        } else {
            Logger::log(LogLevel::WARN, "Config: Ignoring unknown BSONOID_CACHE_BYTES '" +
                                            std::string(raw) + "'");
        }
    }

    return config;
}

core::IdOptions Config::id_options() const
{
    core::IdOptions options;
    options.cache_bytes = cache_bytes;
    return options;
}

} // namespace bsonoid::infra
