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
 * @file main.cpp
 * @brief `oidtool` entry point.
 *
 * @details
 * A thin command line front-end over the identifier library:
 * 1. Configuration (environment).
 * 2. Command dispatch.
 * 3. Error reporting through the logger.
 */

#include "bsonoid/core/error.hpp"
#include "bsonoid/core/object_id.hpp"
#include "bsonoid/infra/config.hpp"
#include "bsonoid/infra/logger.hpp"
#include "bsonoid/json/extended_json.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using bsonoid::core::ObjectId;
using bsonoid::infra::LogLevel;
using bsonoid::infra::Logger;

namespace {

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " COMMAND [ARGS]\n"
              << "Commands:\n"
              << "  gen [COUNT] [TIME]   Generate COUNT identifiers (Default: 1), optionally at TIME\n"
              << "  parse HEX            Show hex, base64, timestamp and extended JSON for HEX\n"
              << "  base64 B64           Decode a 16 character base64 identifier\n"
              << "  time SECONDS         Show the range sentinel for SECONDS\n"
              << "  valid VALUE          Print whether VALUE is a valid hex identifier\n"
              << "  --help               Show this help message\n"
              << "Environment:\n"
              << "  BSONOID_LOG_LEVEL    trace|debug|info|warn|error|fatal (Default: info)\n"
              << "  BSONOID_CACHE_BYTES  Cache raw bytes in each identifier (Default: off)\n";
}

std::uint32_t parse_seconds(const std::string& text)
{
    unsigned long long value = std::stoull(text);
    if (value > 0xFFFFFFFFull) {
        throw std::out_of_range("timestamp does not fit in 32 bits: " + text);
    }
    return static_cast<std::uint32_t>(value);
}

void describe(const ObjectId& id)
{
    std::time_t seconds = static_cast<std::time_t>(id.timestamp_seconds());
    std::cout << "hex:       " << id.to_hex_string() << "\n"
              << "base64:    " << id.to_string(bsonoid::core::Encoding::BASE64) << "\n"
              << "timestamp: " << std::put_time(std::gmtime(&seconds), "%Y-%m-%dT%H:%M:%SZ")
              << "\n"
              << "extended:  " << bsonoid::json::ExtendedJson::serialize(id) << "\n";
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    if (argc < 2 || std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    bsonoid::infra::Config config = bsonoid::infra::Config::from_env();
    Logger::set_level(config.log_level);
    bsonoid::core::IdOptions options = config.id_options();

    std::string command = argv[1];

    try {
        if (command == "gen") {
            unsigned long count = argc > 2 ? std::stoul(argv[2]) : 1;
            std::optional<std::uint32_t> time;
            if (argc > 3) {
                time = parse_seconds(argv[3]);
            }

            Logger::log(LogLevel::DEBUG, "oidtool: Generating " + std::to_string(count) +
                                             " identifier(s)");
            for (unsigned long i = 0; i < count; ++i) {
                std::cout << ObjectId::generate(time, options).to_hex_string() << "\n";
            }
        } else if (command == "parse" && argc > 2) {
            describe(ObjectId::create_from_hex_string(argv[2]));
        } else if (command == "base64" && argc > 2) {
            describe(ObjectId::create_from_base64(argv[2]));
        } else if (command == "time" && argc > 2) {
            describe(ObjectId::create_from_time(parse_seconds(argv[2])));
        } else if (command == "valid" && argc > 2) {
            bool valid = ObjectId::is_valid(std::string(argv[2]));
            std::cout << (valid ? "true" : "false") << "\n";
            return valid ? 0 : 2;
        } else {
            Logger::log(LogLevel::ERROR, "oidtool: Unknown command or missing argument '" +
                                             command + "'");
            print_help(argv[0]);
            return 1;
        }
    } catch (const bsonoid::core::Error& e) {
        Logger::log(LogLevel::FATAL, "oidtool: Rejected input: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "oidtool: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
