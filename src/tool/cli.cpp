/*
 * TINYGUID COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 *
 * This source code is licensed under the TinyGUID Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file cli.cpp
 * @brief Implementation of the `tinyguidctl` commands.
 *
 * @details
 * Commands:
 * 1. `generate`: allocate identifiers and print them one per line.
 * 2. `inspect`: parse any accepted text form and print its fields as JSON.
 * 3. `origin`: print the origin id resolved for this process.
 */

#include "tinyguid/tool/cli.hpp"

#include "tinyguid/core/generator.hpp"
#include "tinyguid/core/guid.hpp"
#include "tinyguid/infra/logger.hpp"
#include "tinyguid/infra/string.hpp"
#include "tinyguid/json/guid_json.hpp"
#include "tinyguid/origin/origin_resolver.hpp"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace tinyguid::tool {

using infra::LogLevel;
using infra::Logger;

namespace {

/**
 * @brief Raised for command line mistakes; reported with the usage hint.
 */
class UsageError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

enum class Format { BASE32, HEX, BASE64, ARK };

/**
 * @brief Options accepted by `generate`.
 */
struct GenerateOptions {
    std::int64_t tenant = 0;
    std::optional<std::int64_t> origin;
    std::int64_t count = 1;
    Format format = Format::BASE32;
};

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " <command> [options]\n"
              << "Commands:\n"
              << "  generate      Allocate identifiers (one per line)\n"
              << "    --tenant N    Tenant id, -32768..32767 (Default: 0)\n"
              << "    --origin N    Origin id, int32 (Default: resolved for this process)\n"
              << "    --count N     Number of identifiers (Default: 1)\n"
              << "    --format F    base32 | hex | base64 | ark (Default: base32)\n"
              << "  inspect ID    Parse ID (hex, base32, base64url or ark) and print its fields\n"
              << "  origin        Print the origin id of this process\n"
              << "  --help        Show this help message\n"
              << "Environment:\n"
              << "  TINYGUID_ORIGIN_ID, TINYGUID_MACHINE_ID, TINYGUID_LOG_LEVEL\n";
}

std::int64_t parse_number(const std::string& flag, const std::string& value)
{
    std::int64_t out = 0;
    if (!infra::String::parse_int64(value, out)) {
        throw UsageError("Invalid value for " + flag + ": '" + value + "'");
    }
    return out;
}

Format parse_format(const std::string& value)
{
    const std::string name = infra::String::to_lower(value);
    if (name == "base32") {
        return Format::BASE32;
    }
    if (name == "hex") {
        return Format::HEX;
    }
    if (name == "base64") {
        return Format::BASE64;
    }
    if (name == "ark") {
        return Format::ARK;
    }
    throw UsageError("Unknown format: '" + value + "'");
}

GenerateOptions parse_generate_options(int argc, char* argv[])
{
    GenerateOptions options;

    for (int i = 2; i < argc; ++i) {
        const std::string flag = argv[i];
        if (i + 1 >= argc) {
            throw UsageError("Missing value for " + flag);
        }
        const std::string value = argv[++i];

        if (flag == "--tenant") {
            options.tenant = parse_number(flag, value);
        } else if (flag == "--origin") {
            options.origin = parse_number(flag, value);
        } else if (flag == "--count") {
            options.count = parse_number(flag, value);
            if (options.count < 1) {
                throw UsageError("--count must be at least 1");
            }
        } else if (flag == "--format") {
            options.format = parse_format(value);
        } else {
            throw UsageError("Unknown option: " + flag);
        }
    }
    return options;
}

std::string render(const core::Guid& guid, Format format)
{
    switch (format) {
    case Format::HEX:
        return guid.to_hex();
    case Format::BASE64:
        return guid.to_base64();
    case Format::ARK:
        return guid.to_ark();
    case Format::BASE32:
        break;
    }
    return guid.to_base32();
}

int run_generate(int argc, char* argv[])
{
    const GenerateOptions options = parse_generate_options(argc, argv);
    auto& generator = core::Generator::instance();

    const std::int64_t origin_id =
        options.origin ? *options.origin
                       : origin::OriginResolver::instance().current_origin_id();

    for (std::int64_t i = 0; i < options.count; ++i) {
        std::cout << render(generator.generate(options.tenant, origin_id), options.format)
                  << '\n';
    }
    std::cout.flush();
    return kExitOk;
}

int run_inspect(int argc, char* argv[])
{
    if (argc != 3) {
        throw UsageError("inspect expects exactly one identifier");
    }

    try {
        const auto guid = core::Guid::parse(argv[2]);
        std::cout << json::describe(guid) << std::endl;
        return kExitOk;
    } catch (const core::GuidError& e) {
        Logger::log(LogLevel::ERROR,
                    std::string("Inspect: ") + to_string(e.code()) + ": " + e.what());
        return kExitFailure;
    }
}

int run_origin()
{
    std::cout << origin::OriginResolver::instance().current_origin_id() << std::endl;
    return kExitOk;
}

} // namespace

int run(int argc, char* argv[])
{
    if (std::getenv("TINYGUID_LOG_LEVEL") == nullptr) {
        Logger::set_level(LogLevel::WARN);
    }

    if (argc < 2 || std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return argc < 2 ? kExitUsage : kExitOk;
    }

    const std::string command = argv[1];

    try {
        if (command == "generate") {
            return run_generate(argc, argv);
        }
        if (command == "inspect") {
            return run_inspect(argc, argv);
        }
        if (command == "origin") {
            return run_origin();
        }
        throw UsageError("Unknown command: " + command);
    } catch (const UsageError& e) {
        Logger::log(LogLevel::ERROR, std::string("Usage: ") + e.what());
        std::cerr << "Run '" << argv[0] << " --help' for usage." << std::endl;
        return kExitUsage;
    } catch (const core::GuidError& e) {
        Logger::log(LogLevel::ERROR,
                    std::string(to_string(e.code())) + ": " + std::string(e.what()));
        return kExitFailure;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return kExitFailure;
    }
}

} // namespace tinyguid::tool
