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
 * @file cli.hpp
 * @brief Command dispatcher behind the `tinyguidctl` executable.
 */

#pragma once

namespace tinyguid::tool {

/// @brief Exit code for success.
inline constexpr int kExitOk = 0;
/// @brief Exit code for identifier or system errors.
inline constexpr int kExitFailure = 1;
/// @brief Exit code for command line mistakes.
inline constexpr int kExitUsage = 2;

/**
 * @brief Runs one `tinyguidctl` invocation.
 *
 * @details
 * Command output goes to `std::cout`, one record per line. Unless
 * `TINYGUID_LOG_LEVEL` is set, the log threshold is raised to WARN first so
 * that informational records never mix with the output stream.
 *
 * @param argc Argument count, as received by `main`.
 * @param argv Argument vector; `argv[0]` is the program name.
 * @return One of `kExitOk`, `kExitFailure`, `kExitUsage`.
 */
int run(int argc, char* argv[]);

} // namespace tinyguid::tool
