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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` used by the identifier parser, the configuration readers and
 * the command line tool.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tinyguid::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * Whitespace is what `std::isspace` reports in the "C" locale: space, `\t`,
     * `\n`, `\r`, `\v` and `\f`.
     *
     * @param s The source string to process.
     * @return std::string A new string containing the trimmed content, empty when
     * @p s consists solely of whitespace.
     *
     * @code
     * std::string clean = tinyguid::infra::String::trim("  ark:/42/AE \n"); // "ark:/42/AE"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief Returns an ASCII lower-cased copy of @p s.
    static std::string to_lower(std::string s);

    /// @brief Returns true when @p s begins with @p prefix.
    static bool starts_with(std::string_view s, std::string_view prefix);

    /**
     * @brief Parses a strict signed decimal integer.
     *
     * Accepts an optional leading `-` followed by one or more ASCII digits and
     * nothing else: no sign `+`, no whitespace, no hexadecimal prefix.
     *
     * @param s The text to parse.
     * @param out Receives the value on success; untouched otherwise.
     * @return true If the whole of @p s was a decimal integer that fits in 64 bits.
     */
    static bool parse_int64(std::string_view s, std::int64_t& out);
};

} // namespace tinyguid::infra
