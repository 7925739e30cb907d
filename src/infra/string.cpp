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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "tinyguid/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace tinyguid::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * Implementation Strategy:
 * 1. **Linear Prefix Scan**: Identifies the first non-whitespace character.
 * 2. **Empty State Detection**: Early exit when the string is all whitespace.
 * 3. **Linear Suffix Scan**: Identifies the last non-whitespace character.
 * 4. **Range Construction**: Copies the range into a new `std::string`.
 *
 * @note `static_cast<unsigned char>` keeps `std::isspace` defined for bytes
 * above 0x7F on platforms where `char` is signed.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool String::starts_with(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

/**
 * @details
 * `std::from_chars` already rejects a leading `+` and whitespace; the remaining
 * work is making sure the whole input was consumed and that a lone `-` fails.
 */
bool String::parse_int64(std::string_view s, std::int64_t& out)
{
    if (s.empty()) {
        return false;
    }

    std::int64_t value = 0;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, value, 10);

    if (ec != std::errc() || ptr != last) {
        return false;
    }
    out = value;
    return true;
}

} // namespace tinyguid::infra
