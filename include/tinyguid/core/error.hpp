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
 * @file error.hpp
 * @brief Error taxonomy of the identifier core.
 *
 * @details
 * Every failure raised by `Guid`, `Counter` and `Generator` is a `GuidError`
 * carrying one of three `ErrorCode` values. Callers branch on `code()`; the
 * message text is for humans only.
 */

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace tinyguid::core {

/**
 * @enum ErrorCode
 * @brief Classification of identifier failures.
 */
enum class ErrorCode {
    INVALID_ARGUMENT, ///< Absent input, or a tenant/origin/timestamp/counter out of range.
    MALFORMED,        ///< Wrong length, undecodable text or bad ARK syntax.
    VERSION_MISMATCH  ///< Structurally valid bytes written by another format version.
};

/// @brief Returns the stable upper-case name of @p code (e.g. `"MALFORMED"`).
const char* to_string(ErrorCode code);

std::ostream& operator<<(std::ostream& os, ErrorCode code);

/**
 * @class GuidError
 * @brief Exception raised by the identifier core.
 *
 * @details
 * When the failure originates in the Base Codec, the `codec::DecodeError` is kept
 * as a nested exception (see `std::rethrow_if_nested`).
 */
class GuidError : public std::invalid_argument {
  public:
    GuidError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

  private:
    ErrorCode code_;
};

} // namespace tinyguid::core
