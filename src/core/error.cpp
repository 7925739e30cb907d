/*
 * TINYGUID COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 *
 * This source code is licensed under the TinyGUID Community License.
 * You may not use this file except in compliance with the License.
 */

#include "tinyguid/core/error.hpp"

namespace tinyguid::core {

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::INVALID_ARGUMENT:
        return "INVALID_ARGUMENT";
    case ErrorCode::MALFORMED:
        return "MALFORMED";
    case ErrorCode::VERSION_MISMATCH:
        return "VERSION_MISMATCH";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, ErrorCode code)
{
    return os << to_string(code);
}

GuidError::GuidError(ErrorCode code, const std::string& message)
    : std::invalid_argument(message), code_(code)
{
}

} // namespace tinyguid::core
