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
 * @file generator.cpp
 * @brief Implementation of the identifier generation algorithm.
 */

#include "tinyguid/core/generator.hpp"

#include "tinyguid/core/error.hpp"

#include <chrono>
#include <limits>
#include <string>
#include <utility>

namespace tinyguid::core {

std::uint64_t Generator::system_clock_millis()
{
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

Generator::Generator() : Generator(origin::OriginResolver::instance()) {}

Generator::Generator(origin::OriginResolver& resolver, Clock clock, std::uint32_t counter_start)
    : resolver_(resolver), clock_(std::move(clock)), counter_(counter_start)
{
    if (!clock_) {
        clock_ = system_clock_millis;
    }
}

Generator& Generator::instance()
{
    static Generator generator;
    return generator;
}

Guid Generator::generate()
{
    return generate(0, resolver_.current_origin_id());
}

Guid Generator::generate(std::int64_t tenant_id)
{
    return generate(tenant_id, resolver_.current_origin_id());
}

/**
 * @details
 * Arguments are validated before the counter is drawn so that a rejected call
 * leaves no trace. Once validated, `Guid::from_fields` cannot fail: the
 * timestamp is masked to 48 bits and the counter never exceeds 2^24-1.
 */
Guid Generator::generate(std::int64_t tenant_id, std::int64_t origin_id)
{
    if (tenant_id < std::numeric_limits<std::int16_t>::min() ||
        tenant_id > std::numeric_limits<std::int16_t>::max()) {
        throw GuidError(ErrorCode::INVALID_ARGUMENT,
                        "TenantId must be between -2^15 and 2^15-1: " + std::to_string(tenant_id));
    }
    if (origin_id < std::numeric_limits<std::int32_t>::min() ||
        origin_id > std::numeric_limits<std::int32_t>::max()) {
        throw GuidError(ErrorCode::INVALID_ARGUMENT,
                        "OriginId must be between -2^31 and 2^31-1: " + std::to_string(origin_id));
    }

    const std::uint64_t time = clock_() & kMaxTimestamp;
    const std::uint32_t count = counter_.next();
    return Guid::from_fields(tenant_id, origin_id, time, count);
}

} // namespace tinyguid::core
