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
 * @file generator.hpp
 * @brief Coordination-free allocation of sortable identifiers.
 *
 * @details
 * This file declares the `Generator` class. Each generator owns its collision
 * counter, so independent generators (tests, separate subsystems) never share
 * state. `Generator::instance()` provides the process-wide default most callers use.
 */

#pragma once

#include "tinyguid/core/counter.hpp"
#include "tinyguid/core/guid.hpp"
#include "tinyguid/origin/origin_resolver.hpp"

#include <cstdint>
#include <functional>

namespace tinyguid::core {

/**
 * @class Generator
 * @brief Produces `Guid` values from a clock, a counter and an origin id.
 *
 * @details
 * **Algorithm:**
 * 1. Read the clock (Unix milliseconds), truncated to 48 bits.
 * 2. Draw the next counter value.
 * 3. Pack version, tenant, origin, timestamp and counter big-endian.
 *
 * Generation performs no I/O and takes no lock; the counter draw is the only
 * shared-state update. The origin id is resolved once by the `OriginResolver`
 * and read from memory afterwards.
 *
 * @warning Uniqueness holds while fewer than 2^24 identifiers are produced in the
 * same millisecond for the same (tenant, origin). Beyond that the counter wraps
 * and values may repeat; this is the documented capacity of the 3-byte field.
 */
class Generator {
  public:
    /// @brief Clock returning Unix milliseconds.
    using Clock = std::function<std::uint64_t()>;

    /// @brief Reads `std::chrono::system_clock` in milliseconds.
    static std::uint64_t system_clock_millis();

    /**
     * @brief Generator over the process-wide resolver and the system clock.
     */
    Generator();

    /**
     * @brief Fully injected generator.
     *
     * @param resolver Origin id provider; must outlive the generator.
     * @param clock Time source; defaults to `system_clock_millis`.
     * @param counter_start First counter value drawn.
     * @throws GuidError (`INVALID_ARGUMENT`) if @p counter_start exceeds 2^24-1.
     */
    explicit Generator(origin::OriginResolver& resolver, Clock clock = system_clock_millis,
                       std::uint32_t counter_start = 0);

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /// @brief Process-wide default generator.
    static Generator& instance();

    /// @brief Generates with tenant 0 and the resolver's origin id.
    Guid generate();

    /// @brief Generates with the resolver's origin id.
    Guid generate(std::int64_t tenant_id);

    /**
     * @brief Generates with explicit tenant and origin.
     *
     * @param tenant_id Must fit in int16.
     * @param origin_id Must fit in int32.
     * @throws GuidError (`INVALID_ARGUMENT`) on out-of-range arguments, before the
     * counter is drawn.
     *
     * @code
     * auto id = tinyguid::core::Generator::instance().generate(42, 7);
     * std::cout << id.to_ark() << std::endl; // ark:/42/...
     * @endcode
     */
    Guid generate(std::int64_t tenant_id, std::int64_t origin_id);

    /// @brief Value the next generation will draw from the counter.
    std::uint32_t peek_counter() const { return counter_.peek(); }

  private:
    origin::OriginResolver& resolver_;
    Clock clock_;
    Counter counter_;
};

} // namespace tinyguid::core
