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
 * @file counter.hpp
 * @brief Lock-free 24-bit collision counter.
 *
 * @details
 * The counter disambiguates identifiers produced by one generator within the same
 * millisecond. It is owned by a `Generator` instance rather than shared globally,
 * so independent generators never observe each other's draws.
 */

#pragma once

#include <atomic>
#include <cstdint>

namespace tinyguid::core {

/**
 * @class Counter
 * @brief A wrapping counter over `[0, 2^24 - 1]` safe for any number of threads.
 *
 * @details
 * **Draw protocol:**
 * - Holding the maximum value: the draw resets the counter to 0 and returns the maximum.
 * - Otherwise: the draw increments the counter and returns the pre-increment value.
 *
 * Each draw is one compare-and-swap on a `std::atomic<uint32_t>`, so draws are
 * linearizable and no two concurrent draws return the same value until the
 * counter has wrapped around.
 *
 * @warning More than 2^24 draws within one millisecond repeat values. This is part
 * of the identifier contract (the field is 3 bytes wide), not a defect.
 */
class Counter {
  public:
    /// @brief Largest value the counter ever returns.
    static constexpr std::uint32_t kMax = (1u << 24) - 1;

    /**
     * @brief Creates a counter whose first draw returns @p start.
     * @throws GuidError (`INVALID_ARGUMENT`) if @p start exceeds `kMax`.
     */
    explicit Counter(std::uint32_t start = 0);

    Counter(const Counter&) = delete;
    Counter& operator=(const Counter&) = delete;

    /// @brief Draws the next value according to the protocol above.
    std::uint32_t next();

    /// @brief Returns the value the next draw will return (racy by nature).
    std::uint32_t peek() const;

  private:
    std::atomic<std::uint32_t> value_;
};

} // namespace tinyguid::core
