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
 * @file counter.cpp
 * @brief Implementation of the wrapping collision counter.
 */

#include "tinyguid/core/counter.hpp"

#include "tinyguid/core/error.hpp"
#include "tinyguid/infra/logger.hpp"

#include <string>

namespace tinyguid::core {

Counter::Counter(std::uint32_t start) : value_(start)
{
    if (start > kMax) {
        throw GuidError(ErrorCode::INVALID_ARGUMENT,
                        "Counter start must be between 0 and 2^24-1: " + std::to_string(start));
    }
}

/**
 * @details
 * The loop retries only when another thread won the race for the same value; a
 * failed `compare_exchange_weak` reloads `current`, so every iteration works on
 * fresh state. The successful exchange is the linearization point.
 */
std::uint32_t Counter::next()
{
    std::uint32_t current = value_.load(std::memory_order_relaxed);
    std::uint32_t successor = 0;

    do {
        successor = (current == kMax) ? 0 : current + 1;
    } while (!value_.compare_exchange_weak(current, successor, std::memory_order_acq_rel,
                                           std::memory_order_relaxed));

    if (successor == 0) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Counter: wrapped around after 2^24 draws");
    }
    return current;
}

std::uint32_t Counter::peek() const
{
    return value_.load(std::memory_order_relaxed);
}

} // namespace tinyguid::core
