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
 * @file generator_test.cpp
 * @brief Unit tests for identifier generation with an injected clock and origin.
 */

#include "tinyguid/core/generator.hpp"
#include "fake_origin_source.hpp"
#include "framework.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <unordered_set>
#include <vector>

using tinyguid::core::ErrorCode;
using tinyguid::core::Generator;
using tinyguid::core::Guid;
using tinyguid::origin::OriginResolver;
using tinyguid::test::FakeOriginSource;

namespace {

constexpr std::uint64_t kFixedTime = 1700000000000ULL;

std::uint64_t fixed_clock()
{
    return kFixedTime;
}

std::unique_ptr<OriginResolver> pinned_resolver(std::int32_t origin)
{
    auto resolver = std::make_unique<OriginResolver>(
        std::make_unique<FakeOriginSource>(1, std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6}));
    resolver->set_override(origin);
    return resolver;
}

} // namespace

/**
 * @brief Within one millisecond the counter alone orders identifiers.
 */
void test_generator_fixed_clock_sequence()
{
    auto resolver = pinned_resolver(77);
    Generator generator(*resolver, fixed_clock);

    const Guid first = generator.generate(5);
    const Guid second = generator.generate(5);
    const Guid third = generator.generate(5);

    ASSERT_EQ(first.timestamp(), kFixedTime);
    ASSERT_EQ(first.counter(), static_cast<std::uint32_t>(0));
    ASSERT_EQ(second.counter(), static_cast<std::uint32_t>(1));
    ASSERT_EQ(third.counter(), static_cast<std::uint32_t>(2));
    ASSERT_TRUE(first < second);
    ASSERT_TRUE(second < third);
    ASSERT_EQ(static_cast<int>(first.tenant_id()), 5);
    ASSERT_EQ(first.origin_id(), 77);
}

/**
 * @brief Defaults: tenant 0 and the resolver's origin id.
 */
void test_generator_uses_resolver_origin()
{
    auto resolver = pinned_resolver(-123);
    Generator generator(*resolver, fixed_clock);

    const Guid g = generator.generate();
    ASSERT_EQ(static_cast<int>(g.tenant_id()), 0);
    ASSERT_EQ(g.origin_id(), -123);
    ASSERT_EQ(static_cast<int>(g.version()), 2);
}

/**
 * @brief The counter wraps to 0 after 2^24-1 without failing generation.
 */
void test_generator_counter_wraps()
{
    auto resolver = pinned_resolver(1);
    Generator generator(*resolver, fixed_clock, tinyguid::core::kMaxCounter);

    ASSERT_EQ(generator.generate().counter(), tinyguid::core::kMaxCounter);
    ASSERT_EQ(generator.generate().counter(), static_cast<std::uint32_t>(0));
    ASSERT_THROWS_CODE(Generator(*resolver, fixed_clock, tinyguid::core::kMaxCounter + 1),
                       ErrorCode::INVALID_ARGUMENT);
}

/**
 * @brief Clock values wider than 48 bits are truncated to their low 48 bits.
 */
void test_generator_truncates_timestamp()
{
    auto resolver = pinned_resolver(1);
    Generator generator(*resolver, []() { return (1ULL << 48) + 5; });
    ASSERT_EQ(generator.generate().timestamp(), static_cast<std::uint64_t>(5));
}

/**
 * @brief Out-of-range arguments fail before a counter value is consumed.
 */
void test_generator_rejects_out_of_range()
{
    auto resolver = pinned_resolver(1);
    Generator generator(*resolver, fixed_clock);
    generator.generate();
    const std::uint32_t before = generator.peek_counter();

    ASSERT_THROWS_CODE(generator.generate(32768), ErrorCode::INVALID_ARGUMENT);
    ASSERT_THROWS_CODE(generator.generate(-32769), ErrorCode::INVALID_ARGUMENT);
    ASSERT_THROWS_CODE(generator.generate(0, 2147483648LL), ErrorCode::INVALID_ARGUMENT);
    ASSERT_THROWS_CODE(generator.generate(0, -2147483649LL), ErrorCode::INVALID_ARGUMENT);

    ASSERT_EQ(generator.peek_counter(), before);
    ASSERT_EQ(generator.generate(-32768, -2147483648LL).counter(), before);
}

/**
 * @brief Concurrent generation on a frozen clock yields distinct identifiers.
 */
void test_generator_concurrent_uniqueness()
{
    auto resolver = pinned_resolver(9);
    Generator generator(*resolver, fixed_clock);
    const std::size_t threads_size = 8;
    const std::size_t per_thread = 5000;

    std::vector<std::vector<Guid>> produced(threads_size);
    {
        std::vector<std::thread> threads;
        for (std::size_t t = 0; t < threads_size; ++t) {
            threads.emplace_back([&generator, &produced, t, per_thread]() {
                produced[t].reserve(per_thread);
                for (std::size_t i = 0; i < per_thread; ++i) {
                    produced[t].push_back(generator.generate(3));
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    }

    std::unordered_set<Guid> unique;
    for (const auto& batch : produced) {
        ASSERT_TRUE(std::is_sorted(batch.begin(), batch.end()));
        unique.insert(batch.begin(), batch.end());
    }
    ASSERT_EQ(unique.size(), threads_size * per_thread);
}

/**
 * @brief The system clock yields a plausible, non-decreasing millisecond value.
 */
void test_generator_system_clock()
{
    const std::uint64_t a = Generator::system_clock_millis();
    const std::uint64_t b = Generator::system_clock_millis();
    // 2020-01-01T00:00:00Z
    ASSERT_TRUE(a > 1577836800000ULL);
    ASSERT_TRUE(b >= a);
}
