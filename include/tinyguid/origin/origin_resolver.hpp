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
 * @file origin_resolver.hpp
 * @brief Memoized resolution of the 32-bit origin id.
 *
 * @details
 * The origin id distinguishes the producing host and process inside every
 * identifier. It is derived once from the process id and a hardware address,
 * then served from memory: generating an identifier never queries the OS.
 */

#pragma once

#include "tinyguid/origin/origin_source.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace tinyguid::origin {

/**
 * @class OriginResolver
 * @brief Thread-safe, lazily-initialized origin id with manual override.
 *
 * @details
 * **Derivation** (first call to `current_origin_id`, or first call after `reset`):
 * 1. `TINYGUID_ORIGIN_ID`, when environment reading is enabled and the value is a
 *    valid int32, is used as is.
 * 2. The process id comes from the source; values outside `[0, 0xFFFFFF]` are
 *    replaced by a random value in that range.
 * 3. The hardware address is, in order: the one given to `set_machine_id`,
 *    `TINYGUID_MACHINE_ID` (environment reading enabled), the source's answer, or
 *    6 random bytes.
 * 4. `origin = 31 * pid + (mac[3] << 24 | mac[2] << 16 | mac[1] << 8 | mac[0])`,
 *    computed modulo 2^32.
 *
 * Failures of the source (including exceptions) are logged at WARN and replaced
 * by randomness; resolution itself never fails.
 */
class OriginResolver {
  public:
    /// @brief Number of hardware address bytes retained.
    static constexpr std::size_t kMachineIdSize = 6;

    /// @brief Largest process id kept as is.
    static constexpr std::int64_t kMaxProcessId = 0xFFFFFF;

    /**
     * @brief Creates a resolver over @p source.
     *
     * @param source Platform facts provider; must not be null.
     * @param read_environment Whether `TINYGUID_ORIGIN_ID` and `TINYGUID_MACHINE_ID`
     * are consulted.
     * @throws std::invalid_argument If @p source is null.
     */
    explicit OriginResolver(std::unique_ptr<OriginSource> source, bool read_environment = false);

    OriginResolver(const OriginResolver&) = delete;
    OriginResolver& operator=(const OriginResolver&) = delete;

    /**
     * @brief Process-wide resolver over `SystemOriginSource`, reading the environment.
     */
    static OriginResolver& instance();

    /// @brief Returns the memoized origin id, deriving it on first use.
    std::int32_t current_origin_id();

    /**
     * @brief Pins the origin id to @p origin_id until `reset()`.
     *
     * For deployments where automatic detection is unreliable, e.g. containers
     * sharing virtual MAC addresses.
     */
    void set_override(std::int32_t origin_id);

    /**
     * @brief Replaces the discovered hardware address.
     *
     * Only the first 6 bytes are used; missing bytes are filled randomly and an
     * empty vector selects a fully random address. Takes effect on the next
     * resolution unless an override is active.
     */
    void set_machine_id(const std::vector<std::uint8_t>& machine_id);

    /// @brief Forgets the memoized value, the override and the machine id.
    void reset();

    /// @brief Number of derivations performed so far (discoveries, not lookups).
    std::size_t discovery_count() const;

    /**
     * @brief Parses a textual hardware address.
     *
     * Accepts exactly 12 hexadecimal digits, optionally separated by `:` or `-`
     * (e.g. `00:1a:2b:3c:4d:5e`).
     *
     * @return true On success, with the 6 bytes stored in @p out.
     */
    static bool parse_machine_id(std::string_view text, std::vector<std::uint8_t>& out);

    /// @brief Combines a process id and a hardware address into an origin id.
    static std::int32_t combine(std::int64_t process_id, const std::vector<std::uint8_t>& mac);

  private:
    /// @brief Runs the derivation. Caller holds `mutex_`.
    std::int32_t discover();

    std::int64_t resolve_process_id();
    std::vector<std::uint8_t> resolve_machine_id();

    std::unique_ptr<OriginSource> source_;
    bool read_environment_;

    std::mutex mutex_;
    std::atomic<bool> ready_{false};
    std::atomic<std::int32_t> origin_id_{0};
    std::atomic<std::size_t> discoveries_{0};

    // Guarded by mutex_.
    std::optional<std::int32_t> override_;
    std::vector<std::uint8_t> machine_id_;
};

} // namespace tinyguid::origin
