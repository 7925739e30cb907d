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
 * @file origin_resolver.cpp
 * @brief Implementation of the memoized origin id resolver.
 *
 * @details
 * Reads take a lock-free fast path once the value is published (`ready_` with
 * acquire/release ordering). Derivation, override and reset serialize on one mutex.
 */

#include "tinyguid/origin/origin_resolver.hpp"

#include "tinyguid/infra/logger.hpp"
#include "tinyguid/infra/string.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

namespace tinyguid::origin {

namespace {

/// @brief Per-thread engine seeded from `std::random_device`.
std::mt19937_64& engine()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    return gen;
}

std::vector<std::uint8_t> random_bytes(std::size_t count)
{
    std::uniform_int_distribution<int> dis(0, 255);
    std::vector<std::uint8_t> out(count);
    for (auto& b : out) {
        b = static_cast<std::uint8_t>(dis(engine()));
    }
    return out;
}

int hex_value(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

OriginResolver::OriginResolver(std::unique_ptr<OriginSource> source, bool read_environment)
    : source_(std::move(source)), read_environment_(read_environment)
{
    if (!source_) {
        throw std::invalid_argument("OriginResolver requires an OriginSource");
    }
}

OriginResolver& OriginResolver::instance()
{
    static OriginResolver resolver(std::make_unique<SystemOriginSource>(), true);
    return resolver;
}

std::int32_t OriginResolver::current_origin_id()
{
    if (ready_.load(std::memory_order_acquire)) {
        return origin_id_.load(std::memory_order_relaxed);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ready_.load(std::memory_order_relaxed)) {
        origin_id_.store(override_ ? *override_ : discover(), std::memory_order_relaxed);
        ready_.store(true, std::memory_order_release);
    }
    return origin_id_.load(std::memory_order_relaxed);
}

void OriginResolver::set_override(std::int32_t origin_id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    override_ = origin_id;
    origin_id_.store(origin_id, std::memory_order_relaxed);
    ready_.store(true, std::memory_order_release);

    infra::Logger::log(infra::LogLevel::INFO,
                       "Origin: origin id pinned to " + std::to_string(origin_id));
}

void OriginResolver::set_machine_id(const std::vector<std::uint8_t>& machine_id)
{
    std::vector<std::uint8_t> mac = random_bytes(kMachineIdSize);
    std::copy_n(machine_id.begin(), std::min(machine_id.size(), kMachineIdSize), mac.begin());

    std::lock_guard<std::mutex> lock(mutex_);
    machine_id_ = std::move(mac);
    if (!override_) {
        ready_.store(false, std::memory_order_release);
    }
}

void OriginResolver::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    override_.reset();
    machine_id_.clear();
    ready_.store(false, std::memory_order_release);
}

std::size_t OriginResolver::discovery_count() const
{
    return discoveries_.load(std::memory_order_relaxed);
}

bool OriginResolver::parse_machine_id(std::string_view text, std::vector<std::uint8_t>& out)
{
    std::vector<std::uint8_t> bytes;
    int high = -1;

    for (char c : text) {
        if (c == ':' || c == '-') {
            // Separators only between complete bytes.
            if (high >= 0 || bytes.empty()) {
                return false;
            }
            continue;
        }
        const int v = hex_value(c);
        if (v < 0) {
            return false;
        }
        if (high < 0) {
            high = v;
        } else {
            bytes.push_back(static_cast<std::uint8_t>((high << 4) | v));
            high = -1;
        }
    }

    if (high >= 0 || bytes.size() != kMachineIdSize) {
        return false;
    }
    out = std::move(bytes);
    return true;
}

std::int32_t OriginResolver::combine(std::int64_t process_id, const std::vector<std::uint8_t>& mac)
{
    std::uint32_t mac_int = 0;
    for (std::size_t i = 0; i < 4 && i < mac.size(); ++i) {
        mac_int |= static_cast<std::uint32_t>(mac[i]) << (8 * i);
    }
    const std::uint32_t origin = 31u * static_cast<std::uint32_t>(process_id) + mac_int;
    return static_cast<std::int32_t>(origin);
}

std::int32_t OriginResolver::discover()
{
    discoveries_.fetch_add(1, std::memory_order_relaxed);

    if (read_environment_) {
        if (const char* env = std::getenv("TINYGUID_ORIGIN_ID")) {
            std::int64_t value = 0;
            if (infra::String::parse_int64(infra::String::trim(env), value) &&
                value >= std::numeric_limits<std::int32_t>::min() &&
                value <= std::numeric_limits<std::int32_t>::max()) {
                infra::Logger::log(infra::LogLevel::INFO,
                                   "Origin: using TINYGUID_ORIGIN_ID=" + std::to_string(value));
                return static_cast<std::int32_t>(value);
            }
            infra::Logger::log(infra::LogLevel::WARN,
                               std::string("Origin: ignoring invalid TINYGUID_ORIGIN_ID '") + env +
                                   "'");
        }
    }

    const std::int64_t pid = resolve_process_id();
    const std::vector<std::uint8_t> mac = resolve_machine_id();
    const std::int32_t origin = combine(pid, mac);

    infra::Logger::log(infra::LogLevel::INFO, "Origin: resolved origin id " +
                                                  std::to_string(origin) + " (pid " +
                                                  std::to_string(pid) + ")");
    return origin;
}

std::int64_t OriginResolver::resolve_process_id()
{
    std::int64_t pid = -1;
    try {
        pid = source_->process_id();
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::WARN,
                           std::string("Origin: process id lookup failed: ") + e.what());
    }

    if (pid < 0 || pid > kMaxProcessId) {
        std::uniform_int_distribution<std::int64_t> dis(0, kMaxProcessId);
        const std::int64_t replacement = dis(engine());
        infra::Logger::log(infra::LogLevel::WARN, "Origin: unusable process id " +
                                                      std::to_string(pid) +
                                                      ", using random value " +
                                                      std::to_string(replacement));
        pid = replacement;
    }
    return pid;
}

std::vector<std::uint8_t> OriginResolver::resolve_machine_id()
{
    if (!machine_id_.empty()) {
        return machine_id_;
    }

    if (read_environment_) {
        if (const char* env = std::getenv("TINYGUID_MACHINE_ID")) {
            std::vector<std::uint8_t> parsed;
            if (parse_machine_id(infra::String::trim(env), parsed)) {
                return parsed;
            }
            infra::Logger::log(infra::LogLevel::WARN,
                               std::string("Origin: ignoring invalid TINYGUID_MACHINE_ID '") +
                                   env + "'");
        }
    }

    std::vector<std::uint8_t> mac;
    try {
        mac = source_->hardware_address();
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::WARN,
                           std::string("Origin: hardware address lookup failed: ") + e.what());
    }

    if (mac.size() < kMachineIdSize) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Origin: no usable hardware address, using random machine id");
        return random_bytes(kMachineIdSize);
    }
    mac.resize(kMachineIdSize);
    return mac;
}

} // namespace tinyguid::origin
