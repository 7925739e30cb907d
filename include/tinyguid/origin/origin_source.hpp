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
 * @file origin_source.hpp
 * @brief Platform abstraction for host and process identity.
 *
 * @details
 * `OriginSource` is the only seam through which TinyGUID touches the operating
 * system. The identifier core never includes a platform header; it asks an
 * `OriginResolver`, which in turn asks one `OriginSource` implementation.
 */

#pragma once

#include <cstdint>
#include <vector>

namespace tinyguid::origin {

/**
 * @class OriginSource
 * @brief Interface reporting the raw facts an origin id is derived from.
 */
class OriginSource {
  public:
    virtual ~OriginSource() = default;

    /// @brief Identifier of the running process, or a negative value when unknown.
    virtual std::int64_t process_id() = 0;

    /**
     * @brief Hardware address of the best network interface.
     * @return The address bytes (normally 6), or an empty vector when none qualifies.
     */
    virtual std::vector<std::uint8_t> hardware_address() = 0;
};

/**
 * @class SystemOriginSource
 * @brief Linux implementation based on `getpid()` and `getifaddrs()`.
 *
 * @details
 * **Interface selection:** loopback interfaces and interfaces without an IPv4 or
 * IPv6 address are ignored. Candidates must be at least 6 bytes long, must not
 * consist only of 0x00/0x01 bytes and must not be multicast. Globally administered
 * addresses beat locally administered ones; between equals, the interface with the
 * better-scoped IP address wins (global > site-local > link-local > multicast >
 * unspecified), then the longer address.
 */
class SystemOriginSource : public OriginSource {
  public:
    std::int64_t process_id() override;
    std::vector<std::uint8_t> hardware_address() override;

    /**
     * @brief Ranks two hardware addresses.
     * @return Positive when @p current is better, zero when undecided, negative when
     * @p candidate is better. An empty @p current loses to any valid candidate.
     */
    static int compare_addresses(const std::vector<std::uint8_t>& current,
                                 const std::vector<std::uint8_t>& candidate);
};

} // namespace tinyguid::origin
