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
 * @file origin_source.cpp
 * @brief Linux host/process identity discovery.
 *
 * @details
 * Walks the `getifaddrs()` list once, grouping link-layer (`AF_PACKET`) and
 * network-layer (`AF_INET`, `AF_INET6`) entries by interface name, then picks the
 * best hardware address among interfaces that carry an IP address.
 */

#include "tinyguid/origin/origin_source.hpp"

#include "tinyguid/infra/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <netpacket/packet.h>
#include <unistd.h>

namespace tinyguid::origin {

namespace {

/// @brief Owns the list returned by `getifaddrs()`.
struct IfAddrsDeleter {
    void operator()(ifaddrs* list) const { freeifaddrs(list); }
};

using IfAddrsPtr = std::unique_ptr<ifaddrs, IfAddrsDeleter>;

struct Candidate {
    std::string name;
    std::vector<std::uint8_t> mac;
    int score = -1;
};

/**
 * @brief Scores an IP address by scope.
 *
 * 0 unspecified, 1 multicast, 2 link-local, 3 site-local (private), 4 global.
 */
int score_address(const sockaddr* addr)
{
    if (addr->sa_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(addr);
        const std::uint32_t ip = ntohl(in->sin_addr.s_addr);
        if (ip == 0) {
            return 0;
        }
        if ((ip >> 28) == 0xE) {
            return 1;
        }
        if ((ip >> 16) == 0xA9FE) {
            return 2;
        }
        if ((ip >> 24) == 10 || (ip >> 20) == 0xAC1 || (ip >> 16) == 0xC0A8) {
            return 3;
        }
        return 4;
    }

    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
    if (IN6_IS_ADDR_UNSPECIFIED(&in6->sin6_addr)) {
        return 0;
    }
    if (IN6_IS_ADDR_MULTICAST(&in6->sin6_addr)) {
        return 1;
    }
    if (IN6_IS_ADDR_LINKLOCAL(&in6->sin6_addr)) {
        return 2;
    }
    if (IN6_IS_ADDR_SITELOCAL(&in6->sin6_addr)) {
        return 3;
    }
    return 4;
}

Candidate& candidate_for(std::vector<Candidate>& candidates, const char* name)
{
    auto it = std::find_if(candidates.begin(), candidates.end(),
                           [name](const Candidate& c) { return c.name == name; });
    if (it != candidates.end()) {
        return *it;
    }
    candidates.push_back(Candidate{name, {}, -1});
    return candidates.back();
}

} // namespace

std::int64_t SystemOriginSource::process_id()
{
    return static_cast<std::int64_t>(::getpid());
}

int SystemOriginSource::compare_addresses(const std::vector<std::uint8_t>& current,
                                          const std::vector<std::uint8_t>& candidate)
{
    // Must be EUI-48 or longer.
    if (candidate.size() < 6) {
        return 1;
    }
    const bool only_zero_and_one = std::all_of(candidate.begin(), candidate.end(),
                                               [](std::uint8_t b) { return b == 0 || b == 1; });
    if (only_zero_and_one) {
        return 1;
    }
    if ((candidate[0] & 0x01) != 0) {
        return 1; // multicast
    }
    if (current.empty()) {
        return -1;
    }

    // Bit 1 of the first octet set means locally administered.
    const bool current_global = (current[0] & 0x02) == 0;
    const bool candidate_global = (candidate[0] & 0x02) == 0;
    if (current_global == candidate_global) {
        return 0;
    }
    return current_global ? 1 : -1;
}

std::vector<std::uint8_t> SystemOriginSource::hardware_address()
{
    ifaddrs* raw = nullptr;
    if (getifaddrs(&raw) != 0) {
        infra::Logger::log(infra::LogLevel::WARN, std::string("Origin: getifaddrs failed: ") +
                                                      std::strerror(errno));
        return {};
    }
    IfAddrsPtr list(raw);

    std::vector<Candidate> candidates;
    for (const ifaddrs* ifa = list.get(); ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_name == nullptr ||
            (ifa->ifa_flags & IFF_LOOPBACK) != 0) {
            continue;
        }

        const int family = ifa->ifa_addr->sa_family;
        if (family == AF_PACKET) {
            const auto* ll = reinterpret_cast<const sockaddr_ll*>(ifa->ifa_addr);
            Candidate& c = candidate_for(candidates, ifa->ifa_name);
            c.mac.assign(ll->sll_addr, ll->sll_addr + ll->sll_halen);
        } else if (family == AF_INET || family == AF_INET6) {
            Candidate& c = candidate_for(candidates, ifa->ifa_name);
            c.score = std::max(c.score, score_address(ifa->ifa_addr));
        }
    }

    std::vector<std::uint8_t> best;
    int best_score = -1;
    std::string best_name;

    for (const Candidate& c : candidates) {
        if (c.score < 0 || c.mac.empty()) {
            continue;
        }

        bool replace = false;
        const int res = compare_addresses(best, c.mac);
        if (res < 0) {
            replace = true;
        } else if (res == 0) {
            const int by_scope = best_score - c.score;
            replace = by_scope < 0 || (by_scope == 0 && best.size() < c.mac.size());
        }

        if (replace) {
            best = c.mac;
            best_score = c.score;
            best_name = c.name;
        }
    }

    if (!best.empty()) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Origin: using hardware address of interface '" + best_name + "'");
    }
    return best;
}

} // namespace tinyguid::origin
