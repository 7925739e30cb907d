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
 * @file guid.cpp
 * @brief Implementation of the identifier layout, parsers, formatters and ordering.
 *
 * @details
 * All multi-byte fields are stored big-endian so that the binary form of two
 * identifiers from the same tenant sorts by time. Parsing paths converge on
 * `Guid::validated`, which is the only place a parsed `Guid` is constructed.
 */

#include "tinyguid/core/guid.hpp"

#include "tinyguid/codec/base_codec.hpp"
#include "tinyguid/infra/string.hpp"

#include <cstring>
#include <exception>
#include <limits>
#include <string>

namespace tinyguid::core {

namespace {

constexpr std::size_t kVersionPos = 0;
constexpr std::size_t kTenantPos = 1;
constexpr std::size_t kTenantSize = 2;
constexpr std::size_t kOriginPos = 3;
constexpr std::size_t kOriginSize = 4;
constexpr std::size_t kTimePos = 7;
constexpr std::size_t kTimeSize = 6;
constexpr std::size_t kCounterPos = 13;
constexpr std::size_t kCounterSize = 3;

/// @brief Size of the ARK payload: every byte except the tenant id.
constexpr std::size_t kArkPayloadSize = kKeySize - kTenantSize;

const char kMalformed[] = "Attempted to parse malformed GUID: ";
const char kMalformedArk[] = "Attempted to parse malformed ARK GUID: ";

void store_be(Guid::Bytes& bytes, std::size_t pos, std::size_t size, std::uint64_t value)
{
    for (std::size_t i = size; i-- > 0;) {
        bytes[pos + i] = static_cast<std::uint8_t>(value & 0xFF);
        value >>= 8;
    }
}

std::uint64_t load_be(const Guid::Bytes& bytes, std::size_t pos, std::size_t size)
{
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < size; ++i) {
        value = (value << 8) | bytes[pos + i];
    }
    return value;
}

template <typename T> int three_way(T a, T b)
{
    return (a < b) ? -1 : (b < a) ? 1 : 0;
}

} // namespace

// ============================================================================
//  FACTORIES
// ============================================================================

Guid Guid::validated(const Bytes& bytes)
{
    if (bytes[kVersionPos] != kFormatVersion) {
        throw GuidError(ErrorCode::VERSION_MISMATCH,
                        "Version is incorrect: " + std::to_string(bytes[kVersionPos]));
    }
    return Guid(bytes);
}

Guid Guid::from_bytes(const std::uint8_t* data, std::size_t size)
{
    if (data == nullptr) {
        throw GuidError(ErrorCode::INVALID_ARGUMENT, "Empty argument");
    }
    if (size < kKeySize) {
        throw GuidError(ErrorCode::MALFORMED,
                        std::string(kMalformed) + "(" + std::to_string(size) + ")");
    }

    Bytes bytes;
    std::memcpy(bytes.data(), data, kKeySize);
    return validated(bytes);
}

Guid Guid::from_bytes(const std::vector<std::uint8_t>& bytes)
{
    if (bytes.size() < kKeySize) {
        throw GuidError(ErrorCode::MALFORMED,
                        std::string(kMalformed) + "(" + std::to_string(bytes.size()) + ")");
    }
    return from_bytes(bytes.data(), bytes.size());
}

Guid Guid::from_bytes(const Bytes& bytes)
{
    return validated(bytes);
}

Guid Guid::from_fields(std::int64_t tenant_id, std::int64_t origin_id, std::uint64_t timestamp,
                       std::uint32_t counter)
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
    if (timestamp > kMaxTimestamp) {
        throw GuidError(ErrorCode::INVALID_ARGUMENT,
                        "Timestamp must fit in 48 bits: " + std::to_string(timestamp));
    }
    if (counter > kMaxCounter) {
        throw GuidError(ErrorCode::INVALID_ARGUMENT,
                        "Counter must fit in 24 bits: " + std::to_string(counter));
    }

    Bytes bytes{};
    bytes[kVersionPos] = kFormatVersion;
    // Two's complement through the unsigned type of the same width.
    store_be(bytes, kTenantPos, kTenantSize, static_cast<std::uint16_t>(tenant_id));
    store_be(bytes, kOriginPos, kOriginSize, static_cast<std::uint32_t>(origin_id));
    store_be(bytes, kTimePos, kTimeSize, timestamp);
    store_be(bytes, kCounterPos, kCounterSize, counter);
    return Guid(bytes);
}

/**
 * @details
 * **Dispatch Order:**
 * 1. Trim, then reject empty input as an absent argument.
 * 2. `ark:/` prefix wins over length dispatch (ARK strings have variable length).
 * 3. Exact length selects the decoder; any other length is malformed.
 * 4. Decoder failures are rethrown as `MALFORMED` with the `DecodeError` nested.
 * 5. The version byte is checked last, after the bytes are structurally sound.
 */
Guid Guid::parse(std::string_view text)
{
    const std::string id = infra::String::trim(std::string(text));
    if (id.empty()) {
        throw GuidError(ErrorCode::INVALID_ARGUMENT, "Empty argument");
    }

    if (infra::String::starts_with(id, kArkPrefix)) {
        return parse_ark(id);
    }

    std::vector<std::uint8_t> decoded;
    try {
        switch (id.size()) {
        case kHexSize:
            decoded = codec::BaseCodec::decode_hex(id);
            break;
        case kBase32Size:
            decoded = codec::BaseCodec::decode_base32(id);
            break;
        case kBase64Size:
            decoded = codec::BaseCodec::decode_base64url(id);
            break;
        default:
            throw GuidError(ErrorCode::MALFORMED, std::string(kMalformed) + "(" +
                                                      std::to_string(id.size()) + ") " + id);
        }
    } catch (const codec::DecodeError&) {
        std::throw_with_nested(GuidError(ErrorCode::MALFORMED, kMalformed + id));
    }

    return from_bytes(decoded);
}

Guid Guid::parse_ark(const std::string& text)
{
    const std::string_view rest = std::string_view(text).substr(kArkPrefix.size());

    const std::size_t separator = rest.find('/');
    if (separator == std::string_view::npos || separator == 0) {
        throw GuidError(ErrorCode::MALFORMED, kMalformedArk + text);
    }

    // Only the canonical decimal written by `to_ark()`: no "-0", no leading zeros.
    const std::string_view segment = rest.substr(0, separator);
    std::int64_t tenant = 0;
    if (!infra::String::parse_int64(segment, tenant) ||
        tenant < std::numeric_limits<std::int16_t>::min() ||
        tenant > std::numeric_limits<std::int16_t>::max() ||
        std::to_string(tenant) != segment) {
        throw GuidError(ErrorCode::MALFORMED, kMalformedArk + text);
    }

    std::vector<std::uint8_t> payload;
    try {
        payload = codec::BaseCodec::decode_base32(rest.substr(separator + 1));
    } catch (const codec::DecodeError&) {
        std::throw_with_nested(GuidError(ErrorCode::MALFORMED, kMalformedArk + text));
    }
    if (payload.size() != kArkPayloadSize) {
        throw GuidError(ErrorCode::MALFORMED, kMalformedArk + text);
    }

    Bytes bytes;
    bytes[kVersionPos] = payload[0];
    store_be(bytes, kTenantPos, kTenantSize, static_cast<std::uint16_t>(tenant));
    std::memcpy(bytes.data() + kOriginPos, payload.data() + 1, kArkPayloadSize - 1);
    return validated(bytes);
}

std::optional<Guid> Guid::try_parse(std::string_view text, ErrorCode* code)
{
    try {
        return parse(text);
    } catch (const GuidError& e) {
        if (code != nullptr) {
            *code = e.code();
        }
        return std::nullopt;
    }
}

// ============================================================================
//  ACCESSORS
// ============================================================================

std::uint8_t Guid::version() const
{
    return bytes_[kVersionPos];
}

std::int16_t Guid::tenant_id() const
{
    return static_cast<std::int16_t>(
        static_cast<std::uint16_t>(load_be(bytes_, kTenantPos, kTenantSize)));
}

std::int32_t Guid::origin_id() const
{
    return static_cast<std::int32_t>(
        static_cast<std::uint32_t>(load_be(bytes_, kOriginPos, kOriginSize)));
}

std::uint64_t Guid::timestamp() const
{
    return load_be(bytes_, kTimePos, kTimeSize);
}

std::uint32_t Guid::counter() const
{
    return static_cast<std::uint32_t>(load_be(bytes_, kCounterPos, kCounterSize));
}

std::array<std::uint8_t, 6> Guid::origin_id_bytes() const
{
    std::array<std::uint8_t, 6> out{};
    std::memcpy(out.data() + 2, bytes_.data() + kOriginPos, kOriginSize);
    return out;
}

// ============================================================================
//  FORMATTING
// ============================================================================

std::string Guid::to_hex() const
{
    return codec::BaseCodec::encode_hex({bytes_.begin(), bytes_.end()});
}

std::string Guid::to_base32() const
{
    return codec::BaseCodec::encode_base32({bytes_.begin(), bytes_.end()});
}

std::string Guid::to_base64() const
{
    return codec::BaseCodec::encode_base64url({bytes_.begin(), bytes_.end()});
}

std::string Guid::to_ark() const
{
    return std::string(kArkPrefix) + std::to_string(tenant_id()) + "/" + to_ark_name();
}

std::string Guid::to_ark_name() const
{
    std::vector<std::uint8_t> payload;
    payload.reserve(kArkPayloadSize);
    payload.push_back(bytes_[kVersionPos]);
    payload.insert(payload.end(), bytes_.begin() + kOriginPos, bytes_.end());
    return codec::BaseCodec::encode_base32(payload);
}

// ============================================================================
//  ORDERING
// ============================================================================

int Guid::compare(const Guid& other) const
{
    if (int c = three_way(tenant_id(), other.tenant_id()); c != 0) {
        return c;
    }
    if (int c = three_way(timestamp(), other.timestamp()); c != 0) {
        return c;
    }
    if (int c = three_way(counter(), other.counter()); c != 0) {
        return c;
    }
    // Same (tenant, time, counter): only identical bytes are equal; origin and
    // version decide the rest so that the order stays antisymmetric.
    const int c = std::memcmp(bytes_.data(), other.bytes_.data(), kKeySize);
    return three_way(c, 0);
}

} // namespace tinyguid::core

/**
 * @details
 * 64-bit FNV-1a over the 16 bytes: stable across runs and platforms.
 */
std::size_t std::hash<tinyguid::core::Guid>::operator()(const tinyguid::core::Guid& guid) const
{
    std::uint64_t h = 14695981039346656037ULL;
    for (std::uint8_t b : guid.bytes()) {
        h ^= b;
        h *= 1099511628211ULL;
    }
    return static_cast<std::size_t>(h);
}
