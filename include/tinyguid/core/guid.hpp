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
 * @file guid.hpp
 * @brief The 16-byte sortable identifier value type.
 *
 * @details
 * A `Guid` packs five big-endian fields into 16 bytes:
 *
 * | Field     | Offset | Size | Type                          |
 * |-----------|--------|------|-------------------------------|
 * | version   | 0      | 1    | uint8, always `kFormatVersion`|
 * | tenant id | 1      | 2    | int16 (two's complement)      |
 * | origin id | 3      | 4    | int32 (two's complement)      |
 * | timestamp | 7      | 6    | uint48, Unix milliseconds     |
 * | counter   | 13     | 3    | uint24                        |
 *
 * Values are immutable. Every instance, however it was obtained, carries the
 * current format version: constructors and parsers validate before anything is
 * returned, and no default (nil) identifier exists.
 */

#pragma once

#include "tinyguid/core/error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace tinyguid::core {

/// @brief Version byte written and accepted by this implementation.
inline constexpr std::uint8_t kFormatVersion = 2;

/// @brief Size of the binary form, in bytes.
inline constexpr std::size_t kKeySize = 16;

/// @brief Exact lengths of the fixed-size text forms.
inline constexpr std::size_t kHexSize = 32;
inline constexpr std::size_t kBase32Size = 26;
inline constexpr std::size_t kBase64Size = 22;

/// @brief Literal prefix of the ARK form.
inline constexpr std::string_view kArkPrefix = "ark:/";

/// @brief Largest timestamp representable in 6 bytes.
inline constexpr std::uint64_t kMaxTimestamp = (std::uint64_t{1} << 48) - 1;

/// @brief Largest counter representable in 3 bytes.
inline constexpr std::uint32_t kMaxCounter = (1u << 24) - 1;

/**
 * @class Guid
 * @brief Immutable 16-byte identifier ordered by (tenant, timestamp, counter).
 */
class Guid {
  public:
    using Bytes = std::array<std::uint8_t, kKeySize>;

    // ========================================================================
    //  FACTORIES
    // ========================================================================

    /**
     * @brief Parses any accepted text form.
     *
     * Surrounding whitespace is ignored. Dispatch:
     * - `ark:/<tenant>/<base32 of 14 bytes>`: ARK form. The tenant must be written
     *   exactly as `to_ark()` writes it (no `+`, no `-0`, no leading zeros).
     * - 32 characters: hexadecimal.
     * - 26 characters: Base32.
     * - 22 characters: Base64url without padding.
     *
     * @throws GuidError `INVALID_ARGUMENT` for empty input, `MALFORMED` for any
     * other length or undecodable text (the codec error is nested),
     * `VERSION_MISMATCH` when the decoded version byte is not `kFormatVersion`.
     *
     * @code
     * auto id = tinyguid::core::Guid::parse("ark:/42/AIAAAAAAAAAAAAAAAAAAAAA");
     * @endcode
     */
    static Guid parse(std::string_view text);

    /**
     * @brief Non-throwing variant of `parse`.
     *
     * @param text The text to parse.
     * @param code When not null, receives the failure kind on error.
     * @return The identifier, or `std::nullopt` on failure.
     */
    static std::optional<Guid> try_parse(std::string_view text, ErrorCode* code = nullptr);

    /**
     * @brief Builds an identifier from its binary form.
     *
     * Only the first 16 bytes are used; trailing bytes are ignored.
     *
     * @throws GuidError `INVALID_ARGUMENT` if @p data is null, `MALFORMED` if
     * @p size is below 16, `VERSION_MISMATCH` on a foreign version byte.
     */
    static Guid from_bytes(const std::uint8_t* data, std::size_t size);

    /// @overload
    static Guid from_bytes(const std::vector<std::uint8_t>& bytes);

    /// @overload
    static Guid from_bytes(const Bytes& bytes);

    /**
     * @brief Deterministic construction from field values (backfills, tests).
     *
     * @param tenant_id Must fit in int16.
     * @param origin_id Must fit in int32.
     * @param timestamp Unix milliseconds, at most `kMaxTimestamp`.
     * @param counter At most `kMaxCounter`.
     * @throws GuidError `INVALID_ARGUMENT` if any field is out of range.
     */
    static Guid from_fields(std::int64_t tenant_id, std::int64_t origin_id,
                            std::uint64_t timestamp, std::uint32_t counter);

    /// @brief Size of the binary form (always 16).
    static std::size_t key_size() { return kKeySize; }

    // ========================================================================
    //  ACCESSORS
    // ========================================================================

    std::uint8_t version() const;
    std::int16_t tenant_id() const;
    std::int32_t origin_id() const;

    /// @brief Unix milliseconds at generation time (48 significant bits).
    std::uint64_t timestamp() const;

    /// @brief Collision counter (24 significant bits).
    std::uint32_t counter() const;

    /// @brief Copy of the 16-byte binary form.
    Bytes bytes() const { return bytes_; }

    /// @brief Origin id as a 6-byte platform id: two zero bytes then the 4 origin bytes.
    std::array<std::uint8_t, 6> origin_id_bytes() const;

    // ========================================================================
    //  FORMATTING
    // ========================================================================

    /// @brief 32 lowercase hexadecimal characters.
    std::string to_hex() const;

    /// @brief 26 Base32 characters; the default text form.
    std::string to_base32() const;

    /// @brief 22 Base64url characters, no padding.
    std::string to_base64() const;

    /// @brief `ark:/<tenant>/<ark name>`.
    std::string to_ark() const;

    /// @brief Base32 of the 14 non-tenant bytes (version, origin, timestamp, counter).
    std::string to_ark_name() const;

    /// @brief Same as `to_base32()`.
    std::string to_string() const { return to_base32(); }

    // ========================================================================
    //  ORDERING
    // ========================================================================

    /**
     * @brief Three-way comparison.
     *
     * Orders by tenant id (signed), then timestamp, then counter. When those
     * three are equal the raw bytes decide: identical bytes compare equal, any
     * other pair gets a deterministic, antisymmetric order.
     *
     * @return Negative, zero or positive like `std::memcmp`.
     */
    int compare(const Guid& other) const;

    bool operator==(const Guid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Guid& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Guid& other) const { return compare(other) < 0; }
    bool operator<=(const Guid& other) const { return compare(other) <= 0; }
    bool operator>(const Guid& other) const { return compare(other) > 0; }
    bool operator>=(const Guid& other) const { return compare(other) >= 0; }

    friend std::ostream& operator<<(std::ostream& os, const Guid& guid)
    {
        return os << guid.to_base32();
    }

  private:
    explicit Guid(const Bytes& bytes) : bytes_(bytes) {}

    /// @brief Checks the version byte and wraps the bytes in a `Guid`.
    static Guid validated(const Bytes& bytes);

    static Guid parse_ark(const std::string& text);

    Bytes bytes_;
};

} // namespace tinyguid::core

/**
 * @brief Hash support so `Guid` can key `std::unordered_map` / `std::unordered_set`.
 */
namespace std {
template <> struct hash<tinyguid::core::Guid> {
    std::size_t operator()(const tinyguid::core::Guid& guid) const;
};
} // namespace std
