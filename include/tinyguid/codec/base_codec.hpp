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
 * @file base_codec.hpp
 * @brief Reversible byte-to-text encodings used by identifier representations.
 *
 * @details
 * This header declares `BaseCodec`, a stateless utility implementing the three
 * RFC 4648 encodings TinyGUID exposes:
 * - **Base16**: lowercase on output, either case on input.
 * - **Base32**: alphabet `A-Z2-7`, uppercase on output, either case on input, no padding.
 * - **Base64url**: alphabet `A-Za-z0-9-_`, no padding.
 *
 * Decoders are strict. Characters outside the alphabet (padding included),
 * lengths no encoder can produce, and non-zero bits after the last full byte all
 * raise `DecodeError`, so each byte string has exactly one accepted text form.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tinyguid::codec {

/**
 * @class DecodeError
 * @brief Raised when text cannot be decoded by one of the `BaseCodec` decoders.
 */
class DecodeError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @class BaseCodec
 * @brief A static container for Base16, Base32 and Base64url conversions.
 */
class BaseCodec {
  public:
    /**
     * @brief Encodes bytes as lowercase hexadecimal, two characters per byte.
     *
     * @code
     * BaseCodec::encode_hex({0x02, 0xAB}); // "02ab"
     * @endcode
     */
    static std::string encode_hex(const std::vector<std::uint8_t>& bytes);

    /**
     * @brief Decodes hexadecimal text.
     * @throws DecodeError On odd length or a character outside `0-9a-fA-F`.
     */
    static std::vector<std::uint8_t> decode_hex(std::string_view text);

    /**
     * @brief Encodes bytes as unpadded RFC 4648 Base32.
     *
     * Output length is `ceil(8 * n / 5)`: 16 bytes give 26 characters and
     * 14 bytes give 23 characters.
     */
    static std::string encode_base32(const std::vector<std::uint8_t>& bytes);

    /**
     * @brief Decodes unpadded RFC 4648 Base32 (case-insensitive).
     * @throws DecodeError On a character outside the alphabet, an impossible
     * length, or non-zero trailing bits.
     */
    static std::vector<std::uint8_t> decode_base32(std::string_view text);

    /**
     * @brief Encodes bytes as unpadded RFC 4648 §5 Base64url.
     *
     * Output length is `ceil(8 * n / 6)`: 16 bytes give 22 characters.
     */
    static std::string encode_base64url(const std::vector<std::uint8_t>& bytes);

    /**
     * @brief Decodes unpadded Base64url.
     * @throws DecodeError On a character outside the alphabet (including `=`),
     * an impossible length, or non-zero trailing bits.
     */
    static std::vector<std::uint8_t> decode_base64url(std::string_view text);
};

} // namespace tinyguid::codec
