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
 * @file codec_test.cpp
 * @brief Unit tests for the Base16, Base32 and Base64url codecs.
 *
 * @details
 * Known-answer vectors come from RFC 4648 §10 ("foobar"). The rejection tests
 * make sure the decoders never silently truncate, pad or accept foreign alphabets.
 */

#include "tinyguid/codec/base_codec.hpp"
#include "framework.hpp"

#include <string>
#include <vector>

using tinyguid::codec::BaseCodec;
using tinyguid::codec::DecodeError;

namespace {

std::vector<std::uint8_t> bytes_of(const std::string& s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

std::string text_of(const std::vector<std::uint8_t>& b)
{
    return std::string(b.begin(), b.end());
}

bool decode_fails(std::vector<std::uint8_t> (*decoder)(std::string_view), const std::string& text)
{
    try {
        decoder(text);
    } catch (const DecodeError&) {
        return true;
    }
    return false;
}

} // namespace

/**
 * @brief RFC 4648 test vectors for Base16, lowercase output, both cases accepted.
 */
void test_codec_hex_vectors()
{
    ASSERT_EQ(BaseCodec::encode_hex(bytes_of("foobar")), std::string("666f6f626172"));
    ASSERT_EQ(BaseCodec::encode_hex({0x00, 0xff, 0x0a}), std::string("00ff0a"));
    ASSERT_EQ(text_of(BaseCodec::decode_hex("666F6F626172")), std::string("foobar"));
    ASSERT_EQ(BaseCodec::decode_hex("").size(), static_cast<size_t>(0));
}

/**
 * @brief RFC 4648 test vectors for unpadded Base32.
 */
void test_codec_base32_vectors()
{
    ASSERT_EQ(BaseCodec::encode_base32(bytes_of("f")), std::string("MY"));
    ASSERT_EQ(BaseCodec::encode_base32(bytes_of("fo")), std::string("MZXQ"));
    ASSERT_EQ(BaseCodec::encode_base32(bytes_of("foo")), std::string("MZXW6"));
    ASSERT_EQ(BaseCodec::encode_base32(bytes_of("foob")), std::string("MZXW6YQ"));
    ASSERT_EQ(BaseCodec::encode_base32(bytes_of("fooba")), std::string("MZXW6YTB"));
    ASSERT_EQ(BaseCodec::encode_base32(bytes_of("foobar")), std::string("MZXW6YTBOI"));

    ASSERT_EQ(text_of(BaseCodec::decode_base32("MZXW6YTBOI")), std::string("foobar"));
    // Lowercase input is folded.
    ASSERT_EQ(text_of(BaseCodec::decode_base32("mzxw6ytboi")), std::string("foobar"));

    // Sizes used by identifiers.
    ASSERT_EQ(BaseCodec::encode_base32(std::vector<std::uint8_t>(16, 0xAB)).size(),
              static_cast<size_t>(26));
    ASSERT_EQ(BaseCodec::encode_base32(std::vector<std::uint8_t>(14, 0xAB)).size(),
              static_cast<size_t>(23));
}

/**
 * @brief RFC 4648 test vectors for unpadded Base64url, including URL-safe symbols.
 */
void test_codec_base64url_vectors()
{
    ASSERT_EQ(BaseCodec::encode_base64url(bytes_of("f")), std::string("Zg"));
    ASSERT_EQ(BaseCodec::encode_base64url(bytes_of("fo")), std::string("Zm8"));
    ASSERT_EQ(BaseCodec::encode_base64url(bytes_of("foo")), std::string("Zm9v"));
    ASSERT_EQ(BaseCodec::encode_base64url(bytes_of("foobar")), std::string("Zm9vYmFy"));

    // 0xFB 0xFF encodes to "+/8" in standard Base64; the URL alphabet uses '-' and '_'.
    ASSERT_EQ(BaseCodec::encode_base64url({0xFB, 0xFF}), std::string("-_8"));
    ASSERT_EQ(BaseCodec::decode_base64url("-_8").size(), static_cast<size_t>(2));

    ASSERT_EQ(BaseCodec::encode_base64url(std::vector<std::uint8_t>(16, 0x11)).size(),
              static_cast<size_t>(22));
}

/**
 * @brief Characters outside each alphabet are rejected, padding included.
 */
void test_codec_rejects_invalid_alphabet()
{
    ASSERT_TRUE(decode_fails(BaseCodec::decode_hex, "0g"));
    ASSERT_TRUE(decode_fails(BaseCodec::decode_hex, "  "));

    ASSERT_TRUE(decode_fails(BaseCodec::decode_base32, "MZXW6YT1")); // '1' not in alphabet
    ASSERT_TRUE(decode_fails(BaseCodec::decode_base32, "MZXQ===="));

    ASSERT_TRUE(decode_fails(BaseCodec::decode_base64url, "Zm9v+A"));
    ASSERT_TRUE(decode_fails(BaseCodec::decode_base64url, "Zg=="));
}

/**
 * @brief Lengths no encoder produces and non-canonical trailing bits are rejected.
 */
void test_codec_rejects_bad_length_and_trailing_bits()
{
    ASSERT_TRUE(decode_fails(BaseCodec::decode_hex, "abc"));

    ASSERT_TRUE(decode_fails(BaseCodec::decode_base32, "M"));
    ASSERT_TRUE(decode_fails(BaseCodec::decode_base32, "MZX"));
    ASSERT_TRUE(decode_fails(BaseCodec::decode_base32, "MZXW6Y"));
    // "MY" is 'f' followed by two zero bits; "MZ" sets one of them.
    ASSERT_EQ(text_of(BaseCodec::decode_base32("MY")), std::string("f"));
    ASSERT_TRUE(decode_fails(BaseCodec::decode_base32, "MZ"));

    ASSERT_TRUE(decode_fails(BaseCodec::decode_base64url, "Zm9vY"));
    ASSERT_TRUE(decode_fails(BaseCodec::decode_base64url, "Zh"));
}
