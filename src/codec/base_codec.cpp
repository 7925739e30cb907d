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
 * @file base_codec.cpp
 * @brief Implementation of the Base16, Base32 and Base64url codecs.
 *
 * @details
 * Base32 and Base64url share one bit-accumulator loop parameterized by the number
 * of bits per symbol. Decoding goes through a 256-entry reverse lookup table so
 * that each input character costs one array access.
 */

#include "tinyguid/codec/base_codec.hpp"

#include <array>

namespace tinyguid::codec {

namespace {

const char kHexDigits[] = "0123456789abcdef";
const char kBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
const char kBase64UrlAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr std::int8_t kInvalid = -1;

using ReverseTable = std::array<std::int8_t, 256>;

/// @brief Builds a reverse lookup table for @p alphabet.
ReverseTable make_reverse(const char* alphabet, std::size_t size, bool fold_case)
{
    ReverseTable table;
    table.fill(kInvalid);
    for (std::size_t i = 0; i < size; ++i) {
        const auto c = static_cast<unsigned char>(alphabet[i]);
        table[c] = static_cast<std::int8_t>(i);
        if (fold_case && c >= 'A' && c <= 'Z') {
            table[c - 'A' + 'a'] = static_cast<std::int8_t>(i);
        }
    }
    return table;
}

const ReverseTable& hex_table()
{
    static const ReverseTable table = [] {
        ReverseTable t = make_reverse(kHexDigits, 16, false);
        for (int i = 0; i < 6; ++i) {
            t['A' + i] = static_cast<std::int8_t>(10 + i);
        }
        return t;
    }();
    return table;
}

const ReverseTable& base32_table()
{
    static const ReverseTable table = make_reverse(kBase32Alphabet, 32, true);
    return table;
}

const ReverseTable& base64url_table()
{
    static const ReverseTable table = make_reverse(kBase64UrlAlphabet, 64, false);
    return table;
}

/**
 * @brief Packs bytes into symbols of @p bits width, most significant bit first.
 *
 * The final partial symbol is padded with zero bits on the right.
 */
std::string encode_bits(const std::vector<std::uint8_t>& bytes, const char* alphabet, int bits)
{
    std::string out;
    out.reserve((bytes.size() * 8 + bits - 1) / bits);

    const unsigned mask = (1u << bits) - 1;
    unsigned buffer = 0;
    int pending = 0;

    for (std::uint8_t b : bytes) {
        buffer = (buffer << 8) | b;
        pending += 8;
        while (pending >= bits) {
            pending -= bits;
            out.push_back(alphabet[(buffer >> pending) & mask]);
        }
    }
    if (pending > 0) {
        out.push_back(alphabet[(buffer << (bits - pending)) & mask]);
    }
    return out;
}

/**
 * @brief Reverses `encode_bits`.
 *
 * @param name Encoding name, used in error messages.
 * @throws DecodeError On unknown characters, impossible lengths or non-zero
 * leftover bits.
 */
std::vector<std::uint8_t> decode_bits(std::string_view text, const ReverseTable& table, int bits,
                                      const char* name)
{
    // Leftover bits after the last full byte must be fewer than one symbol.
    const std::size_t leftover = (text.size() * bits) % 8;
    if (leftover >= static_cast<std::size_t>(bits)) {
        throw DecodeError(std::string("Invalid ") + name + " length: " +
                          std::to_string(text.size()));
    }

    std::vector<std::uint8_t> out;
    out.reserve(text.size() * bits / 8);

    unsigned buffer = 0;
    int pending = 0;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const std::int8_t value = table[static_cast<unsigned char>(text[i])];
        if (value == kInvalid) {
            throw DecodeError(std::string("Invalid ") + name + " character at offset " +
                              std::to_string(i));
        }
        buffer = (buffer << bits) | static_cast<unsigned>(value);
        pending += bits;
        if (pending >= 8) {
            pending -= 8;
            out.push_back(static_cast<std::uint8_t>((buffer >> pending) & 0xFF));
        }
    }

    if (pending > 0 && (buffer & ((1u << pending) - 1)) != 0) {
        throw DecodeError(std::string("Non-canonical ") + name + " trailing bits");
    }
    return out;
}

} // namespace

std::string BaseCodec::encode_hex(const std::vector<std::uint8_t>& bytes)
{
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

std::vector<std::uint8_t> BaseCodec::decode_hex(std::string_view text)
{
    if (text.size() % 2 != 0) {
        throw DecodeError("Invalid hexadecimal length: " + std::to_string(text.size()));
    }

    const ReverseTable& table = hex_table();
    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 2);

    for (std::size_t i = 0; i < text.size(); i += 2) {
        const std::int8_t hi = table[static_cast<unsigned char>(text[i])];
        const std::int8_t lo = table[static_cast<unsigned char>(text[i + 1])];
        if (hi == kInvalid || lo == kInvalid) {
            throw DecodeError("Invalid hexadecimal character near offset " + std::to_string(i));
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string BaseCodec::encode_base32(const std::vector<std::uint8_t>& bytes)
{
    return encode_bits(bytes, kBase32Alphabet, 5);
}

std::vector<std::uint8_t> BaseCodec::decode_base32(std::string_view text)
{
    return decode_bits(text, base32_table(), 5, "base32");
}

std::string BaseCodec::encode_base64url(const std::vector<std::uint8_t>& bytes)
{
    return encode_bits(bytes, kBase64UrlAlphabet, 6);
}

std::vector<std::uint8_t> BaseCodec::decode_base64url(std::string_view text)
{
    return decode_bits(text, base64url_table(), 6, "base64url");
}

} // namespace tinyguid::codec
