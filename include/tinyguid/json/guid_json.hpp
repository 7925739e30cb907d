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
 * @file guid_json.hpp
 * @brief JSON representation of identifiers.
 *
 * @details
 * Identifiers embedded in JSON documents travel as `{"id": "<base32>"}`. The
 * `describe` form spells out every field and every text encoding and is meant for
 * humans and tooling, not for round trips.
 */

#pragma once

#include "tinyguid/core/guid.hpp"

#include <string>

namespace tinyguid::json {

/**
 * @brief Serializes @p guid as a compact `{"id":"<base32>"}` object.
 */
std::string to_json(const core::Guid& guid);

/**
 * @brief Deserializes an `{"id": "..."}` object.
 *
 * The `id` member may hold any text form `Guid::parse` accepts; other members are
 * ignored.
 *
 * @throws core::GuidError `MALFORMED` if @p text is not a JSON object with a string
 * `id` member, otherwise whatever `Guid::parse` raises for the `id` value.
 */
core::Guid from_json(const std::string& text);

/**
 * @brief Pretty-printed object with all fields and encodings.
 *
 * Members: `version`, `tenant`, `origin`, `timestamp`, `counter`, `hex`, `base32`,
 * `base64`, `ark`.
 */
std::string describe(const core::Guid& guid);

} // namespace tinyguid::json
