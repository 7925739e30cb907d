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
 * @file guid_json.cpp
 * @brief cJSON-based serialization of identifiers.
 *
 * @details
 * cJSON trees are released with `cJSON_Delete` and printed buffers with
 * `cJSON_free` on every path, including the error paths that throw.
 */

#include "tinyguid/json/guid_json.hpp"

#include <cJSON.h>
#include <stdexcept>

namespace tinyguid::json {

namespace {

/// @brief Prints @p root and releases both the tree and the printed buffer.
std::string print_and_release(cJSON* root, bool formatted)
{
    char* raw = formatted ? cJSON_Print(root) : cJSON_PrintUnformatted(root);
    cJSON_Delete(root);
    if (raw == nullptr) {
        throw std::runtime_error("JSON serialization failed");
    }

    std::string out(raw);
    cJSON_free(raw);
    return out;
}

} // namespace

std::string to_json(const core::Guid& guid)
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "id", guid.to_base32().c_str());
    return print_and_release(root, false);
}

core::Guid from_json(const std::string& text)
{
    cJSON* root = cJSON_Parse(text.c_str());
    if (root == nullptr) {
        throw core::GuidError(core::ErrorCode::MALFORMED, "Invalid JSON syntax");
    }

    const cJSON* id = cJSON_IsObject(root) ? cJSON_GetObjectItemCaseSensitive(root, "id") : nullptr;
    if (!cJSON_IsString(id) || id->valuestring == nullptr) {
        cJSON_Delete(root);
        throw core::GuidError(core::ErrorCode::MALFORMED, "Missing string member: 'id'");
    }

    // Copy before releasing the tree; parse may throw.
    const std::string value = id->valuestring;
    cJSON_Delete(root);
    return core::Guid::parse(value);
}

std::string describe(const core::Guid& guid)
{
    cJSON* root = cJSON_CreateObject();

    // 48-bit timestamps and 32-bit ids are exactly representable as doubles.
    cJSON_AddNumberToObject(root, "version", guid.version());
    cJSON_AddNumberToObject(root, "tenant", guid.tenant_id());
    cJSON_AddNumberToObject(root, "origin", guid.origin_id());
    cJSON_AddNumberToObject(root, "timestamp", static_cast<double>(guid.timestamp()));
    cJSON_AddNumberToObject(root, "counter", guid.counter());
    cJSON_AddStringToObject(root, "hex", guid.to_hex().c_str());
    cJSON_AddStringToObject(root, "base32", guid.to_base32().c_str());
    cJSON_AddStringToObject(root, "base64", guid.to_base64().c_str());
    cJSON_AddStringToObject(root, "ark", guid.to_ark().c_str());

    return print_and_release(root, true);
}

} // namespace tinyguid::json
