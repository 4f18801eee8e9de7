// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_pointer.h
/// @brief JSON Pointer (RFC 6901) tokens and helpers.
///
/// A JsonPointer is the already-unescaped token sequence:
///   "/users/0/name"  ->  ["users", "0", "name"]
///   ""               ->  []    (whole document)
///   "/"              ->  [""]  (key is empty string)
///
/// Whether a token is an object key or an array index is decided only
/// when it is applied to a concrete container, so every token is kept
/// as a string here.
///
/// RFC 6901: https://datatracker.ietf.org/doc/html/rfc6901

#pragma once

#include <json_patch/api.h>
#include <json_patch/patch_error.h>
#include <json_patch/value.h>

#include <optional>
#include <string_view>

namespace json_patch {

/// The "-" token: one past the last array element (insertion contexts only)
inline constexpr std::string_view append_token = "-";

struct PointerParseResult {
    JsonPointer pointer;
    bool success = false;
    PatchErrorCode error_code = PatchErrorCode::Success;
    std::string error_message;

    explicit operator bool() const noexcept { return success; }
    const JsonPointer& get() const {
        if (!success) {
            throw PatchError(error_code, "Invalid JSON pointer: " + error_message);
        }
        return pointer;
    }
};

// Parse JSON Pointer string into tokens, unescaping ~1 -> / and ~0 -> ~
// Examples:
//   "/users/0/name"  -> ["users", "0", "name"]
//   "/a~1b"          -> ["a/b"]
//   "users"          -> InvalidPointerToken (must start with '/')
//   "/a~2"           -> InvalidPointerToken (bad escape)
[[nodiscard]] JSON_PATCH_API PointerParseResult parse_json_pointer(std::string_view pointer);

// Convert tokens back to a JSON Pointer string (inverse of parse_json_pointer)
[[nodiscard]] JSON_PATCH_API std::string to_string(const JsonPointer& pointer);

/// @brief True when every token of @p prefix starts @p pointer (equal pointers included)
[[nodiscard]] JSON_PATCH_API bool is_prefix_of(const JsonPointer& prefix, const JsonPointer& pointer);

/// @brief All tokens but the last; the root pointer is its own parent
[[nodiscard]] JSON_PATCH_API JsonPointer parent_of(const JsonPointer& pointer);

/// @brief Parse a token as an array index
///
/// Accepts "0" or a digit sequence without leading zeros. "-" yields
/// @p append_index when @p allow_append is set. Anything else yields
/// std::nullopt.
[[nodiscard]] JSON_PATCH_API std::optional<std::size_t> parse_array_index(
    std::string_view token, bool allow_append = false, std::size_t append_index = 0);

} // namespace json_patch
