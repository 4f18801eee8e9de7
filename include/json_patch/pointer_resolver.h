// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file pointer_resolver.h
/// @brief Locate the slot a JSON Pointer addresses inside a document.
///
/// resolve() walks every token but the last through existing containers
/// and stops at the parent of the target. It reports where the target
/// lives (object member or array position) and whether something is
/// already stored there; whether that occupancy is acceptable is judged
/// by the calling operation, not here.

#pragma once

#include <json_patch/api.h>
#include <json_patch/json_pointer.h>
#include <json_patch/patch_error.h>
#include <json_patch/value.h>

namespace json_patch {

/// Location of a pointer's target inside a document
struct Slot {
    Document parent;          // Container holding the target (unused when is_root)
    Token token;              // Final reference token, unescaped
    bool is_root = false;     // Empty pointer: the slot is the document itself
    bool existed = false;     // A value is currently stored at the slot
    bool in_array = false;    // Parent is an array (otherwise an object)
    bool append = false;      // Final token was "-"
    std::size_t index = 0;    // Array position; parent size when append
    Document target;          // Current value at the slot (valid when existed)
};

struct ResolveResult {
    Slot slot;
    bool success = false;
    PatchErrorCode error_code = PatchErrorCode::Success;
    std::string error_message;

    explicit operator bool() const noexcept { return success; }
};

/// @brief Resolve a pointer to its slot
///
/// Errors:
/// - TargetNotFound: an intermediate token is missing, out of range, "-",
///   or applied to a scalar; or the final parent is a scalar
/// - IndexOutOfBounds: the final token on an array is neither "-" nor a
///   valid decimal index
[[nodiscard]] JSON_PATCH_API ResolveResult resolve(const Document& root, const JsonPointer& pointer);

/// @brief Read the value a pointer addresses; "-" never addresses a value
///
/// A missing member or an index past the end is TargetNotFound, the same
/// kind REPLACE, TEST and a move/copy source report.
[[nodiscard]] JSON_PATCH_API LookupResult value_at(const Document& root, const JsonPointer& pointer);

} // namespace json_patch
