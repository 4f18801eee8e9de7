// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file tree_rebuilder.h
/// @brief Persistent edits of a document addressed by JSON Pointer.
///
/// Every edit copies only the containers on the root-to-target path, each
/// with exactly one child substituted; all other subtrees are shared with
/// the input document by reference. The input is never modified, so it
/// stays valid after both success and failure.
///
/// ## Example
///
/// ```cpp
/// Document doc{Value::object({{"foo", "bar"}})};
/// auto result = add_at(doc, {"baz"}, Document{Value{"qux"}});
/// // result.document: {"foo":"bar","baz":"qux"}, doc unchanged
/// ```

#pragma once

#include <json_patch/api.h>
#include <json_patch/patch_error.h>
#include <json_patch/patch_step.h>
#include <json_patch/value.h>

namespace json_patch {

/// @brief RFC 6902 "add": upsert an object member or insert into an array
/// @note "-" (or an index equal to the size) appends; an empty path replaces the document
[[nodiscard]] JSON_PATCH_API PatchResult add_at(const Document& root, const JsonPointer& path, Document value);

/// @brief RFC 6902 "remove"
/// @param removed Receives the removed subtree when not null
[[nodiscard]] JSON_PATCH_API PatchResult remove_at(const Document& root, const JsonPointer& path,
                                                   Document* removed = nullptr);

/// @brief RFC 6902 "replace": the target must already exist
[[nodiscard]] JSON_PATCH_API PatchResult replace_at(const Document& root, const JsonPointer& path, Document value);

/// @brief Apply a single step of any operation
///
/// A successful "test" returns @p root itself (same node), so callers can
/// detect no-ops by reference identity.
[[nodiscard]] JSON_PATCH_API PatchResult apply_step(const Document& root, const PatchStep& step);

} // namespace json_patch
