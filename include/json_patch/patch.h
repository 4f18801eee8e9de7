// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief JSON Patch (RFC 6902) engine over immutable documents.
///
/// apply() folds an ordered list of steps over a document: every step sees
/// the result of the previous one. The first failing step aborts the whole
/// patch and its error is returned; no partially patched document escapes.
/// The input document is never modified, so a caller may retry against it,
/// and the same document may be patched from several threads at once.
///
/// ## Usage Examples
///
/// ```cpp
/// Document doc{Value::object({{"foo", "bar"}})};
///
/// Patch patch = PatchBuilder()
///     .add("/baz", Value{"qux"})
///     .test("/foo", Value{"bar"})
///     .steps();
///
/// if (auto result = json_patch::apply(doc, patch)) {
///     print_value(*result.document);
/// } else {
///     std::cerr << to_string(result.error_code) << ": " << result.error_message;
/// }
/// ```

#pragma once

#include <json_patch/api.h>
#include <json_patch/json_pointer.h>
#include <json_patch/patch_error.h>
#include <json_patch/patch_step.h>
#include <json_patch/value.h>

#include <string_view>

namespace json_patch {

/// @brief Apply every step in order
/// @return The final document; the input itself when no step changed anything
[[nodiscard]] JSON_PATCH_API PatchResult apply(const Document& document, const Patch& steps);

/// @brief Same as apply(), throwing PatchError on failure
[[nodiscard]] JSON_PATCH_API Document apply_or_throw(const Document& document, const Patch& steps);

// ============================================================
// PatchBuilder - Fluent construction of a step list
//
// Pointers may be given pre-tokenized (JsonPointer) or as RFC 6901
// strings. A malformed pointer string makes steps() throw PatchError
// (InvalidPointerToken); apply_to() reports it as a failed result instead.
// ============================================================

class JSON_PATCH_API PatchBuilder {
public:
    PatchBuilder() = default;

    PatchBuilder& add(JsonPointer path, Value value);
    PatchBuilder& add(std::string_view path, Value value);
    PatchBuilder& remove(JsonPointer path);
    PatchBuilder& remove(std::string_view path);
    PatchBuilder& replace(JsonPointer path, Value value);
    PatchBuilder& replace(std::string_view path, Value value);
    PatchBuilder& move(JsonPointer path, JsonPointer from);
    PatchBuilder& move(std::string_view path, std::string_view from);
    PatchBuilder& copy(JsonPointer path, JsonPointer from);
    PatchBuilder& copy(std::string_view path, std::string_view from);
    PatchBuilder& test(JsonPointer path, Value value);
    PatchBuilder& test(std::string_view path, Value value);

    /// Append a prepared step
    PatchBuilder& step(PatchStep step);

    [[nodiscard]] std::size_t size() const noexcept { return steps_.size(); }

    /// @throws PatchError if any pointer string failed to parse
    [[nodiscard]] const Patch& steps() const;

    /// Apply the collected steps; a pointer parse error is returned as a failed result
    [[nodiscard]] PatchResult apply_to(const Document& document) const;

private:
    JsonPointer parse(std::string_view pointer);

    Patch steps_;
    PatchErrorCode error_code_ = PatchErrorCode::Success;
    std::string error_message_;
};

} // namespace json_patch
