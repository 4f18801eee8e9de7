// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_step.h
/// @brief One RFC 6902 operation: {op, path, from?, value?}.

#pragma once

#include <json_patch/api.h>
#include <json_patch/value.h>

#include <optional>
#include <string_view>

namespace json_patch {

enum class PatchOperation { Add, Remove, Replace, Move, Copy, Test };

/// "add", "remove", "replace", "move", "copy", "test"
[[nodiscard]] JSON_PATCH_API const char* to_string(PatchOperation op) noexcept;
[[nodiscard]] JSON_PATCH_API std::optional<PatchOperation> operation_from_string(std::string_view name) noexcept;

struct PatchStep {
    PatchOperation operation = PatchOperation::Test;
    JsonPointer path;
    std::optional<JsonPointer> from;    // move / copy
    std::optional<Document> value;      // add / replace / test

    static PatchStep add(JsonPointer path, Value value) {
        return {PatchOperation::Add, std::move(path), std::nullopt, Document{std::move(value)}};
    }
    static PatchStep add(JsonPointer path, Document value) {
        return {PatchOperation::Add, std::move(path), std::nullopt, std::move(value)};
    }
    static PatchStep remove(JsonPointer path) {
        return {PatchOperation::Remove, std::move(path), std::nullopt, std::nullopt};
    }
    static PatchStep replace(JsonPointer path, Value value) {
        return {PatchOperation::Replace, std::move(path), std::nullopt, Document{std::move(value)}};
    }
    static PatchStep replace(JsonPointer path, Document value) {
        return {PatchOperation::Replace, std::move(path), std::nullopt, std::move(value)};
    }
    static PatchStep move(JsonPointer path, JsonPointer from) {
        return {PatchOperation::Move, std::move(path), std::move(from), std::nullopt};
    }
    static PatchStep copy(JsonPointer path, JsonPointer from) {
        return {PatchOperation::Copy, std::move(path), std::move(from), std::nullopt};
    }
    static PatchStep test(JsonPointer path, Value value) {
        return {PatchOperation::Test, std::move(path), std::nullopt, Document{std::move(value)}};
    }
    static PatchStep test(JsonPointer path, Document value) {
        return {PatchOperation::Test, std::move(path), std::nullopt, std::move(value)};
    }
};

using Patch = std::vector<PatchStep>;

} // namespace json_patch
