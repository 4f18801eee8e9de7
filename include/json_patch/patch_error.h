// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch_error.h
/// @brief Error codes and result types shared by pointer resolution and patching.
///
/// Failures are reported as values: every operation returns a result struct
/// carrying a PatchErrorCode and a human-readable message. Exceptions are
/// raised only from the explicit get() accessors and apply_or_throw().

#pragma once

#include <json_patch/api.h>
#include <json_patch/value.h>

#include <stdexcept>
#include <string>

namespace json_patch {

enum class PatchErrorCode {
    Success = 0,
    TargetNotFound,       // Required object key or array element is absent
    IndexOutOfBounds,     // Array token negative, non-numeric or past the valid bound
    InvalidPointerToken,  // Malformed pointer syntax, or "-" where not permitted
    InvalidPatch,         // Structurally impossible step (e.g. move into own subtree)
    TestFailed,           // "test" comparison did not hold
};

[[nodiscard]] JSON_PATCH_API const char* to_string(PatchErrorCode code) noexcept;

/// Exception form of a failed patch, thrown by get() / apply_or_throw()
class JSON_PATCH_API PatchError : public std::runtime_error {
public:
    PatchError(PatchErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] PatchErrorCode code() const noexcept { return code_; }

private:
    PatchErrorCode code_;
};

/// Outcome of a value lookup through a JSON Pointer
struct LookupResult {
    ValueBox value;                 // The located subtree (shared, not copied)
    bool success = false;
    PatchErrorCode error_code = PatchErrorCode::Success;
    std::string error_message;

    explicit operator bool() const noexcept { return success; }
    const Value& get() const {
        if (!success) {
            throw PatchError(error_code, "Pointer lookup failed: " + error_message);
        }
        return *value;
    }
    Value get_or(Value default_val) const {
        return success ? *value : std::move(default_val);
    }
};

/// Outcome of one patch step or of a whole patch
struct PatchResult {
    Document document;              // New root (or the input root for a no-op)
    bool success = false;
    PatchErrorCode error_code = PatchErrorCode::Success;
    std::string error_message;
    std::size_t failed_step = 0;    // Index of the failing step (meaningful on failure)

    explicit operator bool() const noexcept { return success; }
    const Document& get() const {
        if (!success) {
            throw PatchError(error_code, "Patch failed: " + error_message);
        }
        return document;
    }
    Document get_or(Document default_doc) const {
        return success ? document : std::move(default_doc);
    }

    static PatchResult ok(Document doc) {
        PatchResult result;
        result.document = std::move(doc);
        result.success = true;
        return result;
    }

    static PatchResult fail(PatchErrorCode code, std::string message) {
        PatchResult result;
        result.error_code = code;
        result.error_message = std::move(message);
        return result;
    }
};

} // namespace json_patch
