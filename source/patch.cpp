// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.cpp
/// @brief Patch engine: step folding, builder and name tables.

#include <json_patch/patch.h>
#include <json_patch/tree_rebuilder.h>

namespace json_patch {

// ============================================================
// Name tables
// ============================================================

const char* to_string(PatchErrorCode code) noexcept
{
    switch (code) {
        case PatchErrorCode::Success:             return "Success";
        case PatchErrorCode::TargetNotFound:      return "TargetNotFound";
        case PatchErrorCode::IndexOutOfBounds:    return "IndexOutOfBounds";
        case PatchErrorCode::InvalidPointerToken: return "InvalidPointerToken";
        case PatchErrorCode::InvalidPatch:        return "InvalidPatch";
        case PatchErrorCode::TestFailed:          return "TestFailed";
    }
    return "Unknown";
}

const char* to_string(PatchOperation op) noexcept
{
    switch (op) {
        case PatchOperation::Add:     return "add";
        case PatchOperation::Remove:  return "remove";
        case PatchOperation::Replace: return "replace";
        case PatchOperation::Move:    return "move";
        case PatchOperation::Copy:    return "copy";
        case PatchOperation::Test:    return "test";
    }
    return "unknown";
}

std::optional<PatchOperation> operation_from_string(std::string_view name) noexcept
{
    if (name == "add")     return PatchOperation::Add;
    if (name == "remove")  return PatchOperation::Remove;
    if (name == "replace") return PatchOperation::Replace;
    if (name == "move")    return PatchOperation::Move;
    if (name == "copy")    return PatchOperation::Copy;
    if (name == "test")    return PatchOperation::Test;
    return std::nullopt;
}

// ============================================================
// Engine
// ============================================================

PatchResult apply(const Document& document, const Patch& steps)
{
    Document current = document;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        PatchResult step_result;
        try {
            step_result = apply_step(current, steps[i]);
        } catch (const PatchError& e) {
            step_result = PatchResult::fail(e.code(), e.what());
        }

        if (!step_result) {
            detail::log_access_error("json_patch::apply",
                                     "step " + std::to_string(i) + " (" + to_string(steps[i].operation) +
                                     ") failed: " + to_string(step_result.error_code) + ": " +
                                     step_result.error_message);
            step_result.failed_step = i;
            return step_result;
        }
        current = std::move(step_result.document);
    }
    return PatchResult::ok(std::move(current));
}

Document apply_or_throw(const Document& document, const Patch& steps)
{
    auto result = json_patch::apply(document, steps);
    return result.get();
}

// ============================================================
// PatchBuilder
// ============================================================

JsonPointer PatchBuilder::parse(std::string_view pointer)
{
    auto parsed = parse_json_pointer(pointer);
    if (!parsed && error_code_ == PatchErrorCode::Success) {
        // Keep the first error; later steps are still recorded
        error_code_ = parsed.error_code;
        error_message_ = std::move(parsed.error_message);
    }
    return std::move(parsed.pointer);
}

PatchBuilder& PatchBuilder::step(PatchStep step)
{
    steps_.push_back(std::move(step));
    return *this;
}

PatchBuilder& PatchBuilder::add(JsonPointer path, Value value)
{
    return step(PatchStep::add(std::move(path), std::move(value)));
}

PatchBuilder& PatchBuilder::add(std::string_view path, Value value)
{
    return add(parse(path), std::move(value));
}

PatchBuilder& PatchBuilder::remove(JsonPointer path)
{
    return step(PatchStep::remove(std::move(path)));
}

PatchBuilder& PatchBuilder::remove(std::string_view path)
{
    return remove(parse(path));
}

PatchBuilder& PatchBuilder::replace(JsonPointer path, Value value)
{
    return step(PatchStep::replace(std::move(path), std::move(value)));
}

PatchBuilder& PatchBuilder::replace(std::string_view path, Value value)
{
    return replace(parse(path), std::move(value));
}

PatchBuilder& PatchBuilder::move(JsonPointer path, JsonPointer from)
{
    return step(PatchStep::move(std::move(path), std::move(from)));
}

PatchBuilder& PatchBuilder::move(std::string_view path, std::string_view from)
{
    auto target = parse(path);
    return move(std::move(target), parse(from));
}

PatchBuilder& PatchBuilder::copy(JsonPointer path, JsonPointer from)
{
    return step(PatchStep::copy(std::move(path), std::move(from)));
}

PatchBuilder& PatchBuilder::copy(std::string_view path, std::string_view from)
{
    auto target = parse(path);
    return copy(std::move(target), parse(from));
}

PatchBuilder& PatchBuilder::test(JsonPointer path, Value value)
{
    return step(PatchStep::test(std::move(path), std::move(value)));
}

PatchBuilder& PatchBuilder::test(std::string_view path, Value value)
{
    return test(parse(path), std::move(value));
}

const Patch& PatchBuilder::steps() const
{
    if (error_code_ != PatchErrorCode::Success) {
        throw PatchError(error_code_, "Invalid JSON pointer: " + error_message_);
    }
    return steps_;
}

PatchResult PatchBuilder::apply_to(const Document& document) const
{
    if (error_code_ != PatchErrorCode::Success) {
        return PatchResult::fail(error_code_, error_message_);
    }
    return json_patch::apply(document, steps_);
}

} // namespace json_patch
