// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file tree_rebuilder.cpp
/// @brief Implementation of persistent pointer edits and step dispatch.

#include <json_patch/tree_rebuilder.h>
#include <json_patch/pointer_resolver.h>
#include <json_patch/value_equal.h>

namespace json_patch {

// ============================================================
// Anonymous namespace - Internal implementation details
// ============================================================

namespace {

PatchResult from_resolve(const ResolveResult& resolved)
{
    return PatchResult::fail(resolved.error_code, resolved.error_message);
}

/// Rebuild the ancestor chain pointer[0..end) so that the node at depth
/// @p end becomes @p replacement. Siblings keep their boxes.
/// @pre pointer[0..end) was walked successfully by resolve() on @p node
Document substitute(const Document& node,
                    const JsonPointer& pointer,
                    std::size_t depth,
                    std::size_t end,
                    Document replacement)
{
    if (depth == end) {
        return replacement;  // Base case: this node is the one being swapped
    }

    const Token& token = pointer[depth];
    if (auto* obj = node->get_if<ValueObject>()) {
        const Document* child = obj->find(token);
        if (child == nullptr) [[unlikely]] {
            throw PatchError(PatchErrorCode::TargetNotFound, "ancestor vanished at \"" + token + "\"");
        }
        Document new_child = substitute(*child, pointer, depth + 1, end, std::move(replacement));
        return Document{Value{obj->set(token, std::move(new_child))}};
    }

    const auto& arr = std::get<ValueArray>(node->data);
    const std::size_t index = parse_array_index(token).value();
    Document new_child = substitute(arr.at(index), pointer, depth + 1, end, std::move(replacement));
    return Document{Value{arr.set(index, std::move(new_child))}};
}

/// Put a rebuilt parent container back into the document
PatchResult commit_parent(const Document& root, const JsonPointer& path, Value new_parent)
{
    const JsonPointer parent = parent_of(path);
    return PatchResult::ok(substitute(root, parent, 0, parent.size(), Document{std::move(new_parent)}));
}

/// Slot must hold a value (remove / replace / test / from)
/// @param missing_index_code code reported for an absent array element
PatchResult require_existing(const ResolveResult& resolved,
                             const JsonPointer& path,
                             PatchErrorCode missing_index_code)
{
    const Slot& slot = resolved.slot;
    if (slot.append) {
        return PatchResult::fail(PatchErrorCode::InvalidPointerToken,
                                 "\"-\" does not address an existing element in \"" + to_string(path) + "\"");
    }
    if (!slot.existed) {
        if (slot.in_array) {
            return PatchResult::fail(missing_index_code,
                                     "index " + slot.token + " is past the end of the array at \"" +
                                     to_string(path) + "\"");
        }
        return PatchResult::fail(PatchErrorCode::TargetNotFound,
                                 "no member \"" + slot.token + "\" at \"" + to_string(path) + "\"");
    }
    return PatchResult::ok(slot.target);
}

PatchResult missing_field(const PatchStep& step, const char* field)
{
    return PatchResult::fail(PatchErrorCode::InvalidPatch,
                             std::string{"\""} + to_string(step.operation) + "\" at \"" +
                             to_string(step.path) + "\" is missing \"" + field + "\"");
}

PatchResult test_at(const Document& root, const JsonPointer& path, const Document& expected)
{
    auto resolved = resolve(root, path);
    if (!resolved) {
        return from_resolve(resolved);
    }
    auto existing = require_existing(resolved, path, PatchErrorCode::TargetNotFound);
    if (!existing) {
        return existing;
    }
    if (!same_node(existing.document, expected) && !values_equal(*existing.document, *expected)) {
        return PatchResult::fail(PatchErrorCode::TestFailed,
                                 "value at \"" + to_string(path) + "\" is " +
                                 value_to_string(*existing.document) + ", expected " +
                                 value_to_string(*expected));
    }
    return PatchResult::ok(root);  // Same node: no structural change
}

PatchResult move_at(const Document& root, const JsonPointer& path, const JsonPointer& from)
{
    auto resolved = resolve(root, from);
    if (!resolved) {
        return from_resolve(resolved);
    }
    auto existing = require_existing(resolved, from, PatchErrorCode::TargetNotFound);
    if (!existing) {
        return existing;
    }
    if (is_prefix_of(from, path)) {
        return PatchResult::fail(PatchErrorCode::InvalidPatch,
                                 "cannot move \"" + to_string(from) + "\" into itself at \"" +
                                 to_string(path) + "\"");
    }

    // Remove first, then add against the intermediate document, so index
    // shifts caused by the removal apply to the target path
    Document moved;
    auto removed = remove_at(root, from, &moved);
    if (!removed) {
        return removed;
    }
    return add_at(removed.document, path, std::move(moved));
}

PatchResult copy_at(const Document& root, const JsonPointer& path, const JsonPointer& from)
{
    auto resolved = resolve(root, from);
    if (!resolved) {
        return from_resolve(resolved);
    }
    auto existing = require_existing(resolved, from, PatchErrorCode::TargetNotFound);
    if (!existing) {
        return existing;
    }
    // Subtrees are immutable: sharing the box is a complete copy
    return add_at(root, path, existing.document);
}

} // anonymous namespace

// ============================================================
// Public API Implementation
// ============================================================

PatchResult add_at(const Document& root, const JsonPointer& path, Document value)
{
    if (path.empty()) {
        return PatchResult::ok(std::move(value));
    }

    auto resolved = resolve(root, path);
    if (!resolved) {
        return from_resolve(resolved);
    }
    const Slot& slot = resolved.slot;

    if (!slot.in_array) {
        const auto& obj = std::get<ValueObject>(slot.parent->data);
        return commit_parent(root, path, Value{obj.set(slot.token, std::move(value))});
    }

    const auto& arr = std::get<ValueArray>(slot.parent->data);
    if (slot.index > arr.size()) {
        return PatchResult::fail(PatchErrorCode::IndexOutOfBounds,
                                 "insert index " + slot.token + " exceeds array size " +
                                 std::to_string(arr.size()) + " at \"" + to_string(path) + "\"");
    }
    return commit_parent(root, path, Value{arr.insert(slot.index, std::move(value))});
}

PatchResult remove_at(const Document& root, const JsonPointer& path, Document* removed)
{
    if (path.empty()) {
        return PatchResult::fail(PatchErrorCode::InvalidPatch, "cannot remove the whole document");
    }

    auto resolved = resolve(root, path);
    if (!resolved) {
        return from_resolve(resolved);
    }
    auto existing = require_existing(resolved, path, PatchErrorCode::IndexOutOfBounds);
    if (!existing) {
        return existing;
    }
    if (removed != nullptr) {
        *removed = existing.document;
    }

    const Slot& slot = resolved.slot;
    if (slot.in_array) {
        const auto& arr = std::get<ValueArray>(slot.parent->data);
        return commit_parent(root, path, Value{arr.erase(slot.index)});
    }
    const auto& obj = std::get<ValueObject>(slot.parent->data);
    return commit_parent(root, path, Value{obj.erase(slot.token)});
}

PatchResult replace_at(const Document& root, const JsonPointer& path, Document value)
{
    if (path.empty()) {
        return PatchResult::ok(std::move(value));
    }

    auto resolved = resolve(root, path);
    if (!resolved) {
        return from_resolve(resolved);
    }
    auto existing = require_existing(resolved, path, PatchErrorCode::TargetNotFound);
    if (!existing) {
        return existing;
    }
    if (same_node(existing.document, value)) {
        return PatchResult::ok(root);  // Nothing changes
    }

    const Slot& slot = resolved.slot;
    if (slot.in_array) {
        const auto& arr = std::get<ValueArray>(slot.parent->data);
        return commit_parent(root, path, Value{arr.set(slot.index, std::move(value))});
    }
    const auto& obj = std::get<ValueObject>(slot.parent->data);
    return commit_parent(root, path, Value{obj.set(slot.token, std::move(value))});
}

PatchResult apply_step(const Document& root, const PatchStep& step)
{
    switch (step.operation) {
        case PatchOperation::Add:
            if (!step.value) return missing_field(step, "value");
            return add_at(root, step.path, *step.value);

        case PatchOperation::Remove:
            return remove_at(root, step.path);

        case PatchOperation::Replace:
            if (!step.value) return missing_field(step, "value");
            return replace_at(root, step.path, *step.value);

        case PatchOperation::Move:
            if (!step.from) return missing_field(step, "from");
            return move_at(root, step.path, *step.from);

        case PatchOperation::Copy:
            if (!step.from) return missing_field(step, "from");
            return copy_at(root, step.path, *step.from);

        case PatchOperation::Test:
            if (!step.value) return missing_field(step, "value");
            return test_at(root, step.path, *step.value);
    }
    return PatchResult::fail(PatchErrorCode::InvalidPatch, "unknown patch operation");
}

} // namespace json_patch
