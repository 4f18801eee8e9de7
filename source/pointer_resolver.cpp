// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file pointer_resolver.cpp
/// @brief Implementation of JSON Pointer slot resolution.

#include <json_patch/pointer_resolver.h>

namespace json_patch {

namespace {

ResolveResult resolve_failure(PatchErrorCode code, std::string message)
{
    ResolveResult result;
    result.error_code = code;
    result.error_message = std::move(message);
    return result;
}

std::string describe(const JsonPointer& pointer, std::size_t depth)
{
    return "\"" + to_string(pointer) + "\" (token " + std::to_string(depth) + ")";
}

/// Step from a container into an existing child; nullptr when absent
const Document* child_of(const Value& current, const Token& token)
{
    if (auto* obj = current.get_if<ValueObject>()) {
        return obj->find(token);
    }
    if (auto* arr = current.get_if<ValueArray>()) {
        auto index = parse_array_index(token);
        if (index && *index < arr->size()) {
            return &(*arr)[*index];
        }
    }
    return nullptr;
}

} // anonymous namespace

ResolveResult resolve(const Document& root, const JsonPointer& pointer)
{
    ResolveResult result;

    if (pointer.empty()) {
        result.slot.is_root = true;
        result.slot.existed = true;
        result.slot.target = root;
        result.success = true;
        return result;
    }

    // Walk the ancestors; every one of them must already exist
    const Document* current = &root;
    const std::size_t last = pointer.size() - 1;
    for (std::size_t depth = 0; depth < last; ++depth) {
        const Document* next = child_of(current->get(), pointer[depth]);
        if (next == nullptr) [[unlikely]] {
            return resolve_failure(PatchErrorCode::TargetNotFound,
                                   "no " + std::string{current->get().type_name()} +
                                   " member at " + describe(pointer, depth));
        }
        current = next;
    }

    Slot& slot = result.slot;
    slot.parent = *current;
    slot.token = pointer[last];

    const Value& parent = current->get();
    if (auto* obj = parent.get_if<ValueObject>()) {
        if (auto* found = obj->find(slot.token)) {
            slot.existed = true;
            slot.target = *found;
        }
    } else if (auto* arr = parent.get_if<ValueArray>()) {
        slot.in_array = true;
        if (slot.token == append_token) {
            slot.append = true;
            slot.index = arr->size();
        } else {
            auto index = parse_array_index(slot.token);
            if (!index) {
                return resolve_failure(PatchErrorCode::IndexOutOfBounds,
                                       "\"" + slot.token + "\" is not an array index at " +
                                       describe(pointer, last));
            }
            slot.index = *index;
            if (slot.index < arr->size()) {
                slot.existed = true;
                slot.target = (*arr)[slot.index];
            }
        }
    } else {
        return resolve_failure(PatchErrorCode::TargetNotFound,
                               "parent is a " + std::string{parent.type_name()} +
                               ", not a container, at " + describe(pointer, last));
    }

    result.success = true;
    return result;
}

LookupResult value_at(const Document& root, const JsonPointer& pointer)
{
    LookupResult lookup;
    auto resolved = resolve(root, pointer);
    if (!resolved) {
        lookup.error_code = resolved.error_code;
        lookup.error_message = std::move(resolved.error_message);
        return lookup;
    }

    const Slot& slot = resolved.slot;
    if (slot.append) {
        lookup.error_code = PatchErrorCode::InvalidPointerToken;
        lookup.error_message = "\"-\" does not address an existing element in \"" + to_string(pointer) + "\"";
        return lookup;
    }
    if (!slot.existed) {
        lookup.error_code = PatchErrorCode::TargetNotFound;
        lookup.error_message = "nothing at \"" + to_string(pointer) + "\"";
        return lookup;
    }

    lookup.value = slot.target;
    lookup.success = true;
    return lookup;
}

} // namespace json_patch
