// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_equal.h
/// @brief Deep structural equality for Value trees (used by "test").
///
/// - null == null, booleans by value, strings by exact character sequence
/// - numbers by mathematical value: 1 == 1.0, lexical form is irrelevant
/// - arrays: same length and element-wise equal in order
/// - objects: same key set (member order irrelevant), equal values per key
/// - values of different kinds are never equal
///
/// Subtrees held by the same box node are equal without descending.

#pragma once

#include <json_patch/api.h>
#include <json_patch/value.h>

namespace json_patch {

[[nodiscard]] JSON_PATCH_API bool values_equal(const Value& a, const Value& b);

[[nodiscard]] inline bool operator==(const Value& a, const Value& b)
{
    return values_equal(a, b);
}

} // namespace json_patch
