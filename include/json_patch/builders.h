// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for efficient O(n) construction of immutable Value containers.
///
/// - ObjectBuilder: Build value_object efficiently (insertion order kept)
/// - ArrayBuilder: Build value_array efficiently
///
/// Usage:
/// @code
///   #include <json_patch/builders.h>
///
///   Value config = ObjectBuilder()
///       .set("width", 1920)
///       .set("fullscreen", true)
///       .finish();
///
///   Value items = ArrayBuilder()
///       .push_back("item1")
///       .push_back("item2")
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace json_patch {

/// Builder for constructing value_object efficiently - O(n) complexity
template <typename MemoryPolicy>
class BasicObjectBuilder {
public:
    using value_type   = BasicValue<MemoryPolicy>;
    using value_box    = BasicValueBox<MemoryPolicy>;
    using value_object = BasicValueObject<MemoryPolicy>;
    using member_map   = BasicValueMap<MemoryPolicy>;
    using key_list     = BasicKeyList<MemoryPolicy>;

    BasicObjectBuilder()
        : members_(member_map{}.transient()), keys_(key_list{}.transient()) {}

    ///   auto result = ObjectBuilder(config)
    ///       .set("updated", true)
    ///       .finish();
    explicit BasicObjectBuilder(const value_object& existing)
        : members_(existing.members().transient()), keys_(existing.keys().transient()) {}

    // Move operations (allowed)
    BasicObjectBuilder(BasicObjectBuilder&&) noexcept = default;
    BasicObjectBuilder& operator=(BasicObjectBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    BasicObjectBuilder(const BasicObjectBuilder&) = delete;
    BasicObjectBuilder& operator=(const BasicObjectBuilder&) = delete;

    /// Set a member; a key already present keeps its position
    template <typename T>
    BasicObjectBuilder& set(const std::string& key, T&& val) {
        return set_box(key, value_box{value_type{std::forward<T>(val)}});
    }

    BasicObjectBuilder& set(const std::string& key, value_type val) {
        return set_box(key, value_box{std::move(val)});
    }

    /// Set a member from an existing box (shares the subtree)
    BasicObjectBuilder& set_box(const std::string& key, value_box box) {
        if (members_.count(key) == 0) {
            keys_.push_back(key);
        }
        members_.set(key, std::move(box));
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return members_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return keys_.size();
    }

    /// Finish building and return the immutable Value
    /// @note Builder is left in a moved-from state after this call
    [[nodiscard]] value_type finish() {
        return value_type{value_object{members_.persistent(), keys_.persistent()}};
    }

private:
    typename member_map::transient_type members_;
    typename key_list::transient_type keys_;
};

/// Builder for constructing value_array efficiently - O(n) complexity
template <typename MemoryPolicy>
class BasicArrayBuilder {
public:
    using value_type  = BasicValue<MemoryPolicy>;
    using value_box   = BasicValueBox<MemoryPolicy>;
    using value_array = BasicValueArray<MemoryPolicy>;

    BasicArrayBuilder() : transient_(value_array{}.transient()) {}
    explicit BasicArrayBuilder(const value_array& existing) : transient_(existing.transient()) {}

    BasicArrayBuilder(BasicArrayBuilder&&) noexcept = default;
    BasicArrayBuilder& operator=(BasicArrayBuilder&&) noexcept = default;

    BasicArrayBuilder(const BasicArrayBuilder&) = delete;
    BasicArrayBuilder& operator=(const BasicArrayBuilder&) = delete;

    template <typename T>
    BasicArrayBuilder& push_back(T&& val) {
        transient_.push_back(value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicArrayBuilder& push_back(value_type val) {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    BasicArrayBuilder& push_back_box(value_box box) {
        transient_.push_back(std::move(box));
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    typename value_array::transient_type transient_;
};

using ObjectBuilder = BasicObjectBuilder<thread_safe_memory_policy>;
using ArrayBuilder  = BasicArrayBuilder<thread_safe_memory_policy>;

} // namespace json_patch
