// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Immutable JSON value model backed by immer persistent containers.
///
/// This file defines the Value type that can represent:
/// - Primitive types: null, bool, integer / floating point number, string
/// - Array: ordered sequence (immer::flex_vector, O(log n) insert/erase)
/// - Object: string-keyed members with insertion order preserved
///
/// Every child of a container is held through an immer::box, so a subtree
/// can be shared by reference between an old document and a new one.
/// Nothing in a Value tree is ever mutated after construction.
///
/// The Value type is templated on an immer memory policy. The library
/// instantiates it with atomic reference counting only.

#pragma once

#include <json_patch/json_patch_config.h>
#include <json_patch/api.h>

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace json_patch {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSON_PATCH_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSON_PATCH_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSON_PATCH_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                 BasicValueBox<MemoryPolicy>,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueArray = immer::flex_vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicKeyList = immer::flex_vector<std::string, MemoryPolicy>;

// ============================================================
// BasicValueObject - insertion-ordered JSON object
//
// immer::map gives O(log n) lookup but no iteration order, so the
// member keys are additionally kept in a flex_vector in the order
// they were first inserted. Both halves are persistent: set() and
// erase() return a new object and leave this one untouched.
// ============================================================

template <typename MemoryPolicy>
class BasicValueObject {
public:
    using value_box  = BasicValueBox<MemoryPolicy>;
    using member_map = BasicValueMap<MemoryPolicy>;
    using key_list   = BasicKeyList<MemoryPolicy>;

    BasicValueObject() = default;
    BasicValueObject(member_map members, key_list keys)
        : members_(std::move(members)), keys_(std::move(keys)) {}

    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }

    [[nodiscard]] const value_box* find(const std::string& key) const { return members_.find(key); }
    [[nodiscard]] std::size_t count(const std::string& key) const { return members_.count(key); }

    [[nodiscard]] const member_map& members() const noexcept { return members_; }
    [[nodiscard]] const key_list& keys() const noexcept { return keys_; }

    /// Insert or overwrite a member. An existing key keeps its position,
    /// a new key is appended after the last one.
    [[nodiscard]] BasicValueObject set(const std::string& key, value_box val) const {
        if (members_.count(key) > 0) {
            return BasicValueObject{members_.set(key, std::move(val)), keys_};
        }
        return BasicValueObject{members_.set(key, std::move(val)), keys_.push_back(key)};
    }

    /// Remove a member; the remaining keys keep their relative order.
    [[nodiscard]] BasicValueObject erase(const std::string& key) const {
        auto it = std::find(keys_.begin(), keys_.end(), key);
        if (it == keys_.end()) {
            return *this;
        }
        auto pos = static_cast<std::size_t>(std::distance(keys_.begin(), it));
        return BasicValueObject{members_.erase(key), keys_.erase(pos)};
    }

    /// Visit members in insertion order: fn(const std::string&, const value_box&)
    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& key : keys_) {
            if (auto* found = members_.find(key)) {
                fn(key, *found);
            }
        }
    }

private:
    member_map members_;
    key_list keys_;
};

using Token       = std::string;
using JsonPointer = std::vector<Token>;

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_array   = BasicValueArray<MemoryPolicy>;
    using value_object  = BasicValueObject<MemoryPolicy>;
    using key_list      = BasicKeyList<MemoryPolicy>;

    std::variant<std::monostate,
                 bool,
                 int64_t,
                 double,
                 std::string,
                 value_object,
                 value_array>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}
    constexpr BasicValue(int v) noexcept : data(std::in_place_type<int64_t>, v) {}
    constexpr BasicValue(int64_t v) noexcept : data(v) {}
    constexpr BasicValue(double v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_object v) : data(std::move(v)) {}
    BasicValue(value_array v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue object(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto members = value_map{}.transient();
        auto keys = key_list{}.transient();
        for (const auto& [key, val] : init) {
            if (members.count(key) == 0) {
                keys.push_back(key);
            }
            members.set(key, value_box{val});
        }
        return BasicValue{value_object{members.persistent(), keys.persistent()}};
    }

    static BasicValue array(std::initializer_list<BasicValue> init) {
        auto t = value_array{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<value_object>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_array>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_object() || is_array(); }

    [[nodiscard]] const char* type_name() const noexcept {
        switch (data.index()) {
            case 0: return "null";
            case 1: return "boolean";
            case 2:
            case 3: return "number";
            case 4: return "string";
            case 5: return "object";
            case 6: return "array";
            default: return "unknown";
        }
    }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* o = get_if<value_object>()) {
            if (auto* found = o->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* a = get_if<value_array>()) {
            if (index < a->size()) return (*a)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* o = get_if<value_object>()) return o->count(key) > 0;
        return false;
    }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* a = get_if<value_array>()) return index < a->size();
        return false;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* o = get_if<value_object>()) return o->size();
        if (auto* a = get_if<value_array>()) return a->size();
        return 0;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    using size_type = std::size_t;
};

// ============================================================
// Memory Policy Definitions
// ============================================================

/// Thread-safe memory policy: atomic refcount + spinlock
using thread_safe_memory_policy = immer::default_memory_policy;

// ============================================================
// ThreadSafeValue - Value whose nodes may be shared across threads
//
// The patch engine works on this type: a single source document
// may be handed to several concurrent apply() calls, and each of
// them takes and drops references to the shared subtrees.
// ============================================================
using ThreadSafeValue       = BasicValue<thread_safe_memory_policy>;
using ThreadSafeValueBox    = BasicValueBox<thread_safe_memory_policy>;
using ThreadSafeValueObject = BasicValueObject<thread_safe_memory_policy>;
using ThreadSafeValueArray  = BasicValueArray<thread_safe_memory_policy>;

// ============================================================
// Default Value Type Aliases
//
//   - Value    : ThreadSafeValue, what the patch engine consumes
//   - Document : boxed root of a Value tree; the box node identity
//                is what "same document" means
// ============================================================

using Value       = ThreadSafeValue;
using ValueBox    = ThreadSafeValueBox;
using ValueObject = ThreadSafeValueObject;
using ValueArray  = ThreadSafeValueArray;
using ValueMap    = BasicValueMap<thread_safe_memory_policy>;
using KeyList     = BasicKeyList<thread_safe_memory_policy>;
using Document    = ValueBox;

/// @brief Reference identity: both boxes point at the same allocated node
[[nodiscard]] inline bool same_node(const ValueBox& a, const ValueBox& b) noexcept
{
    return &a.get() == &b.get();
}

// ============================================================
// Utility functions
// ============================================================

/// Compact JSON rendering, object members in insertion order
[[nodiscard]] JSON_PATCH_API std::string value_to_string(const Value& val);

/// Print Value with indentation (one member / element per line)
JSON_PATCH_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

JSON_PATCH_API std::ostream& operator<<(std::ostream& os, const Value& val);

// ============================================================
// Extern Template Declarations
//
// The actual instantiations are in value.cpp.
// ============================================================

extern template struct BasicValue<thread_safe_memory_policy>;
extern template class BasicValueObject<thread_safe_memory_policy>;

} // namespace json_patch
