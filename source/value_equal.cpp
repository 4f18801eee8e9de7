// value_equal.cpp - Deep equality for Value trees

#include <json_patch/value_equal.h>

#include <cmath>

namespace json_patch {

namespace {

bool int_equals_double(int64_t i, double d)
{
    if (!std::isfinite(d) || std::trunc(d) != d) {
        return false;
    }
    // [-2^63, 2^63) is exactly the range that converts to int64_t
    constexpr double lower = -9223372036854775808.0;
    constexpr double upper = 9223372036854775808.0;
    if (d < lower || d >= upper) {
        return false;
    }
    return static_cast<int64_t>(d) == i;
}

bool boxes_equal(const ValueBox& a, const ValueBox& b)
{
    if (same_node(a, b)) [[likely]] {
        return true;
    }
    return values_equal(*a, *b);
}

bool numbers_equal(const Value& a, const Value& b)
{
    if (auto* ai = a.get_if<int64_t>()) {
        if (auto* bi = b.get_if<int64_t>()) return *ai == *bi;
        if (auto* bd = b.get_if<double>()) return int_equals_double(*ai, *bd);
        return false;
    }
    if (auto* ad = a.get_if<double>()) {
        if (auto* bd = b.get_if<double>()) return *ad == *bd;
        if (auto* bi = b.get_if<int64_t>()) return int_equals_double(*bi, *ad);
    }
    return false;
}

bool objects_equal(const ValueObject& a, const ValueObject& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    // Same size + every key of a found in b => same key set
    for (const auto& key : a.keys()) {
        const ValueBox* lhs = a.find(key);
        const ValueBox* rhs = b.find(key);
        if (lhs == nullptr || rhs == nullptr || !boxes_equal(*lhs, *rhs)) {
            return false;
        }
    }
    return true;
}

bool arrays_equal(const ValueArray& a, const ValueArray& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!boxes_equal(a[i], b[i])) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

bool values_equal(const Value& a, const Value& b)
{
    if (&a == &b) {
        return true;
    }
    if (a.is_number() && b.is_number()) {
        return numbers_equal(a, b);
    }
    if (a.type_index() != b.type_index()) {
        return false;
    }

    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);

        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            return objects_equal(lhs, rhs);
        } else if constexpr (std::is_same_v<T, ValueArray>) {
            return arrays_equal(lhs, rhs);
        } else {
            // bool, std::string (numbers handled above)
            return lhs == rhs;
        }
    }, a.data);
}

} // namespace json_patch
