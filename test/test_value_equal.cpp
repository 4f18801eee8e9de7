// test_value_equal.cpp - Tests for deep structural equality

#include <catch2/catch_all.hpp>
#include <json_patch/value_equal.h>

#include <cstdint>
#include <limits>

using namespace json_patch;

TEST_CASE("scalar equality", "[equal][scalar]") {
    REQUIRE(values_equal(Value{}, Value{nullptr}));
    REQUIRE(values_equal(Value{true}, Value{true}));
    REQUIRE_FALSE(values_equal(Value{true}, Value{false}));
    REQUIRE(values_equal(Value{"abc"}, Value{"abc"}));
    REQUIRE_FALSE(values_equal(Value{"abc"}, Value{"abd"}));
    REQUIRE_FALSE(values_equal(Value{"abc"}, Value{"ABC"}));
}

TEST_CASE("number equality is by mathematical value", "[equal][number]") {
    SECTION("integer and double with the same value") {
        REQUIRE(values_equal(Value{1}, Value{1.0}));
        REQUIRE(values_equal(Value{-3.0}, Value{-3}));
        REQUIRE(values_equal(Value{0}, Value{-0.0}));
    }

    SECTION("different values") {
        REQUIRE_FALSE(values_equal(Value{1}, Value{1.5}));
        REQUIRE_FALSE(values_equal(Value{1}, Value{2}));
        REQUIRE_FALSE(values_equal(Value{0.1}, Value{0.2}));
    }

    SECTION("large integers are not rounded through double") {
        const int64_t big = (int64_t{1} << 53) + 1;
        const double rounded = static_cast<double>(int64_t{1} << 53);
        REQUIRE_FALSE(values_equal(Value{big}, Value{rounded}));
        REQUIRE(values_equal(Value{big - 1}, Value{rounded}));
    }

    SECTION("non-finite doubles never equal an integer") {
        REQUIRE_FALSE(values_equal(Value{0}, Value{std::numeric_limits<double>::quiet_NaN()}));
        REQUIRE_FALSE(values_equal(Value{INT64_MAX}, Value{std::numeric_limits<double>::infinity()}));
    }
}

TEST_CASE("cross-kind values are never equal", "[equal][kind]") {
    REQUIRE_FALSE(values_equal(Value{}, Value{false}));
    REQUIRE_FALSE(values_equal(Value{0}, Value{false}));
    REQUIRE_FALSE(values_equal(Value{"1"}, Value{1}));
    REQUIRE_FALSE(values_equal(Value::array({}), Value::object({})));
    REQUIRE_FALSE(values_equal(Value::array({}), Value{}));
}

TEST_CASE("array equality is ordered", "[equal][array]") {
    REQUIRE(values_equal(Value::array({1, "a", true}), Value::array({1, "a", true})));
    REQUIRE_FALSE(values_equal(Value::array({1, 2}), Value::array({2, 1})));
    REQUIRE_FALSE(values_equal(Value::array({1, 2}), Value::array({1, 2, 3})));
    REQUIRE(values_equal(Value::array({1, 2.0}), Value::array({1.0, 2})));
}

TEST_CASE("object equality ignores member order", "[equal][object]") {
    auto a = Value::object({{"x", 1}, {"y", Value::array({1, 2})}});
    auto b = Value::object({{"y", Value::array({1, 2})}, {"x", 1}});

    REQUIRE(values_equal(a, b));
    REQUIRE(a == b);

    SECTION("extra key") {
        auto c = Value::object({{"x", 1}, {"y", Value::array({1, 2})}, {"z", 0}});
        REQUIRE_FALSE(values_equal(a, c));
        REQUIRE_FALSE(values_equal(c, a));
    }

    SECTION("different key set of equal size") {
        auto c = Value::object({{"x", 1}, {"w", Value::array({1, 2})}});
        REQUIRE_FALSE(values_equal(a, c));
    }

    SECTION("different nested value") {
        auto c = Value::object({{"x", 1}, {"y", Value::array({1, 3})}});
        REQUIRE_FALSE(values_equal(a, c));
    }
}

TEST_CASE("shared subtrees compare equal", "[equal][sharing]") {
    ValueBox shared{Value::object({{"deep", Value::array({1, 2, 3})}})};

    Value a{ValueObject{}.set("child", shared).set("tag", ValueBox{Value{"a"}})};
    Value b{ValueObject{}.set("tag", ValueBox{Value{"a"}}).set("child", shared)};

    REQUIRE(values_equal(a, b));
    REQUIRE(values_equal(*shared, *shared));
}
