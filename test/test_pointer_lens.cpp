// test_pointer_lens.cpp - Tests for pointer_lens
// lager::view / lager::set / lager::over through JSON Pointers

#include <catch2/catch_all.hpp>
#include <json_patch/pointer_lens.h>
#include <json_patch/value_equal.h>

#include <lager/lenses.hpp>

using namespace json_patch;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Value create_test_state() {
    // {
    //   "users": [{"name": "Alice", "age": 30}, {"name": "Bob", "age": 25}],
    //   "settings": {"theme": "dark"}
    // }
    return Value::object({
        {"users", Value::array({
            Value::object({{"name", "Alice"}, {"age", 30}}),
            Value::object({{"name", "Bob"}, {"age", 25}}),
        })},
        {"settings", Value::object({{"theme", "dark"}})},
    });
}

} // namespace

// ============================================================
// view
// ============================================================

TEST_CASE("pointer_lens view", "[lens][view]") {
    auto state = create_test_state();

    SECTION("nested member") {
        auto name = lager::view(pointer_lens("/users/1/name"), state);
        REQUIRE(name.as_string() == "Bob");
    }

    SECTION("tokenized pointer") {
        auto theme = lager::view(pointer_lens(JsonPointer{"settings", "theme"}), state);
        REQUIRE(theme.as_string() == "dark");
    }

    SECTION("root pointer views the whole") {
        auto whole = lager::view(pointer_lens(""), state);
        REQUIRE(whole == state);
    }

    SECTION("missing target views null") {
        REQUIRE(lager::view(pointer_lens("/users/9/name"), state).is_null());
        REQUIRE(lager::view(pointer_lens("/users/-"), state).is_null());
    }

    SECTION("malformed pointer views null") {
        REQUIRE(lager::view(pointer_lens("settings"), state).is_null());
    }
}

// ============================================================
// set
// ============================================================

TEST_CASE("pointer_lens set", "[lens][set]") {
    auto state = create_test_state();

    SECTION("replaces an existing value") {
        auto updated = lager::set(pointer_lens("/users/0/age"), state, Value{31});
        REQUIRE(updated.at("users").at(std::size_t{0}).at("age").as_int64() == 31);
        REQUIRE(state.at("users").at(std::size_t{0}).at("age").as_int64() == 30);
    }

    SECTION("adds a missing member") {
        auto updated = lager::set(pointer_lens("/settings/volume"), state, Value{80});
        REQUIRE(value_to_string(updated.at("settings")) == R"({"theme":"dark","volume":80})");
    }

    SECTION("append token inserts at the end") {
        auto updated = lager::set(pointer_lens("/users/-"), state, Value::object({{"name", "Carol"}}));
        REQUIRE(updated.at("users").size() == 3);
        REQUIRE(updated.at("users").at(std::size_t{2}).at("name").as_string() == "Carol");
    }

    SECTION("root pointer replaces the whole") {
        auto updated = lager::set(pointer_lens(JsonPointer{}), state, Value{"replaced"});
        REQUIRE(updated.as_string() == "replaced");
    }

    SECTION("unresolvable pointer leaves the whole unchanged") {
        auto updated = lager::set(pointer_lens("/nope/deeper"), state, Value{1});
        REQUIRE(updated == state);

        auto out_of_range = lager::set(pointer_lens("/users/7"), state, Value{1});
        REQUIRE(out_of_range == state);
    }

    SECTION("malformed pointer leaves the whole unchanged") {
        auto updated = lager::set(pointer_lens("/a~9"), state, Value{1});
        REQUIRE(updated == state);
    }
}

// ============================================================
// over
// ============================================================

TEST_CASE("pointer_lens over", "[lens][over]") {
    auto state = create_test_state();

    auto older = lager::over(pointer_lens("/users/1/age"), state, [](Value age) {
        return Value{age.as_int64() + 1};
    });

    REQUIRE(older.at("users").at(std::size_t{1}).at("age").as_int64() == 26);
}

TEST_CASE("string and tokenized pointers focus the same value", "[lens][pointer]") {
    auto state = create_test_state();

    auto by_string = pointer_lens("/users/0/name");
    auto by_tokens = pointer_lens(JsonPointer{"users", "0", "name"});

    REQUIRE(lager::view(by_string, state) == lager::view(by_tokens, state));

    auto renamed = lager::set(by_tokens, state, Value{"Alicia"});
    REQUIRE(lager::view(by_string, renamed).as_string() == "Alicia");
    REQUIRE(lager::view(pointer_lens("/users/1/name"), renamed).as_string() == "Bob");
}
