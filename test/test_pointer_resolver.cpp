// test_pointer_resolver.cpp - Tests for slot resolution and value_at

#include <catch2/catch_all.hpp>
#include <json_patch/pointer_resolver.h>

using namespace json_patch;

// ============================================================
// Helper Functions
// ============================================================

namespace {

// {
//   "users": [{"name": "Alice"}, {"name": "Bob"}],
//   "settings": {"theme": "dark"},
//   "count": 2
// }
Document make_doc() {
    return Document{Value::object({
        {"users", Value::array({
            Value::object({{"name", "Alice"}}),
            Value::object({{"name", "Bob"}}),
        })},
        {"settings", Value::object({{"theme", "dark"}})},
        {"count", 2},
    })};
}

} // namespace

// ============================================================
// resolve
// ============================================================

TEST_CASE("resolve the empty pointer", "[resolver][root]") {
    auto doc = make_doc();
    auto result = resolve(doc, {});

    REQUIRE(result);
    REQUIRE(result.slot.is_root);
    REQUIRE(result.slot.existed);
    REQUIRE(same_node(result.slot.target, doc));
}

TEST_CASE("resolve object members", "[resolver][object]") {
    auto doc = make_doc();

    SECTION("existing key") {
        auto result = resolve(doc, JsonPointer{"settings", "theme"});
        REQUIRE(result);
        REQUIRE_FALSE(result.slot.in_array);
        REQUIRE(result.slot.existed);
        REQUIRE(result.slot.token == "theme");
        REQUIRE(result.slot.target->as_string() == "dark");
    }

    SECTION("missing final key still resolves") {
        auto result = resolve(doc, JsonPointer{"settings", "volume"});
        REQUIRE(result);
        REQUIRE_FALSE(result.slot.existed);
        REQUIRE(result.slot.parent->is_object());
    }

    SECTION("missing intermediate key") {
        auto result = resolve(doc, JsonPointer{"nope", "theme"});
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::TargetNotFound);
    }

    SECTION("final token on a scalar parent") {
        auto result = resolve(doc, JsonPointer{"count", "x"});
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::TargetNotFound);
    }
}

TEST_CASE("resolve array positions", "[resolver][array]") {
    auto doc = make_doc();

    SECTION("in-range index") {
        auto result = resolve(doc, JsonPointer{"users", "1"});
        REQUIRE(result);
        REQUIRE(result.slot.in_array);
        REQUIRE(result.slot.existed);
        REQUIRE(result.slot.index == 1);
        REQUIRE(result.slot.target->at("name").as_string() == "Bob");
    }

    SECTION("index equal to size") {
        auto result = resolve(doc, JsonPointer{"users", "2"});
        REQUIRE(result);
        REQUIRE_FALSE(result.slot.existed);
        REQUIRE(result.slot.index == 2);
    }

    SECTION("append token") {
        auto result = resolve(doc, JsonPointer{"users", "-"});
        REQUIRE(result);
        REQUIRE(result.slot.append);
        REQUIRE_FALSE(result.slot.existed);
        REQUIRE(result.slot.index == 2);
    }

    SECTION("non-numeric final token") {
        auto result = resolve(doc, JsonPointer{"users", "first"});
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::IndexOutOfBounds);
    }

    SECTION("leading zero final token") {
        auto result = resolve(doc, JsonPointer{"users", "01"});
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::IndexOutOfBounds);
    }

    SECTION("out-of-range intermediate index") {
        auto result = resolve(doc, JsonPointer{"users", "5", "name"});
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::TargetNotFound);
    }

    SECTION("append token is not a valid intermediate token") {
        auto result = resolve(doc, JsonPointer{"users", "-", "name"});
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::TargetNotFound);
    }
}

TEST_CASE("resolve shares nodes with the document", "[resolver][sharing]") {
    auto doc = make_doc();
    auto result = resolve(doc, JsonPointer{"settings", "theme"});
    REQUIRE(result);

    const auto* settings = doc->get_if<ValueObject>()->find("settings");
    REQUIRE(settings != nullptr);
    REQUIRE(same_node(result.slot.parent, *settings));
}

// ============================================================
// value_at
// ============================================================

TEST_CASE("value_at reads existing values", "[resolver][value_at]") {
    auto doc = make_doc();

    REQUIRE(value_at(doc, JsonPointer{"users", "0", "name"}).get().as_string() == "Alice");
    REQUIRE(value_at(doc, JsonPointer{"count"}).get().as_int64() == 2);
    REQUIRE(same_node(value_at(doc, {}).value, doc));
}

TEST_CASE("value_at failures", "[resolver][value_at][error]") {
    auto doc = make_doc();

    SECTION("missing key") {
        auto result = value_at(doc, JsonPointer{"settings", "volume"});
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::TargetNotFound);
        REQUIRE(result.get_or(Value{"fallback"}).as_string() == "fallback");
    }

    SECTION("index past the end") {
        auto result = value_at(doc, JsonPointer{"users", "2"});
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::TargetNotFound);
    }

    SECTION("append token never addresses a value") {
        auto result = value_at(doc, JsonPointer{"users", "-"});
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::InvalidPointerToken);
    }

    SECTION("get() throws with the error code") {
        auto result = value_at(doc, JsonPointer{"nope"});
        try {
            (void)result.get();
            FAIL("expected PatchError");
        } catch (const PatchError& e) {
            REQUIRE(e.code() == PatchErrorCode::TargetNotFound);
        }
    }
}
