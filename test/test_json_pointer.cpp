// test_json_pointer.cpp - Tests for JSON Pointer (RFC 6901) parsing and helpers

#include <catch2/catch_all.hpp>
#include <json_patch/json_pointer.h>

#include <string>

using namespace json_patch;

// ============================================================
// parse_json_pointer
// ============================================================

TEST_CASE("parse_json_pointer basic paths", "[pointer][parse]") {
    SECTION("empty string is the whole document") {
        auto result = parse_json_pointer("");
        REQUIRE(result);
        REQUIRE(result.pointer.empty());
    }

    SECTION("single slash is the empty key") {
        auto result = parse_json_pointer("/");
        REQUIRE(result);
        REQUIRE(result.pointer == JsonPointer{""});
    }

    SECTION("multi-token path") {
        auto result = parse_json_pointer("/users/0/name");
        REQUIRE(result);
        REQUIRE(result.pointer == JsonPointer{"users", "0", "name"});
    }

    SECTION("trailing slash yields a trailing empty token") {
        auto result = parse_json_pointer("/a/");
        REQUIRE(result);
        REQUIRE(result.pointer == JsonPointer{"a", ""});
    }

    SECTION("append token is kept verbatim") {
        auto result = parse_json_pointer("/list/-");
        REQUIRE(result);
        REQUIRE(result.pointer.back() == "-");
    }
}

TEST_CASE("parse_json_pointer unescapes tokens", "[pointer][parse][escape]") {
    SECTION("~1 is a slash") {
        REQUIRE(parse_json_pointer("/a~1b").get() == JsonPointer{"a/b"});
    }

    SECTION("~0 is a tilde") {
        REQUIRE(parse_json_pointer("/m~0n").get() == JsonPointer{"m~n"});
    }

    SECTION("~01 decodes to ~1, not to a slash") {
        REQUIRE(parse_json_pointer("/~01").get() == JsonPointer{"~1"});
    }
}

TEST_CASE("parse_json_pointer rejects malformed input", "[pointer][parse][error]") {
    SECTION("missing leading slash") {
        auto result = parse_json_pointer("users");
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::InvalidPointerToken);
    }

    SECTION("unknown escape") {
        auto result = parse_json_pointer("/a~2");
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::InvalidPointerToken);
    }

    SECTION("dangling tilde") {
        auto result = parse_json_pointer("/a~");
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == PatchErrorCode::InvalidPointerToken);
    }

    SECTION("get() throws PatchError") {
        auto result = parse_json_pointer("nope");
        REQUIRE_THROWS_AS(result.get(), PatchError);
    }
}

// ============================================================
// to_string
// ============================================================

TEST_CASE("to_string escapes tokens", "[pointer][string]") {
    REQUIRE(to_string(JsonPointer{}) == "");
    REQUIRE(to_string(JsonPointer{""}) == "/");
    REQUIRE(to_string(JsonPointer{"a/b", "m~n", "0"}) == "/a~1b/m~0n/0");

    const std::string text = "/x~1y/~0/-";
    REQUIRE(to_string(parse_json_pointer(text).get()) == text);
}

// ============================================================
// Helpers
// ============================================================

TEST_CASE("is_prefix_of", "[pointer][prefix]") {
    const JsonPointer foo{"foo"};
    const JsonPointer foo_bar{"foo", "bar"};
    const JsonPointer fo{"fo"};

    REQUIRE(is_prefix_of(JsonPointer{}, foo_bar));
    REQUIRE(is_prefix_of(foo, foo_bar));
    REQUIRE(is_prefix_of(foo_bar, foo_bar));
    REQUIRE_FALSE(is_prefix_of(foo_bar, foo));
    REQUIRE_FALSE(is_prefix_of(fo, foo_bar));
}

TEST_CASE("parent_of", "[pointer][parent]") {
    REQUIRE(parent_of(JsonPointer{"a", "b", "c"}) == JsonPointer{"a", "b"});
    REQUIRE(parent_of(JsonPointer{"a"}).empty());
    REQUIRE(parent_of(JsonPointer{}).empty());
}

TEST_CASE("parse_array_index", "[pointer][index]") {
    SECTION("valid indices") {
        REQUIRE(parse_array_index("0") == std::size_t{0});
        REQUIRE(parse_array_index("7") == std::size_t{7});
        REQUIRE(parse_array_index("120") == std::size_t{120});
    }

    SECTION("leading zeros are rejected") {
        REQUIRE_FALSE(parse_array_index("01").has_value());
        REQUIRE_FALSE(parse_array_index("00").has_value());
    }

    SECTION("non-numeric and signed tokens are rejected") {
        REQUIRE_FALSE(parse_array_index("").has_value());
        REQUIRE_FALSE(parse_array_index("-1").has_value());
        REQUIRE_FALSE(parse_array_index("+1").has_value());
        REQUIRE_FALSE(parse_array_index("1a").has_value());
        REQUIRE_FALSE(parse_array_index("abc").has_value());
    }

    SECTION("overflow is rejected") {
        REQUIRE_FALSE(parse_array_index("99999999999999999999999").has_value());
    }

    SECTION("append token only where allowed") {
        REQUIRE_FALSE(parse_array_index("-").has_value());
        REQUIRE(parse_array_index("-", true, 3) == std::size_t{3});
    }
}
