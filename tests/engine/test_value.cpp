/**
 * Unit tests for grommet::engine::Value
 *
 * Covers the kinds, object ordering and the literal printing used by SDL defaults and error messages.
 */

#include <catch2/catch_test_macros.hpp>
#include <grommet/engine/value.h>

using namespace grommet::engine;

// ============================================================================
// Kinds
// ============================================================================

TEST_CASE("Value - default constructed value is null", "[value]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE(v.kind() == Value::Kind::Null);
    REQUIRE(Value(nullptr).is_null());
}

TEST_CASE("Value - integral types are stored as Int", "[value]") {
    REQUIRE(Value(42).is_int());
    REQUIRE(Value(int64_t{-7}).as_int() == -7);
    REQUIRE(Value(true).is_bool());
    REQUIRE_FALSE(Value(true).is_int());
}

TEST_CASE("Value - ints widen to float", "[value]") {
    REQUIRE(Value(3).as_float() == 3.0);
    REQUIRE(Value(2.5).as_float() == 2.5);
}

TEST_CASE("Value - enum and binary are distinct from strings", "[value]") {
    auto e = Value::enum_value("RED");
    auto b = Value::binary("raw");
    REQUIRE(e.is_enum());
    REQUIRE(e.as_enum() == "RED");
    REQUIRE(b.is_bytes());
    REQUIRE(b.as_bytes() == "raw");
    REQUIRE_FALSE(e == Value("RED"));
}

// ============================================================================
// Objects
// ============================================================================

TEST_CASE("Value - object keeps insertion order", "[value][object]") {
    auto obj = Value::object({{"b", 1}, {"a", 2}});
    REQUIRE(obj.as_object()[0].first == "b");
    REQUIRE(obj.as_object()[1].first == "a");
}

TEST_CASE("Value - set replaces in place", "[value][object]") {
    auto obj = Value::object({{"b", 1}, {"a", 2}});
    obj.set("b", 10);
    obj.set("c", 3);

    REQUIRE(obj.as_object().size() == 3);
    REQUIRE(obj.as_object()[0].first == "b");
    REQUIRE(obj.find("b")->as_int() == 10);
    REQUIRE(obj.as_object()[2].first == "c");
}

TEST_CASE("Value - find on a non object returns nullptr", "[value][object]") {
    REQUIRE(Value(1).find("a") == nullptr);
    REQUIRE(Value::object().find("missing") == nullptr);
}

// ============================================================================
// Printing
// ============================================================================

TEST_CASE("Value - to_string prints GraphQL literals", "[value][print]") {
    CHECK(Value().to_string() == "null");
    CHECK(Value(true).to_string() == "true");
    CHECK(Value(12).to_string() == "12");
    CHECK(Value(1.0).to_string() == "1.0");
    CHECK(Value(1.5).to_string() == "1.5");
    CHECK(Value("a\"b").to_string() == "\"a\\\"b\"");
    CHECK(Value::enum_value("RED").to_string() == "RED");
    CHECK(Value::list({1, 2}).to_string() == "[1, 2]");
    CHECK(Value::object({{"x", 1}, {"y", "z"}}).to_string() == "{x: 1, y: \"z\"}");
}

TEST_CASE("Value - quote_string escapes control characters", "[value][print]") {
    CHECK(quote_string("line\nbreak") == "\"line\\nbreak\"");
    CHECK(quote_string("back\\slash") == "\"back\\\\slash\"");
}
