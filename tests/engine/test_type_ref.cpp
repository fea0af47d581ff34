/**
 * Unit tests for grommet::engine::TypeRef
 */

#include <catch2/catch_test_macros.hpp>
#include <grommet/engine/type_ref.h>
#include <grommet/util/errors.h>

using namespace grommet::engine;

TEST_CASE("TypeRef - parses the compact forms", "[type_ref]") {
    auto named = TypeRef::parse("Int");
    REQUIRE(named.is_named());
    REQUIRE(named.name() == "Int");

    auto non_null = TypeRef::parse("Int!");
    REQUIRE(non_null.is_non_null());
    REQUIRE(non_null.of_type().name() == "Int");

    auto list = TypeRef::parse("[Int!]!");
    REQUIRE(list.is_non_null());
    REQUIRE(list.of_type().is_list());
    REQUIRE(list.of_type().of_type().is_non_null());
    REQUIRE(list.base_name() == "Int");
}

TEST_CASE("TypeRef - parse tolerates whitespace", "[type_ref]") {
    REQUIRE(TypeRef::parse(" [ User ! ] ") == TypeRef::list(TypeRef::named_nn("User")));
}

TEST_CASE("TypeRef - to_string round trips", "[type_ref]") {
    for (auto text: {"ID", "ID!", "[ID]", "[[ID!]]!"}) {
        CHECK(TypeRef::parse(text).to_string() == text);
    }
}

TEST_CASE("TypeRef - non_null is idempotent", "[type_ref]") {
    auto once = TypeRef::non_null(TypeRef::named("X"));
    REQUIRE(TypeRef::non_null(once) == once);
}

TEST_CASE("TypeRef - malformed references are rejected", "[type_ref]") {
    CHECK_THROWS_AS(TypeRef::parse(""), grommet::ValidationError);
    CHECK_THROWS_AS(TypeRef::parse("[Int"), grommet::ValidationError);
    CHECK_THROWS_AS(TypeRef::parse("Int]"), grommet::ValidationError);
    CHECK_THROWS_AS(TypeRef::parse("1Int"), grommet::ValidationError);
    CHECK_THROWS_AS(TypeRef::parse("Int!!"), grommet::ValidationError);
}
