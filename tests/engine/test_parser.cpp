/**
 * Unit tests for the executable document parser.
 */

#include <catch2/catch_test_macros.hpp>
#include <grommet/engine/parser.h>

#include <string>

using namespace grommet::engine;

namespace {
    ParseError parse_failure(std::string_view query) {
        try {
            parse_query(query);
        } catch (const ParseError &e) {
            return e;
        }
        FAIL("expected a parse error for: " << query);
        return ParseError("unreachable");
    }

    AstValue literal(std::string_view text) {
        Parser parser(text);
        return parser.parse_value_literal();
    }
}

// ============================================================================
// Operations
// ============================================================================

TEST_CASE("Parser - anonymous shorthand query", "[parser]") {
    auto doc = parse_query("{ hello }");

    REQUIRE(doc.operations.size() == 1);
    const auto &op = doc.operations.front();
    REQUIRE(op.type == OperationType::Query);
    REQUIRE_FALSE(op.name.has_value());
    REQUIRE(op.selection_set.size() == 1);
    REQUIRE(op.selection_set.front().name == "hello");
    REQUIRE(op.location == Location{1, 1});
}

TEST_CASE("Parser - named operations with variables and defaults", "[parser]") {
    auto doc = parse_query(R"(
        mutation Save($id: ID!, $tags: [String] = ["a", "b"]) {
            save(id: $id, tags: $tags) { ok }
        }
        subscription Ticks { tick }
    )");

    REQUIRE(doc.operations.size() == 2);
    REQUIRE(doc.has_subscription());

    const auto &save = doc.operations[0];
    REQUIRE(save.type == OperationType::Mutation);
    REQUIRE(save.name == "Save");
    REQUIRE(save.variables.size() == 2);
    REQUIRE(save.variables[0].type.to_string() == "ID!");
    REQUIRE(save.variables[1].default_value.has_value());
    REQUIRE(save.variables[1].default_value->items.size() == 2);

    const auto &field = save.selection_set.front();
    REQUIRE(field.arguments.size() == 2);
    REQUIRE(field.arguments[0].value.kind == AstValue::Kind::Variable);
    REQUIRE(field.arguments[0].value.text == "id");
    REQUIRE(field.selection_set.front().name == "ok");

    REQUIRE(doc.operations[1].type == OperationType::Subscription);
}

// ============================================================================
// Selections
// ============================================================================

TEST_CASE("Parser - aliases, directives and fragments", "[parser]") {
    auto doc = parse_query(R"(
        query {
            first: user(id: 1) @include(if: true) { ...UserFields }
            ... on Query { version }
            ... @skip(if: false) { motd }
        }
        fragment UserFields on User { name }
    )");

    const auto &selections = doc.operations.front().selection_set;
    REQUIRE(selections.size() == 3);

    REQUIRE(selections[0].alias == "first");
    REQUIRE(selections[0].name == "user");
    REQUIRE(selections[0].response_key() == "first");
    REQUIRE(selections[0].directives.front().name == "include");
    REQUIRE(selections[0].selection_set.front().kind == Selection::Kind::FragmentSpread);

    REQUIRE(selections[1].kind == Selection::Kind::InlineFragment);
    REQUIRE(selections[1].type_condition == "Query");

    REQUIRE(selections[2].kind == Selection::Kind::InlineFragment);
    REQUIRE_FALSE(selections[2].type_condition.has_value());

    REQUIRE(doc.fragments.contains("UserFields"));
    REQUIRE(doc.fragments.at("UserFields").type_condition == "User");
}

TEST_CASE("Parser - commas and comments are ignored", "[parser]") {
    auto doc = parse_query("{ a, b # trailing comment\n, c }");
    REQUIRE(doc.operations.front().selection_set.size() == 3);
}

TEST_CASE("Parser - locations are one based line and column", "[parser]") {
    auto doc = parse_query("{\n  a\n    b\n}");
    const auto &selections = doc.operations.front().selection_set;
    REQUIRE(selections[0].location == Location{2, 3});
    REQUIRE(selections[1].location == Location{3, 5});
}

// ============================================================================
// Values
// ============================================================================

TEST_CASE("Parser - scalar literals", "[parser][values]") {
    CHECK(literal("12").int_value == 12);
    CHECK(literal("-3").int_value == -3);
    CHECK(literal("1.5e2").float_value == 150.0);
    CHECK(literal("true").bool_value);
    CHECK(literal("null").kind == AstValue::Kind::Null);
    CHECK(literal("RED").kind == AstValue::Kind::Enum);
    CHECK(literal("RED").text == "RED");
}

TEST_CASE("Parser - string escapes", "[parser][values]") {
    CHECK(literal(R"("a\nb")").text == "a\nb");
    CHECK(literal(R"("\u00e9")").text == "\xc3\xa9");
    CHECK(literal(R"("quote \" inside")").text == "quote \" inside");
}

TEST_CASE("Parser - block strings strip common indentation", "[parser][values]") {
    auto value = literal("\"\"\"\n    Hello,\n      World!\n\n    Yours\n  \"\"\"");
    REQUIRE(value.kind == AstValue::Kind::String);
    REQUIRE(value.text == "Hello,\n  World!\n\nYours");
}

TEST_CASE("Parser - object and list literals", "[parser][values]") {
    auto value = literal(R"({name: "x", tags: [1, 2], nested: {on: true}})");
    REQUIRE(value.kind == AstValue::Kind::Object);
    REQUIRE(value.fields.size() == 3);
    REQUIRE(value.fields[1].second.items.size() == 2);
    REQUIRE(value.fields[2].second.fields.front().first == "on");
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Parser - syntax errors carry a location", "[parser][errors]") {
    auto error = parse_failure("{ a(x: ) }");
    REQUIRE(std::string(error.what()) == "Syntax Error: Unexpected \")\"");
    REQUIRE(error.locations.front() == Location{1, 8});
}

TEST_CASE("Parser - empty document and unterminated input", "[parser][errors]") {
    CHECK(std::string(parse_failure("").what()) == "Syntax Error: Unexpected <EOF>");
    CHECK(std::string(parse_failure("{ a").what()) == "Syntax Error: Unexpected <EOF>");
    CHECK(std::string(parse_failure("{ a(s: \"open) }").what()) == "Syntax Error: Unterminated string");
}

TEST_CASE("Parser - duplicate fragment names are rejected", "[parser][errors]") {
    REQUIRE_THROWS_AS(parse_query("{ a } fragment F on Q { a } fragment F on Q { b }"), QueryError);
}

TEST_CASE("Parser - nesting is limited", "[parser][errors]") {
    auto repeat = [](std::string_view text, size_t count) {
        std::string out;
        for (size_t i = 0; i < count; ++i) { out += text; }
        return out;
    };
    const std::string message = "Syntax Error: Nesting deeper than 64 levels";

    SECTION("list values") {
        // The enclosing selection set is the first level.
        REQUIRE_NOTHROW(parse_query("{ f(a: " + repeat("[", 63) + repeat("]", 63) + ") }"));
        auto error = parse_failure("{ f(a: " + repeat("[", 100000) + repeat("]", 100000) + ") }");
        REQUIRE(std::string(error.what()) == message);
        REQUIRE(error.locations.front() == Location{1, 71});
    }

    SECTION("object values") {
        auto error = parse_failure("{ f(a: " + repeat("{b: ", 100000) + "1" + repeat("}", 100000) + ") }");
        REQUIRE(std::string(error.what()) == message);
    }

    SECTION("selection sets") {
        REQUIRE_NOTHROW(parse_query(repeat("{ a ", 64) + repeat("}", 64)));
        auto error = parse_failure(repeat("{ a ", 100000) + repeat("}", 100000));
        REQUIRE(std::string(error.what()) == message);
        REQUIRE(error.locations.front() == Location{1, 257});
    }

    SECTION("list types") {
        auto error = parse_failure("query ($v: " + repeat("[", 1000) + "Int" + repeat("]", 1000) + ") { a }");
        REQUIRE(std::string(error.what()) == message);
    }
}
