/**
 * Tests for the lookahead and context objects handed to resolvers.
 */

#include <catch2/catch_test_macros.hpp>

#include "python_test_support.h"

using namespace grommet::testing;

namespace {
    // Query.user records what its resolver saw through the context.
    constexpr const char *recording_schema = R"(
        seen = {}

        def user(parent, context):
            graph = context.graph
            seen["fields"] = sorted(graph.fields)
            seen["requests_name"] = graph.requests("name")
            seen["requests_email"] = graph.requests("email")
            seen["friend_fields"] = sorted(graph.peek("friend").fields)
            seen["missing"] = graph.peek("email")
            seen["missing_child"] = graph.peek("email").peek("anything")
            seen["state"] = context.state
            return {"name": "Ada", "friend": {"name": "Bob", "friend": None}}

        schema = build(
            obj("Query", field("user", "User", "user")),
            obj("User", field("name", "String"), field("email", "String"), field("friend", "User")),
            resolvers={"user": {"func": user, "shape": "self_and_context"}},
        )
    )";
}

TEST_CASE("Lookahead - reflects the selection below the field", "[python][lookahead]") {
    auto scope = python_scope();
    run_python(scope, recording_schema);
    run_python(scope, R"(
        result = execute_sync(
            schema,
            "{ user { name ...F friend { name } } } fragment F on User { friend { friend { name } } }",
            context={"tenant": "acme"},
        )
    )");

    REQUIRE(eval_bool(scope, "result['errors'] == []"));
    CHECK(eval_bool(scope, "seen['fields'] == ['friend', 'name']"));
    CHECK(eval_bool(scope, "seen['requests_name'] is True"));
    CHECK(eval_bool(scope, "seen['requests_email'] is False"));
    // Both selections of friend are merged.
    CHECK(eval_bool(scope, "seen['friend_fields'] == ['friend', 'name']"));
    CHECK(eval_bool(scope, "seen['state'] == {'tenant': 'acme'}"));
}

TEST_CASE("Lookahead - unselected fields give the missing sentinel", "[python][lookahead]") {
    auto scope = python_scope();
    run_python(scope, recording_schema);
    run_python(scope, "result = execute_sync(schema, '{ user { name } }')");

    CHECK(eval_bool(scope, "not seen['missing'].exists()"));
    CHECK(eval_bool(scope, "not seen['missing']"));
    CHECK(eval_bool(scope, "seen['missing'].fields == []"));
    CHECK(eval_bool(scope, "not seen['missing_child'].exists()"));
    CHECK(eval_string(scope, "repr(seen['missing'])") == "Lookahead(MISSING)");
    CHECK(eval_bool(scope, "not _grommet.MISSING.exists()"));
    CHECK(eval_bool(scope, "seen['state'] is None"));
}

TEST_CASE("Lookahead - levels are collected when first visited", "[python][lookahead]") {
    auto scope = python_scope();
    run_python(scope, R"(
        kept = {}

        def user(parent, context):
            kept["graph"] = context.graph
            kept["requests_name"] = context.graph.requests("name")
            return {"name": "Ada", "friend": None}

        schema = build(
            obj("Query", field("user", "User", "user")),
            obj("User", field("name", "String"), field("friend", "User")),
            resolvers={"user": {"func": user, "shape": "self_and_context"}},
        )
        result = execute_sync(schema, "{ user { name friend { name } } }")

        visited = sorted(kept["graph"].fields)
        try:
            kept["graph"].peek("friend").fields
            unvisited = "collected"
        except _grommet.GrommetError as error:
            unvisited = str(error)
    )");

    REQUIRE(eval_bool(scope, "result['errors'] == []"));
    CHECK(eval_bool(scope, "kept['requests_name'] is True"));
    // The top level was collected while the resolver ran, the friend level never was.
    CHECK(eval_bool(scope, "visited == ['friend', 'name']"));
    CHECK(eval_string(scope, "unvisited") == "Lookahead used after its request finished");
}

TEST_CASE("Context - custom context classes receive graph and state", "[python][lookahead]") {
    auto scope = python_scope();
    run_python(scope, R"(
        class RequestContext:
            def __init__(self, graph, state):
                self.graph = graph
                self.user = state["user"]

        def whoami(parent, context, shout):
            name = context.user
            return name.upper() if shout else name

        schema = build(
            obj("Query", field("whoami", "String!", "whoami",
                               args=[{"name": "shout", "type": "Boolean!", "default": False}])),
            resolvers={"whoami": {"func": whoami, "shape": "self_context_and_args"}},
            context_class=RequestContext,
        )
        quiet = execute_sync(schema, "{ whoami }", context={"user": "ada"})
        loud = execute_sync(schema, "{ whoami(shout: true) }", context={"user": "ada"})
    )");

    CHECK(eval_bool(scope, "quiet['data'] == {'whoami': 'ada'}"));
    CHECK(eval_bool(scope, "loud['data'] == {'whoami': 'ADA'}"));
}

TEST_CASE("Context - constructible from python", "[python][lookahead]") {
    auto scope = python_scope();
    run_python(scope, "context = _grommet.Context(_grommet.MISSING, state=3)");

    CHECK(eval_bool(scope, "context.state == 3"));
    CHECK(eval_bool(scope, "not context.graph.exists()"));
}
