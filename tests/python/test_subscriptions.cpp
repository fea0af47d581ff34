/**
 * End to end tests for subscriptions: Schema.subscribe, subscription documents passed to execute, and the
 * SubscriptionStream handle.
 */

#include <catch2/catch_test_macros.hpp>

#include "python_test_support.h"

using namespace grommet::testing;

namespace {
    constexpr const char *counter_schema = R"(
        async def count(parent, limit):
            for i in range(limit):
                await asyncio.sleep(0)
                yield i

        async def faulty(parent):
            yield "ok"
            raise ValueError("bad")

        schema = build(
            obj("Query", field("hello", "String", lambda parent: "hi")),
            {"kind": "subscription", "name": "Subscription", "fields": [
                field("count", "Int!", "count", args=[{"name": "limit", "type": "Int", "default": 2}]),
                field("faulty", "String", "faulty"),
                field("plain", "Int", "plain"),
                field("ticks", "Int"),
            ]},
            subscription="Subscription",
            resolvers={"count": count, "faulty": faulty, "plain": lambda parent: 5},
        )
    )";
}

TEST_CASE("subscribe - yields one response per item", "[python][subscription]") {
    auto scope = python_scope();
    run_python(scope, counter_schema);
    run_python(scope, R"(
        stream = schema.subscribe("subscription { count }")
        responses = collect(stream)
    )");

    CHECK(eval_bool(scope, "[r['data'] for r in responses] == [{'count': 0}, {'count': 1}]"));
    CHECK(eval_bool(scope, "all(r['errors'] == [] for r in responses)"));
    CHECK(eval_bool(scope, "stream.closed"));
}

TEST_CASE("subscribe - arguments and variables reach the generator", "[python][subscription]") {
    auto scope = python_scope();
    run_python(scope, counter_schema);
    run_python(scope, R"(
        responses = collect(schema.subscribe("subscription($n: Int) { count(limit: $n) }", variables={"n": 4}))
    )");

    CHECK(eval_bool(scope, "[r['data']['count'] for r in responses] == [0, 1, 2, 3]"));
}

TEST_CASE("execute - a subscription document resolves to a stream", "[python][subscription]") {
    auto scope = python_scope();
    run_python(scope, counter_schema);
    run_python(scope, R"(
        async def run():
            stream = await schema.execute("subscription { n: count(limit: 3) }")
            return [response["data"]["n"] async for response in stream]

        values = asyncio.run(run())
    )");

    CHECK(eval_bool(scope, "values == [0, 1, 2]"));
}

TEST_CASE("SubscriptionStream - aclose ends the stream", "[python][subscription]") {
    auto scope = python_scope();
    run_python(scope, counter_schema);
    run_python(scope, R"(
        async def run():
            stream = schema.subscribe("subscription { count(limit: 100) }")
            first = await stream.__anext__()
            await stream.aclose()
            await stream.aclose()
            try:
                await stream.__anext__()
                after_close = "item"
            except StopAsyncIteration:
                after_close = "end"
            return first, after_close, stream.closed

        first, after_close, closed = asyncio.run(run())
    )");

    CHECK(eval_bool(scope, "first['data'] == {'count': 0}"));
    CHECK(eval_string(scope, "after_close") == "end");
    CHECK(eval_bool(scope, "closed"));
}

TEST_CASE("SubscriptionStream - errors end the stream", "[python][subscription]") {
    auto scope = python_scope();
    run_python(scope, counter_schema);
    run_python(scope, R"(
        faulty = collect(schema.subscribe("subscription { faulty }"))
        plain = collect(schema.subscribe("subscription { plain }"))
        invalid = collect(schema.subscribe("subscription { count hello }"))
    )");

    CHECK(eval_bool(scope, "len(faulty) == 2"));
    CHECK(eval_bool(scope, "faulty[0]['data'] == {'faulty': 'ok'}"));
    CHECK(eval_string(scope, "faulty[1]['errors'][0]['message']") == "ValueError: bad");
    CHECK(eval_bool(scope, "faulty[1]['errors'][0]['path'] == ['faulty']"));

    CHECK(eval_bool(scope, "len(plain) == 1"));
    CHECK(eval_string(scope, "plain[0]['errors'][0]['message']") ==
          "Subscription resolver must return an async iterator");

    CHECK(eval_bool(scope, "len(invalid) == 1 and invalid[0]['data'] is None"));
}

TEST_CASE("subscribe - fields without a resolver iterate the root attribute", "[python][subscription]") {
    auto scope = python_scope();
    run_python(scope, counter_schema);
    run_python(scope, R"(
        async def ticks():
            yield 10
            yield 20

        from_root = collect(schema.subscribe("subscription { ticks }", root={"ticks": ticks()}))
    )");

    CHECK(eval_bool(scope, "[r['data']['ticks'] for r in from_root] == [10, 20]"));
}

TEST_CASE("subscribe - breaking out early leaves the remaining items unread", "[python][subscription]") {
    auto scope = python_scope();
    run_python(scope, counter_schema);
    run_python(scope, R"(
        stream = schema.subscribe("subscription { count(limit: 1000) }")
        responses = collect(stream, limit=3)
    )");

    CHECK(eval_bool(scope, "[r['data']['count'] for r in responses] == [0, 1, 2]"));
    CHECK(eval_bool(scope, "not stream.closed"));
}

TEST_CASE("subscribe - async generator resolvers are iterated without awaiting", "[python][subscription]") {
    auto scope = python_scope();
    run_python(scope, R"(
        class Feed:
            def __init__(self, items):
                self.items = list(items)

            def __aiter__(self):
                return self

            async def __anext__(self):
                if not self.items:
                    raise StopAsyncIteration
                return self.items.pop(0)

            def __await__(self):
                async def replacement():
                    return Feed(["awaited"])
                return replacement().__await__()

        def feed(parent):
            return Feed(["direct"])

        schema = build(
            obj("Query", field("hello", "String", lambda parent: "hi")),
            {"kind": "subscription", "name": "Subscription", "fields": [
                field("flagged", "String", "flagged"),
                field("unflagged", "String", "unflagged"),
            ]},
            subscription="Subscription",
            resolvers={"flagged": {"func": feed, "is_async_gen": True}, "unflagged": feed},
        )
        flagged = collect(schema.subscribe("subscription { flagged }"))
        unflagged = collect(schema.subscribe("subscription { unflagged }"))
    )");

    CHECK(eval_bool(scope, "[r['data'] for r in flagged] == [{'flagged': 'direct'}]"));
    CHECK(eval_bool(scope, "[r['data'] for r in unflagged] == [{'unflagged': 'awaited'}]"));
}

TEST_CASE("SubscriptionStream - aclose ends a pull that is still waiting", "[python][subscription]") {
    auto scope = python_scope();
    run_python(scope, R"(
        gate = {}

        async def blocked(parent):
            gate["started"].set()
            await asyncio.Event().wait()
            yield 1

        schema = build(
            obj("Query", field("hello", "String", lambda parent: "hi")),
            {"kind": "subscription", "name": "Subscription", "fields": [field("blocked", "Int", "blocked")]},
            subscription="Subscription",
            resolvers={"blocked": blocked},
        )

        async def run():
            gate["started"] = asyncio.Event()
            stream = schema.subscribe("subscription { blocked }")
            pending = asyncio.ensure_future(stream.__anext__())
            await asyncio.wait_for(gate["started"].wait(), 5)
            await stream.aclose()
            try:
                await asyncio.wait_for(pending, 5)
                outcome = "item"
            except StopAsyncIteration:
                outcome = "end"
            return outcome, stream.closed

        outcome, closed = asyncio.run(run())
    )");

    CHECK(eval_string(scope, "outcome") == "end");
    CHECK(eval_bool(scope, "closed"));
}
