/**
 * Tests for configure_runtime.
 */

#include <catch2/catch_test_macros.hpp>

#include "python_test_support.h"

using namespace grommet::testing;

TEST_CASE("configure_runtime - rejects conflicting options", "[python][runtime]") {
    auto scope = python_scope();
    run_python(scope, R"(
        try:
            configure_runtime(use_current_thread=True, worker_threads=2)
            conflict = None
        except _grommet.RuntimeThreadsConflict as error:
            conflict = str(error)

        try:
            configure_runtime(worker_threads=0)
            zero = None
        except _grommet.ValidationError as error:
            zero = str(error)
    )");

    CHECK(eval_string(scope, "conflict") == "use_current_thread cannot be combined with worker_threads");
    CHECK(eval_string(scope, "zero") == "worker_threads must be at least 1");
}

TEST_CASE("configure_runtime - requests keep working after reconfiguration", "[python][runtime]") {
    auto scope = python_scope();
    run_python(scope, R"(
        async def slow(parent):
            await asyncio.sleep(0)
            return "done"

        schema = build(obj("Query", field("a", "String", slow), field("b", "String", slow)))
        results = []
        for options in ({"use_current_thread": True}, {"worker_threads": 3}, {}):
            assert configure_runtime(**options) is True
            results.append(execute_sync(schema, "{ a b }")["data"])
    )");

    CHECK(eval_bool(scope, "results == [{'a': 'done', 'b': 'done'}] * 3"));
}

TEST_CASE("configure_runtime - a single thread still overlaps sibling awaits", "[python][runtime]") {
    auto scope = python_scope();
    run_python(scope, R"(
        shared = {}

        async def waiter(parent):
            await asyncio.wait_for(shared["event"].wait(), 2)
            return "saw event"

        async def setter(parent):
            await asyncio.sleep(0)
            shared["event"].set()
            return "set"

        schema = build(obj("Query", field("waiter", "String", waiter), field("setter", "String", setter)))

        async def run():
            shared["event"] = asyncio.Event()
            return await schema.execute("{ waiter setter }")

        configure_runtime(use_current_thread=True)
        try:
            result = asyncio.run(run())
        finally:
            configure_runtime()
    )");

    CHECK(eval_bool(scope, "result['errors'] == []"));
    CHECK(eval_bool(scope, "result['data'] == {'waiter': 'saw event', 'setter': 'set'}"));
}
