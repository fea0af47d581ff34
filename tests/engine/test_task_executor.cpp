/**
 * Unit tests for the worker pool, fork-join groups and cancellation tokens.
 */

#include <catch2/catch_test_macros.hpp>
#include <grommet/runtime/task_executor.h>
#include <grommet/util/errors.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace grommet;

// ============================================================================
// RuntimeConfig
// ============================================================================

TEST_CASE("RuntimeConfig - validation", "[runtime][config]") {
    CHECK_NOTHROW(RuntimeConfig{}.validate());
    CHECK_NOTHROW(RuntimeConfig{true, std::nullopt}.validate());
    CHECK_THROWS_AS((RuntimeConfig{true, 2}.validate()), RuntimeThreadsConflict);
    CHECK_THROWS_AS((RuntimeConfig{false, 0}.validate()), ValidationError);
}

TEST_CASE("RuntimeConfig - thread count", "[runtime][config]") {
    CHECK(RuntimeConfig{true, std::nullopt}.thread_count() == 1);
    CHECK(RuntimeConfig{false, 3}.thread_count() == 3);
    CHECK(RuntimeConfig{}.thread_count() >= 1);
}

// ============================================================================
// TaskExecutor
// ============================================================================

TEST_CASE("TaskExecutor - runs submitted tasks on its workers", "[runtime][executor]") {
    auto executor = std::make_shared<TaskExecutor>(RuntimeConfig{false, 2});
    REQUIRE(executor->worker_count() == 2);
    REQUIRE_FALSE(executor->is_worker_thread());

    std::promise<bool> on_worker;
    executor->submit([&on_worker, executor] { on_worker.set_value(executor->is_worker_thread()); });

    auto result = on_worker.get_future();
    REQUIRE(result.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE(result.get());
}

TEST_CASE("TaskExecutor - destruction drains queued tasks", "[runtime][executor]") {
    std::atomic<int> ran{0};
    {
        TaskExecutor executor(RuntimeConfig{true, std::nullopt});
        for (int i = 0; i < 50; ++i) { executor.submit([&ran] { ++ran; }); }
    }
    REQUIRE(ran == 50);
}

TEST_CASE("TaskExecutor - configure replaces the process wide instance", "[runtime][executor]") {
    auto configured = TaskExecutor::configure(RuntimeConfig{false, 3});
    REQUIRE(TaskExecutor::instance() == configured);
    REQUIRE(configured->worker_count() == 3);

    TaskExecutor::configure(RuntimeConfig{});
    REQUIRE(TaskExecutor::instance() != configured);
}

// ============================================================================
// TaskGroup
// ============================================================================

TEST_CASE("TaskGroup - waits for every spawned task", "[runtime][group]") {
    auto executor = std::make_shared<TaskExecutor>(RuntimeConfig{false, 4});
    std::atomic<int> sum{0};

    TaskGroup group(executor);
    for (int i = 1; i <= 100; ++i) { group.spawn([&sum, i] { sum += i; }); }
    group.wait();

    REQUIRE(sum == 5050);
}

TEST_CASE("TaskGroup - nested groups do not starve a single worker", "[runtime][group]") {
    auto executor = std::make_shared<TaskExecutor>(RuntimeConfig{true, std::nullopt});
    std::atomic<int> leaves{0};

    std::promise<void> done;
    executor->submit([&] {
        TaskGroup outer(executor);
        for (int i = 0; i < 4; ++i) {
            outer.spawn([&] {
                TaskGroup inner(executor);
                for (int j = 0; j < 4; ++j) { inner.spawn([&leaves] { ++leaves; }); }
                inner.wait();
            });
        }
        outer.wait();
        done.set_value();
    });

    auto finished = done.get_future();
    REQUIRE(finished.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    REQUIRE(leaves == 16);
}

TEST_CASE("TaskGroup - rethrows the first failure", "[runtime][group]") {
    TaskGroup group(std::make_shared<TaskExecutor>(RuntimeConfig{false, 2}));
    std::atomic<int> ran{0};
    group.spawn([] { throw std::runtime_error("first"); });
    group.spawn([&ran] { ++ran; });

    REQUIRE_THROWS_WITH(group.wait(), "first");
    REQUIRE(ran == 1);
}

TEST_CASE("TaskGroup - without an executor tasks run inline", "[runtime][group]") {
    TaskGroup group(nullptr);
    int value = 0;
    group.spawn([&value] { value = 7; });
    REQUIRE(value == 7);
    group.wait();
}

// ============================================================================
// CancellationToken
// ============================================================================

TEST_CASE("CancellationToken - copies share the flag", "[runtime][cancellation]") {
    CancellationToken token;
    auto copy = token;
    REQUIRE_FALSE(copy.is_cancelled());
    CHECK_NOTHROW(copy.throw_if_cancelled());

    token.cancel();
    REQUIRE(copy.is_cancelled());
    REQUIRE_THROWS_AS(copy.throw_if_cancelled(), Cancelled);
}

TEST_CASE("CancellationToken - callbacks wake waiters on cancel", "[runtime][cancellation]") {
    CancellationToken token;
    std::atomic<int> calls{0};

    SECTION("registered callbacks run once") {
        auto registration = token.on_cancel([&calls] { ++calls; });
        REQUIRE(calls == 0);
        token.cancel();
        token.cancel();
        REQUIRE(calls == 1);
    }

    SECTION("already cancelled tokens run the callback immediately") {
        token.cancel();
        auto registration = token.on_cancel([&calls] { ++calls; });
        REQUIRE(calls == 1);
    }

    SECTION("dropped registrations are not run") {
        { auto registration = token.on_cancel([&calls] { ++calls; }); }
        token.cancel();
        REQUIRE(calls == 0);
    }

    SECTION("a blocked thread is woken without polling") {
        std::mutex mutex;
        std::condition_variable condition;
        auto waiter = std::async(std::launch::async, [&] {
            auto registration = token.on_cancel([&] {
                { std::lock_guard lock(mutex); }
                condition.notify_all();
            });
            std::unique_lock lock(mutex);
            condition.wait(lock, [&] { return token.is_cancelled(); });
            return token.is_cancelled();
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
        REQUIRE(waiter.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
        REQUIRE(waiter.get());
    }
}
