//
// Awaiting python awaitables from engine worker threads.
//

#ifndef GROMMET_PYTHON_AWAITABLE_BRIDGE_H
#define GROMMET_PYTHON_AWAITABLE_BRIDGE_H

#include <grommet/python/host_value.h>
#include <grommet/runtime/task_executor.h>
#include <grommet/util/errors.h>

#include <condition_variable>
#include <memory>
#include <mutex>

namespace grommet {
    // The awaited object raised StopAsyncIteration; ends a subscription rather than failing it.
    struct HostStopAsyncIteration : GrommetError {
        HostStopAsyncIteration() : GrommetError("StopAsyncIteration") {}
    };

    /**
     * The asyncio loop a request's awaitables are scheduled on. A request binds the loop it was submitted from;
     * a subscription created outside a running loop binds one on its first pull.
     */
    class GROMMET_EXPORT HostScheduler {
    public:
        HostScheduler() = default;

        explicit HostScheduler(host_value_ptr loop) : _loop{std::move(loop)} {}

        void bind_loop(host_value_ptr loop);

        [[nodiscard]] bool is_bound() const;

        // Blocks, without the interpreter lock, until a loop is bound. @throws Cancelled
        [[nodiscard]] host_value_ptr wait_for_loop(const CancellationToken &cancellation) const;

    private:
        mutable std::mutex _mutex;
        mutable std::condition_variable _condition;
        host_value_ptr _loop;
    };

    /**
     * An awaitable already scheduled on its loop. Copies share the outcome.
     */
    class GROMMET_EXPORT PendingHostResult {
    public:
        struct State;

        explicit PendingHostResult(std::shared_ptr<State> state) : _state{std::move(state)} {}

        /**
         * Block until the awaitable finished and return its result. Called with the interpreter lock held; the lock
         * is released while waiting. On cancellation the wait is abandoned and the python task is left to finish
         * on its own.
         *
         * @throws HostException with the python exception text when the awaitable fails
         * @throws HostStopAsyncIteration when it raises StopAsyncIteration
         * @throws Cancelled when the request is cancelled while waiting
         */
        nb::object wait(const ExecutionToken &token, const CancellationToken &cancellation) const;

    private:
        std::shared_ptr<State> _state;
    };

    /**
     * Schedule a python awaitable on the scheduler's loop without waiting for it. The awaitable is wrapped with
     * asyncio.ensure_future from the loop thread (call_soon_threadsafe) and a done callback records its outcome.
     * Waits, without the interpreter lock, only for a loop to be bound.
     *
     * @throws HostException "TypeError: Expected awaitable" when awaitable has no __await__
     * @throws Cancelled when the request is cancelled before a loop is bound
     */
    PendingHostResult start_await(const ExecutionToken &token, nb::handle awaitable, const HostScheduler &scheduler,
                                  const CancellationToken &cancellation);

    // start_await followed by wait.
    nb::object await_host(const ExecutionToken &token, nb::handle awaitable, const HostScheduler &scheduler,
                          const CancellationToken &cancellation);

    bool is_awaitable(const ExecutionToken &token, nb::handle value);

    /**
     * Settle a future of the given loop from any thread. The value is set from the loop thread, and only while the
     * future is still pending, so a future cancelled in the meantime is left alone. A loop that has already been
     * closed is reported on stderr.
     */
    void post_to_future(const ExecutionToken &token, nb::handle loop, nb::handle future, nb::object value,
                        bool is_exception = false);
} // namespace grommet

#endif // GROMMET_PYTHON_AWAITABLE_BRIDGE_H
