#include <grommet/python/awaitable_bridge.h>
#include <grommet/util/string_utils.h>

#include <optional>
#include <string>

namespace grommet {
    struct PendingHostResult::State {
        std::mutex mutex;
        std::condition_variable condition;
        bool done{false};
        bool stop_iteration{false};
        host_value_ptr result;
        std::optional<std::string> error;

        void complete(host_value_ptr value, std::optional<std::string> failure, bool stopped) {
            {
                std::lock_guard lock(mutex);
                result = std::move(value);
                error = std::move(failure);
                stop_iteration = stopped;
                done = true;
            }
            condition.notify_all();
        }

        void wake() {
            { std::lock_guard lock(mutex); }
            condition.notify_all();
        }
    };

    namespace {
        using BridgeState = PendingHostResult::State;

        // Runs on the loop thread with the interpreter lock held.
        void on_done(const std::shared_ptr<BridgeState> &state, nb::handle future) {
            auto token = ExecutionToken::assume_held();
            try {
                if (nb::cast<bool>(future.attr("cancelled")())) {
                    state->complete({}, "CancelledError", false);
                    return;
                }
                nb::object exception = future.attr("exception")();
                if (!exception.is_none()) {
                    bool stopped = PyErr_GivenExceptionMatches(exception.ptr(), PyExc_StopAsyncIteration) != 0;
                    state->complete({}, describe_host_exception(exception), stopped);
                    return;
                }
                state->complete(HostValue::make(token, future.attr("result")()), std::nullopt, false);
            } catch (const nb::python_error &e) {
                state->complete({}, describe_host_exception(e), false);
            }
        }

        void schedule(const std::shared_ptr<BridgeState> &state, nb::handle awaitable, nb::handle loop) {
            try {
                auto asyncio = nb::module_::import_("asyncio");
                nb::object future = asyncio.attr("ensure_future")(awaitable, "loop"_a = loop);
                future.attr("add_done_callback")(nb::cpp_function([state](nb::handle f) { on_done(state, f); }));
            } catch (const nb::python_error &e) {
                state->complete({}, describe_host_exception(e), false);
            }
        }
    } // namespace

    void HostScheduler::bind_loop(host_value_ptr loop) {
        {
            std::lock_guard lock(_mutex);
            _loop = std::move(loop);
        }
        _condition.notify_all();
    }

    bool HostScheduler::is_bound() const {
        std::lock_guard lock(_mutex);
        return _loop != nullptr;
    }

    host_value_ptr HostScheduler::wait_for_loop(const CancellationToken &cancellation) const {
        auto registration = cancellation.on_cancel([this] {
            { std::lock_guard lock(_mutex); }
            _condition.notify_all();
        });
        std::unique_lock lock(_mutex);
        _condition.wait(lock, [this, &cancellation] { return _loop != nullptr || cancellation.is_cancelled(); });
        if (!_loop) { throw Cancelled(); }
        return _loop;
    }

    bool is_awaitable(const ExecutionToken &, nb::handle value) {
        return nb::hasattr(value, "__await__");
    }

    void post_to_future(const ExecutionToken &, nb::handle loop, nb::handle future, nb::object value,
                        bool is_exception) {
        nb::object target = nb::borrow(future);
        try {
            loop.attr("call_soon_threadsafe")(nb::cpp_function([target, value, is_exception]() {
                if (nb::cast<bool>(target.attr("done")())) { return; }
                target.attr(is_exception ? "set_exception" : "set_result")(value);
            }));
        } catch (const nb::python_error &e) {
            fmt::print(stderr, "grommet: could not deliver a result to its event loop: {}\n",
                       describe_host_exception(e));
        }
    }

    PendingHostResult start_await(const ExecutionToken &token, nb::handle awaitable, const HostScheduler &scheduler,
                                  const CancellationToken &cancellation) {
        if (!is_awaitable(token, awaitable)) { throw_error<HostException>("TypeError: Expected awaitable"); }

        host_value_ptr loop;
        {
            nb::gil_scoped_release release;
            loop = scheduler.wait_for_loop(cancellation);
        }

        auto state = std::make_shared<BridgeState>();
        nb::object target = nb::borrow(awaitable);
        nb::object loop_object = loop->clone_ref(token);
        loop_object.attr("call_soon_threadsafe")(nb::cpp_function([state, target, loop_object]() {
            schedule(state, target, loop_object);
        }));
        return PendingHostResult(std::move(state));
    }

    nb::object PendingHostResult::wait(const ExecutionToken &token, const CancellationToken &cancellation) const {
        {
            // The registration outlives the lock: cancel() runs the wake callback, which takes the same mutex.
            auto registration = cancellation.on_cancel([state = _state] { state->wake(); });
            // The interpreter lock is released before the mutex is taken, otherwise the loop thread's done
            // callback could deadlock against this worker.
            nb::gil_scoped_release release;
            std::unique_lock lock(_state->mutex);
            _state->condition.wait(lock, [this, &cancellation] {
                return _state->done || cancellation.is_cancelled();
            });
        }
        cancellation.throw_if_cancelled();

        if (_state->stop_iteration) { throw HostStopAsyncIteration(); }
        if (_state->error) { throw HostException(*_state->error); }
        return _state->result->clone_ref(token);
    }

    nb::object await_host(const ExecutionToken &token, nb::handle awaitable, const HostScheduler &scheduler,
                          const CancellationToken &cancellation) {
        return start_await(token, awaitable, scheduler, cancellation).wait(token, cancellation);
    }
} // namespace grommet
