#include <grommet/python/awaitable_bridge.h>
#include <grommet/python/resolver.h>
#include <grommet/python/subscription.h>
#include <grommet/python/value_codec.h>
#include <grommet/util/errors.h>
#include <grommet/util/string_utils.h>

namespace grommet {
    void SubscriptionState::attach(host_value_ptr iterator) {
        std::lock_guard lock(_mutex);
        if (!is_closed()) { _iterator = std::move(iterator); }
    }

    host_value_ptr SubscriptionState::iterator() const {
        std::lock_guard lock(_mutex);
        return _iterator;
    }

    void SubscriptionState::close() {
        host_value_ptr released;
        {
            std::lock_guard lock(_mutex);
            _closed.store(true, std::memory_order_release);
            released = std::move(_iterator);
        }
    }

    HostIteratorStream::HostIteratorStream(subscription_state_s_ptr state, field_context_s_ptr field,
                                           host_scheduler_s_ptr scheduler, CancellationToken cancellation)
        : _state{std::move(state)}, _field{std::move(field)}, _scheduler{std::move(scheduler)},
          _cancellation{std::move(cancellation)} {}

    std::optional<engine::FieldValue> HostIteratorStream::next() {
        auto iterator = _state->iterator();
        if (!iterator) { return std::nullopt; }

        ScopedExecution execution;
        const auto &token = execution.token();
        try {
            nb::object pending = iterator->bind(token).attr("__anext__")();
            nb::object item = await_host(token, pending, *_scheduler, _cancellation);
            if (_state->is_closed()) { return std::nullopt; }
            return py_to_field_value_for_type(token, item, _field->output_type, _field->hint, *_field->universe);
        } catch (const HostStopAsyncIteration &) {
            _state->close();
            return std::nullopt;
        } catch (const nb::python_error &e) {
            throw HostException(describe_host_exception(e));
        }
    }

    namespace {
        nb::object async_iterator_of(nb::handle value) {
            if (nb::hasattr(value, "__aiter__")) { return value.attr("__aiter__")(); }
            if (nb::hasattr(value, "__anext__")) { return nb::borrow(value); }
            throw SubscriptionRequiresAsyncIterator();
        }
    } // namespace

    engine::field_stream_u_ptr resolve_subscription(const engine::ResolverContext &ctx,
                                                    const field_context_s_ptr &field) {
        const auto &handles = request_handles(ctx);
        if (!handles.subscription) { throw_error("Subscription fields can only be resolved through subscribe"); }

        ScopedExecution execution;
        const auto &token = execution.token();
        try {
            nb::object parent = parent_object(token, ctx, handles);
            nb::object source;
            if (field->resolver) {
                source = call_resolver(token, ctx, *field, parent, handles);
                // Async generator resolvers hand back their iterator; anything else may first need awaiting.
                if (!field->resolver->is_async_gen && is_awaitable(token, source)) {
                    source = await_host(token, source, *handles.scheduler, ctx.cancellation());
                }
            } else {
                if (parent.is_none()) { throw NoParentValue(); }
                source = resolve_attribute(token, parent, field->source);
            }
            handles.subscription->attach(HostValue::make(token, async_iterator_of(source)));
        } catch (const nb::python_error &e) {
            throw HostException(describe_host_exception(e));
        }
        return std::make_unique<HostIteratorStream>(handles.subscription, field, handles.scheduler,
                                                    ctx.cancellation());
    }

    // ========================================================================
    // PySubscriptionStream
    // ========================================================================

    PySubscriptionStream::PySubscriptionStream(engine::response_stream_s_ptr stream, subscription_state_s_ptr state,
                                               host_scheduler_s_ptr scheduler, CancellationToken cancellation,
                                               task_executor_s_ptr executor)
        : _shared{std::make_shared<Shared>()}, _state{std::move(state)}, _scheduler{std::move(scheduler)},
          _cancellation{std::move(cancellation)}, _executor{std::move(executor)} {
        _shared->stream = std::move(stream);
    }

    nb::object PySubscriptionStream::anext() {
        auto token = ExecutionToken::assume_held();
        auto asyncio = nb::module_::import_("asyncio");
        nb::object loop = asyncio.attr("get_running_loop")();
        if (!_scheduler->is_bound()) { _scheduler->bind_loop(HostValue::make(token, loop)); }

        nb::object future = loop.attr("create_future")();
        if (is_closed()) {
            future.attr("set_exception")(nb::handle(PyExc_StopAsyncIteration)());
            return future;
        }

        auto loop_handle = HostValue::make(token, loop);
        auto future_handle = HostValue::make(token, future);
        _executor->submit([shared = _shared, state = _state, loop_handle, future_handle] {
            std::optional<engine::Response> response;
            std::optional<std::string> failure;
            try {
                std::lock_guard lock(shared->pull_mutex);
                response = shared->stream->next();
            } catch (const std::exception &e) {
                // A pull interrupted by aclose() ends the stream instead of failing it.
                if (!state->is_closed()) { failure = e.what(); }
            }
            if (state->is_closed()) { response.reset(); }

            ScopedExecution execution;
            const auto &token = execution.token();
            try {
                nb::object value;
                bool is_exception = true;
                if (failure) {
                    value = nb::handle(PyExc_RuntimeError)(*failure);
                } else if (!response) {
                    value = nb::handle(PyExc_StopAsyncIteration)();
                } else {
                    value = response_to_py(token, *response);
                    is_exception = false;
                }
                post_to_future(token, loop_handle->bind(token), future_handle->bind(token), value, is_exception);
            } catch (const nb::python_error &e) {
                fmt::print(stderr, "grommet: could not convert a subscription response: {}\n",
                           describe_host_exception(e));
            }
        });
        return future;
    }

    nb::object PySubscriptionStream::aclose() {
        _state->close();
        _shared->stream->close();
        _cancellation.cancel();

        auto asyncio = nb::module_::import_("asyncio");
        nb::object future = asyncio.attr("get_running_loop")().attr("create_future")();
        future.attr("set_result")(nb::none());
        return future;
    }

    void PySubscriptionStream::register_with_nanobind(nb::module_ &m) {
        nb::class_<PySubscriptionStream>(m, "SubscriptionStream")
            .def("__aiter__", [](nb::handle self) { return nb::borrow(self); })
            .def("__anext__", &PySubscriptionStream::anext)
            .def("aclose", &PySubscriptionStream::aclose)
            .def_prop_ro("closed", &PySubscriptionStream::is_closed);
    }
} // namespace grommet
