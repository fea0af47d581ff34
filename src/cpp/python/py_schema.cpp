#include <grommet/engine/parser.h>
#include <grommet/python/awaitable_bridge.h>
#include <grommet/python/field_context.h>
#include <grommet/python/py_schema.h>
#include <grommet/python/subscription.h>
#include <grommet/python/value_codec.h>
#include <grommet/runtime/task_executor.h>
#include <grommet/util/string_utils.h>

namespace grommet {
    namespace {
        bool is_subscription_document(const std::string &query) {
            try {
                return engine::Parser(query).parse_document().has_subscription();
            } catch (const engine::QueryError &) {
                // Reported by the engine as a request error.
                return false;
            }
        }

        engine::ValueMap convert_variables(const ExecutionToken &token, nb::handle variables,
                                           const TypeUniverse &universe) {
            if (variables.is_none()) { return {}; }
            if (!PyDict_Check(variables.ptr())) { throw_error<ValidationError>("variables must be a mapping"); }
            auto value = py_to_value(token, variables, universe.scalars);
            return std::move(value.as_object());
        }

        // Settles the future with the response of one request; runs on a worker.
        void deliver(const engine::Response &response, const host_value_ptr &loop, const host_value_ptr &future) {
            ScopedExecution execution;
            const auto &token = execution.token();
            try {
                post_to_future(token, loop->bind(token), future->bind(token), response_to_py(token, response));
            } catch (const nb::python_error &e) {
                post_to_future(token, loop->bind(token), future->bind(token),
                               nb::handle(PyExc_RuntimeError)(describe_host_exception(e)), true);
            }
        }

        void deliver_failure(const std::string &message, const host_value_ptr &loop, const host_value_ptr &future) {
            ScopedExecution execution;
            const auto &token = execution.token();
            post_to_future(token, loop->bind(token), future->bind(token), nb::handle(PyExc_RuntimeError)(message),
                           true);
        }
    } // namespace

    PySchema::PySchema(nb::handle definition, nb::handle resolvers) {
        auto token = ExecutionToken::assume_held();
        auto built = build_schema(token, definition, resolvers);
        _schema = std::move(built.schema);
        _universe = std::move(built.universe);
    }

    PySchema::PreparedRequest PySchema::prepare(const ExecutionToken &token, nb::handle query, nb::handle variables,
                                                nb::handle root, nb::handle context,
                                                subscription_state_s_ptr subscription) const {
        auto request = std::make_shared<engine::Request>();
        request->query = nb::cast<std::string>(query);
        request->variables = convert_variables(token, variables, *_universe);
        request->executor = TaskExecutor::instance();

        auto scheduler = std::make_shared<HostScheduler>();
        request->data.insert(RequestHandles{
            root.is_none() ? nullptr : HostValue::make(token, root),
            context.is_none() ? nullptr : HostValue::make(token, context), scheduler, std::move(subscription)
        });
        return {std::move(request), std::move(scheduler)};
    }

    nb::object PySchema::make_stream(const ExecutionToken &token, PreparedRequest prepared,
                                     subscription_state_s_ptr subscription) const {
        auto executor = prepared.request->executor;
        auto cancellation = prepared.request->cancellation;
        auto stream = _schema->execute_stream(std::move(*prepared.request));
        return nb::cast(PySubscriptionStream(std::move(stream), std::move(subscription), std::move(prepared.scheduler),
                                             std::move(cancellation), std::move(executor)));
    }

    nb::object PySchema::execute(nb::handle query, nb::handle variables, nb::handle root, nb::handle context) const {
        auto token = ExecutionToken::assume_held();
        auto asyncio = nb::module_::import_("asyncio");
        nb::object loop = asyncio.attr("get_running_loop")();
        nb::object future = loop.attr("create_future")();

        if (is_subscription_document(nb::cast<std::string>(query))) {
            auto subscription = std::make_shared<SubscriptionState>();
            auto prepared = prepare(token, query, variables, root, context, subscription);
            prepared.scheduler->bind_loop(HostValue::make(token, loop));
            future.attr("set_result")(make_stream(token, std::move(prepared), std::move(subscription)));
            return future;
        }

        auto prepared = prepare(token, query, variables, root, context, nullptr);
        auto loop_handle = HostValue::make(token, loop);
        prepared.scheduler->bind_loop(loop_handle);

        auto cancellation = prepared.request->cancellation;
        future.attr("add_done_callback")(nb::cpp_function([cancellation](nb::handle f) {
            if (nb::cast<bool>(f.attr("cancelled")())) { cancellation.cancel(); }
        }));

        auto future_handle = HostValue::make(token, future);
        auto executor = prepared.request->executor;
        executor->submit([schema = _schema, request = std::move(prepared.request), loop_handle, future_handle] {
            try {
                deliver(schema->execute(std::move(*request)), loop_handle, future_handle);
            } catch (const std::exception &e) {
                deliver_failure(e.what(), loop_handle, future_handle);
            }
        });
        return future;
    }

    nb::object PySchema::subscribe(nb::handle query, nb::handle variables, nb::handle root,
                                   nb::handle context) const {
        auto token = ExecutionToken::assume_held();
        auto subscription = std::make_shared<SubscriptionState>();
        auto prepared = prepare(token, query, variables, root, context, subscription);

        // Outside a running loop the stream binds one on its first pull.
        auto asyncio = nb::module_::import_("asyncio");
        nb::object loop = asyncio.attr("_get_running_loop")();
        if (!loop.is_none()) { prepared.scheduler->bind_loop(HostValue::make(token, loop)); }
        return make_stream(token, std::move(prepared), std::move(subscription));
    }

    void PySchema::register_with_nanobind(nb::module_ &m) {
        nb::class_<PySchema>(m, "Schema")
            .def(nb::init<nb::handle, nb::handle>(), "definition"_a, "resolvers"_a = nb::none())
            .def("execute", &PySchema::execute, "query"_a, "variables"_a = nb::none(), "root"_a = nb::none(),
                 "context"_a = nb::none())
            .def("subscribe", &PySchema::subscribe, "query"_a, "variables"_a = nb::none(), "root"_a = nb::none(),
                 "context"_a = nb::none())
            .def("as_sdl", &PySchema::as_sdl);

        m.def("configure_runtime", &configure_runtime, "use_current_thread"_a = false,
              "worker_threads"_a = nb::none());
    }

    bool configure_runtime(bool use_current_thread, std::optional<size_t> worker_threads) {
        RuntimeConfig config{use_current_thread, worker_threads};
        config.validate();
        // The replaced executor joins its workers, which may be waiting for the interpreter lock.
        nb::gil_scoped_release release;
        TaskExecutor::configure(std::move(config));
        return true;
    }
} // namespace grommet
