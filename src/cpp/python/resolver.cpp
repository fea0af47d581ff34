#include <grommet/python/awaitable_bridge.h>
#include <grommet/python/lookahead.h>
#include <grommet/python/resolver.h>
#include <grommet/util/errors.h>
#include <grommet/util/string_utils.h>

namespace grommet {
    nb::object resolve_attribute(const ExecutionToken &, nb::handle parent, const std::string &source) {
        if (PyDict_Check(parent.ptr())) {
            PyObject *item = PyDict_GetItemWithError(parent.ptr(), nb::str(source.data(), source.size()).ptr());
            if (item == nullptr) {
                if (PyErr_Occurred()) { throw nb::python_error(); }
                return nb::none();
            }
            return nb::borrow(item);
        }
        if (nb::hasattr(parent, source.c_str())) { return parent.attr(source.c_str()); }
        if (nb::hasattr(parent, "__getitem__")) {
            try {
                return parent[source.c_str()];
            } catch (nb::python_error &e) {
                if (e.matches(PyExc_KeyError) || e.matches(PyExc_IndexError) || e.matches(PyExc_TypeError)) {
                    return nb::none();
                }
                throw;
            }
        }
        return nb::none();
    }

    nb::object parent_object(const ExecutionToken &token, const engine::ResolverContext &ctx,
                             const RequestHandles &handles) {
        auto parent = ctx.parent_value();
        if (parent == nullptr) { return bind_or_none(token, handles.root); }
        if (auto handle = parent->try_downcast<host_value_ptr>()) { return (*handle)->clone_ref(token); }
        if (parent->kind() == engine::FieldValue::Kind::Value) { return value_to_py(token, parent->as_value()); }
        return nb::none();
    }

    nb::object call_resolver(const ExecutionToken &token, const engine::ResolverContext &ctx,
                             const FieldContext &field, nb::handle parent, const RequestHandles &handles) {
        const auto &entry = *field.resolver;

        nb::dict kwargs;
        if (shape_takes_args(entry.shape)) {
            for (const auto &name: entry.arg_names) {
                auto value = ctx.args().get(name);
                if (value == nullptr) { continue; }
                nb::object converted = value_to_py(token, *value);
                if (auto coercer = entry.coercers.find(name); coercer != entry.coercers.end()) {
                    converted = coercer->second->bind(token)(converted);
                }
                kwargs[nb::str(name.data(), name.size())] = converted;
            }
        }

        auto make_args = [&]() -> nb::tuple {
            if (!shape_takes_context(entry.shape)) { return nb::make_tuple(parent); }
            nb::object graph = nb::cast(Lookahead::from_selection(ctx.field()));
            nb::object context = field.context_class->bind(token)(graph, bind_or_none(token, handles.state));
            return nb::make_tuple(parent, context);
        };
        nb::tuple args = make_args();

        PyObject *result = PyObject_Call(entry.func->bind(token).ptr(), args.ptr(), kwargs.ptr());
        if (result == nullptr) { throw nb::python_error(); }
        return nb::steal(result);
    }

    engine::FieldValue resolve_field(const engine::ResolverContext &ctx, const FieldContext &field) {
        const auto &handles = request_handles(ctx);
        ctx.cancellation().throw_if_cancelled();

        ScopedExecution execution;
        const auto &token = execution.token();
        try {
            nb::object parent = parent_object(token, ctx, handles);
            nb::object result;
            if (field.resolver) {
                result = call_resolver(token, ctx, field, parent, handles);
                if (is_awaitable(token, result)) {
                    result = await_host(token, result, *handles.scheduler, ctx.cancellation());
                }
            } else {
                if (parent.is_none()) { throw NoParentValue(); }
                result = resolve_attribute(token, parent, field.source);
            }
            return py_to_field_value_for_type(token, result, field.output_type, field.hint, *field.universe);
        } catch (const nb::python_error &e) {
            throw HostException(describe_host_exception(e));
        }
    }

    engine::FieldCompletion start_field(const engine::ResolverContext &ctx, field_context_s_ptr field) {
        if (!field->resolver) {
            return [value = resolve_field(ctx, *field)] { return value; };
        }
        const auto &handles = request_handles(ctx);
        ctx.cancellation().throw_if_cancelled();

        ScopedExecution execution;
        const auto &token = execution.token();
        try {
            nb::object parent = parent_object(token, ctx, handles);
            nb::object result = call_resolver(token, ctx, *field, parent, handles);
            if (!is_awaitable(token, result)) {
                auto value = py_to_field_value_for_type(token, result, field->output_type, field->hint,
                                                        *field->universe);
                return [value = std::move(value)] { return value; };
            }
            auto pending = start_await(token, result, *handles.scheduler, ctx.cancellation());
            return [pending = std::move(pending), cancellation = ctx.cancellation(), field = std::move(field)] {
                ScopedExecution completion;
                const auto &completion_token = completion.token();
                try {
                    nb::object value = pending.wait(completion_token, cancellation);
                    return py_to_field_value_for_type(completion_token, value, field->output_type, field->hint,
                                                      *field->universe);
                } catch (const nb::python_error &e) {
                    throw HostException(describe_host_exception(e));
                }
            };
        } catch (const nb::python_error &e) {
            throw HostException(describe_host_exception(e));
        }
    }
} // namespace grommet
