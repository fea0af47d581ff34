//
// Per field dispatch from the engine into python resolvers and attribute lookups.
//

#ifndef GROMMET_PYTHON_RESOLVER_H
#define GROMMET_PYTHON_RESOLVER_H

#include <grommet/engine/field_value.h>
#include <grommet/engine/resolver_context.h>
#include <grommet/engine/schema.h>
#include <grommet/python/field_context.h>

#include <string>

namespace grommet {
    /**
     * Resolve one field on a worker thread. Calls the field's resolver, awaiting its result through the
     * request's scheduler when it is awaitable, or reads the field's source from the parent. The result is
     * converted against the field's output type.
     *
     * Python failures are rethrown as HostException carrying "<ExceptionType>: <message>".
     *
     * @throws NoParentValue for a resolverless field with neither a parent nor a request root
     */
    engine::FieldValue resolve_field(const engine::ResolverContext &ctx, const FieldContext &field);

    /**
     * First phase of an async field. Calls the resolver and schedules an awaitable result on the request's loop
     * without waiting for it; the returned completion waits and converts. Results that are not awaitable are
     * converted right away.
     */
    engine::FieldCompletion start_field(const engine::ResolverContext &ctx, field_context_s_ptr field);

    // Dict key, then attribute, then __getitem__; None when the parent has no such entry.
    nb::object resolve_attribute(const ExecutionToken &token, nb::handle parent, const std::string &source);

    // The parent object for ctx: the parent field's value, the request root for root fields, otherwise None.
    nb::object parent_object(const ExecutionToken &token, const engine::ResolverContext &ctx,
                             const RequestHandles &handles);

    // Invoke the field's resolver according to its shape. The result is returned as is, not awaited.
    nb::object call_resolver(const ExecutionToken &token, const engine::ResolverContext &ctx,
                             const FieldContext &field, nb::handle parent, const RequestHandles &handles);
} // namespace grommet

#endif // GROMMET_PYTHON_RESOLVER_H
