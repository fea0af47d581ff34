/*
 * The entry point into the python _grommet module exposing the GraphQL engine to python.
 *
 * Requests run on the engine's worker pool; python only ever sees asyncio futures and the SubscriptionStream
 * handle. Engine errors raised while building a schema or configuring the runtime are translated into the
 * exception types registered below.
 */
#include <grommet/grommet_base.h>
#include <grommet/python/lookahead.h>
#include <grommet/python/py_schema.h>
#include <grommet/python/subscription.h>
#include <grommet/util/errors.h>

namespace {
    // nanobind tries the most recently registered translator first, so the base is registered before its kinds.
    void export_errors(nb::module_ &m) {
        using namespace grommet;
        nb::exception<GrommetError>(m, "GrommetError", PyExc_RuntimeError);
        nb::exception<ValidationError>(m, "ValidationError", PyExc_ValueError);
        nb::exception<SchemaBuildError>(m, "SchemaBuildError", PyExc_ValueError);
        nb::exception<UnsupportedValueType>(m, "UnsupportedValueType", PyExc_TypeError);
        nb::exception<ExpectedList>(m, "ExpectedList", PyExc_TypeError);
        nb::exception<AbstractTypeRequiresObject>(m, "AbstractTypeRequiresObject", PyExc_TypeError);
        nb::exception<SubscriptionRequiresAsyncIterator>(m, "SubscriptionRequiresAsyncIterator", PyExc_TypeError);
        nb::exception<RuntimeThreadsConflict>(m, "RuntimeThreadsConflict", PyExc_ValueError);
    }
} // namespace

NB_MODULE(_grommet, m) {
    m.doc() = "The grommet GraphQL engine";

    export_errors(m);

    grommet::Lookahead::register_with_nanobind(m);
    grommet::Context::register_with_nanobind(m);
    grommet::PySubscriptionStream::register_with_nanobind(m);
    grommet::PySchema::register_with_nanobind(m);
}
