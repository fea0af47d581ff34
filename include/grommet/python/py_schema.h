//
// The Schema object python code builds and executes requests against.
//

#ifndef GROMMET_PYTHON_PY_SCHEMA_H
#define GROMMET_PYTHON_PY_SCHEMA_H

#include <grommet/engine/schema.h>
#include <grommet/python/host_value.h>
#include <grommet/python/schema_builder.h>

#include <memory>
#include <string>

namespace grommet {
    /**
     * A built schema bound to python. execute() and subscribe() run the request on the task executor; the calling
     * thread only converts the inputs and receives the result through an asyncio future.
     */
    class GROMMET_EXPORT PySchema {
    public:
        PySchema(nb::handle definition, nb::handle resolvers);

        /**
         * Run a query or mutation on the executor and return an asyncio future of the response mapping. A
         * subscription document instead resolves the future with a SubscriptionStream. Cancelling the future
         * cancels the request.
         *
         * Must be called from a running event loop.
         */
        nb::object execute(nb::handle query, nb::handle variables, nb::handle root, nb::handle context) const;

        nb::object subscribe(nb::handle query, nb::handle variables, nb::handle root, nb::handle context) const;

        [[nodiscard]] std::string as_sdl() const { return _schema->sdl(); }

        [[nodiscard]] const engine::Schema &schema() const { return *_schema; }

        static void register_with_nanobind(nb::module_ &m);

    private:
        struct PreparedRequest {
            std::shared_ptr<engine::Request> request;
            host_scheduler_s_ptr scheduler;
        };

        PreparedRequest prepare(const ExecutionToken &token, nb::handle query, nb::handle variables, nb::handle root,
                                nb::handle context, subscription_state_s_ptr subscription) const;

        nb::object make_stream(const ExecutionToken &token, PreparedRequest prepared,
                               subscription_state_s_ptr subscription) const;

        std::shared_ptr<const engine::Schema> _schema;
        type_universe_s_ptr _universe;
    };

    /**
     * Replace the process wide task executor.
     * @throws RuntimeThreadsConflict when both options are given
     * @throws ValidationError when worker_threads is zero
     */
    bool configure_runtime(bool use_current_thread, std::optional<size_t> worker_threads);
} // namespace grommet

#endif // GROMMET_PYTHON_PY_SCHEMA_H
