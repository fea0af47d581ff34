#ifndef GROMMET_FORWARD_DECLARATIONS_H
#define GROMMET_FORWARD_DECLARATIONS_H

#include <memory>

namespace grommet {
    // TaskExecutor - shared by every in-flight request
    class TaskExecutor;
    using task_executor_s_ptr = std::shared_ptr<TaskExecutor>;

    class TaskGroup;
    class CancellationToken;
    struct RuntimeConfig;

    // HostValue - only ever shared as const, released under the interpreter lock
    class HostValue;
    using host_value_ptr = std::shared_ptr<const HostValue>;

    class ExecutionToken;

    class HostScheduler;
    using host_scheduler_s_ptr = std::shared_ptr<HostScheduler>;

    struct ScalarBinding;
    struct TypeUniverse;
    using type_universe_s_ptr = std::shared_ptr<const TypeUniverse>;

    struct ResolverEntry;
    struct FieldContext;
    using field_context_s_ptr = std::shared_ptr<const FieldContext>;

    class Lookahead;
    class HostIteratorStream;
    struct SubscriptionState;
    using subscription_state_s_ptr = std::shared_ptr<SubscriptionState>;

    class PySchema;
    class PySubscriptionStream;

    namespace engine {
        class Value;
        class TypeRef;
        class FieldValue;
        class Data;
        class ArgumentValues;
        class SelectionField;
        class ResolverContext;

        struct Location;
        struct Selection;
        struct Document;

        struct ServerError;
        struct Response;
        struct Request;

        class Schema;
        class SchemaBuilder;
        class FieldStream;
        class ResponseStream;
        using field_stream_u_ptr = std::unique_ptr<FieldStream>;
        using response_stream_s_ptr = std::shared_ptr<ResponseStream>;
    } // namespace engine
} // namespace grommet

#endif // GROMMET_FORWARD_DECLARATIONS_H
