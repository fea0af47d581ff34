#ifndef GROMMET_ENGINE_SCHEMA_H
#define GROMMET_ENGINE_SCHEMA_H

#include <grommet/engine/field_value.h>
#include <grommet/engine/resolver_context.h>
#include <grommet/engine/response.h>
#include <grommet/engine/type_ref.h>
#include <grommet/engine/value.h>

#include <ankerl/unordered_dense.h>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace grommet::engine {
    // Throws to report a field error; the message becomes the error entry.
    using FieldResolver = std::function<FieldValue(const ResolverContext &)>;

    // Second phase of a started field: blocks until the value is ready. Throws to report a field error.
    using FieldCompletion = std::function<FieldValue()>;

    // First phase of an async field: begins the work and returns without waiting for it.
    using FieldStarter = std::function<FieldCompletion(const ResolverContext &)>;

    using SubscriptionResolver = std::function<field_stream_u_ptr(const ResolverContext &)>;

    struct InputValue {
        std::string name;
        TypeRef type;
        std::optional<std::string> description;
        std::optional<Value> default_value;
    };

    struct FieldDefinition {
        std::string name;
        TypeRef type;
        std::vector<InputValue> arguments;
        std::optional<std::string> description;
        std::optional<std::string> deprecation;

        [[nodiscard]] const InputValue *argument(const std::string &arg_name) const;
    };

    using InterfaceField = FieldDefinition;

    struct Field : FieldDefinition {
        // Empty, together with start, means the value is read from the parent object under the field name.
        FieldResolver resolver;
        /**
         * Used instead of resolver when set. Every started sibling of an async selection set is started, in
         * document order, before any of them is completed, so a field may wait on work a later sibling begins.
         */
        FieldStarter start;
        // Resolved on its own task, concurrently with its siblings. Synchronous fields run inline.
        bool is_async{false};
    };

    struct SubscriptionField : FieldDefinition {
        SubscriptionResolver resolver;
    };

    struct Scalar {
        std::string name;
        std::optional<std::string> description;
        std::optional<std::string> specified_by_url;
    };

    struct Object {
        std::string name;
        std::optional<std::string> description;
        std::vector<std::string> implements;
        std::vector<Field> fields;
    };

    struct Interface {
        std::string name;
        std::optional<std::string> description;
        std::vector<std::string> implements;
        std::vector<InterfaceField> fields;
    };

    struct Union {
        std::string name;
        std::optional<std::string> description;
        std::vector<std::string> possible_types;
    };

    struct EnumValue {
        std::string name;
        std::optional<std::string> description;
        std::optional<std::string> deprecation;
    };

    struct Enum {
        std::string name;
        std::optional<std::string> description;
        std::vector<EnumValue> values;

        [[nodiscard]] bool contains(const std::string &value) const;
    };

    struct InputObject {
        std::string name;
        std::optional<std::string> description;
        std::vector<InputValue> fields;
    };

    // Root type for subscription operations; its fields produce streams rather than values.
    struct Subscription {
        std::string name;
        std::optional<std::string> description;
        std::vector<SubscriptionField> fields;
    };

    using TypeDefinition = std::variant<Scalar, Object, Interface, Union, Enum, InputObject, Subscription>;

    [[nodiscard]] const std::string &type_name_of(const TypeDefinition &type);

    /**
     * The finished, immutable type system. Shared by every request running against the schema.
     */
    struct GROMMET_EXPORT Registry {
        std::string query_type;
        std::optional<std::string> mutation_type;
        std::optional<std::string> subscription_type;
        ankerl::unordered_dense::map<std::string, TypeDefinition> types;
        // Registration order, used when printing the schema.
        std::vector<std::string> type_order;
        // Interface or union name to the object types it can resolve to.
        ankerl::unordered_dense::map<std::string, std::vector<std::string>> possible_types;

        [[nodiscard]] const TypeDefinition *find(const std::string &name) const;

        template<typename T>
        [[nodiscard]] const T *find_as(const std::string &name) const {
            auto type = find(name);
            return type == nullptr ? nullptr : std::get_if<T>(type);
        }

        // Field of an object, interface or subscription type.
        [[nodiscard]] const FieldDefinition *field(const std::string &type_name, const std::string &field_name) const;

        [[nodiscard]] bool is_leaf(const std::string &name) const;

        [[nodiscard]] bool is_composite(const std::string &name) const;

        [[nodiscard]] bool is_abstract(const std::string &name) const;

        [[nodiscard]] bool is_input_type(const std::string &name) const;

        [[nodiscard]] bool is_output_type(const std::string &name) const;

        // Whether a fragment on condition applies to values of object_type.
        [[nodiscard]] bool type_applies(const std::string &object_type, const std::string &condition) const;

        static bool is_builtin_scalar(const std::string &name);
    };

    struct GROMMET_EXPORT Request {
        std::string query;
        std::optional<std::string> operation_name;
        ValueMap variables;
        Data data;
        CancellationToken cancellation;
        // Runs async fields concurrently; without one every field resolves inline.
        task_executor_s_ptr executor;
    };

    /**
     * Pull based stream of responses for a subscription operation. The operation is prepared on the first
     * pull; request errors produce one error response and end the stream. A non subscription document yields
     * its single response.
     */
    class GROMMET_EXPORT ResponseStream {
    public:
        ResponseStream(std::shared_ptr<const Registry> registry, Request request);

        ~ResponseStream();

        ResponseStream(const ResponseStream &) = delete;

        ResponseStream &operator=(const ResponseStream &) = delete;

        // nullopt once the stream has ended or been closed. Pulls must not overlap.
        std::optional<Response> next();

        // Safe from any thread; takes effect no later than the next pull.
        void close() { _closed.store(true, std::memory_order_release); }

        [[nodiscard]] bool is_closed() const { return _closed.load(std::memory_order_acquire); }

    private:
        struct State;

        std::unique_ptr<State> _state;
        std::atomic<bool> _closed{false};
        bool _finished{false};
    };

    class GROMMET_EXPORT Schema {
    public:
        [[nodiscard]] Response execute(Request request) const;

        [[nodiscard]] response_stream_s_ptr execute_stream(Request request) const;

        // Schema definition language, built-in scalars omitted.
        [[nodiscard]] std::string sdl() const;

        [[nodiscard]] const Registry &registry() const { return *_registry; }

    private:
        friend class SchemaBuilder;

        explicit Schema(std::shared_ptr<const Registry> registry) : _registry{std::move(registry)} {}

        std::shared_ptr<const Registry> _registry;
    };

    class GROMMET_EXPORT SchemaBuilder {
    public:
        explicit SchemaBuilder(std::string query, std::optional<std::string> mutation = std::nullopt,
                               std::optional<std::string> subscription = std::nullopt);

        SchemaBuilder &register_type(TypeDefinition type);

        /**
         * Check the composed type system and freeze it.
         * @throws SchemaBuildError for dangling type references, missing or mistyped roots, unions over
         * non-object types, unimplemented interface fields and duplicate type names
         */
        Schema finish();

    private:
        void check() const;

        Registry _registry;
        std::vector<std::string> _duplicates;
    };
} // namespace grommet::engine

#endif // GROMMET_ENGINE_SCHEMA_H
