#include <grommet/python/lookahead.h>
#include <grommet/python/resolver.h>
#include <grommet/python/schema_builder.h>
#include <grommet/python/subscription.h>
#include <grommet/python/value_codec.h>
#include <grommet/util/errors.h>

namespace grommet {
    namespace {
        // A mapping from the schema definition, with errors naming the record it came from.
        class Record {
        public:
            Record(nb::handle value, std::string what) : _what{std::move(what)} {
                if (!PyDict_Check(value.ptr())) { throw_error<ValidationError>("{} must be a mapping", _what); }
                _entries = nb::borrow<nb::dict>(value);
            }

            [[nodiscard]] const std::string &what() const { return _what; }

            [[nodiscard]] bool has(const char *key) const { return _entries.contains(key); }

            [[nodiscard]] nb::object required(const char *key) const {
                if (!has(key)) { throw_error<ValidationError>("Missing required field \"{}\" in {}", key, _what); }
                return _entries[key];
            }

            // None is treated as absent.
            [[nodiscard]] std::optional<nb::object> optional(const char *key) const {
                if (!has(key)) { return std::nullopt; }
                nb::object value = _entries[key];
                if (value.is_none()) { return std::nullopt; }
                return value;
            }

            [[nodiscard]] std::string required_string(const char *key) const { return as_string(required(key), key); }

            [[nodiscard]] std::optional<std::string> optional_string(const char *key) const {
                auto value = optional(key);
                if (!value) { return std::nullopt; }
                return as_string(*value, key);
            }

            [[nodiscard]] std::vector<nb::object> items(const char *key) const {
                std::vector<nb::object> out;
                auto value = optional(key);
                if (!value) { return out; }
                if (!PyList_Check(value->ptr()) && !PyTuple_Check(value->ptr())) {
                    throw_error<ValidationError>("Field \"{}\" in {} must be a list", key, _what);
                }
                for (nb::handle item: *value) { out.push_back(nb::borrow(item)); }
                return out;
            }

            [[nodiscard]] std::vector<std::string> strings(const char *key) const {
                std::vector<std::string> out;
                for (const auto &item: items(key)) { out.push_back(as_string(item, key)); }
                return out;
            }

        private:
            std::string as_string(nb::handle value, const char *key) const {
                if (!PyUnicode_Check(value.ptr())) {
                    throw_error<ValidationError>("Field \"{}\" in {} must be a string", key, _what);
                }
                return nb::cast<std::string>(value);
            }

            std::string _what;
            nb::dict _entries;
        };

        class Builder {
        public:
            Builder(const ExecutionToken &token, nb::handle definition, nb::handle resolvers)
                : _token{token}, _definition{definition, "schema definition"},
                  _universe{std::make_shared<TypeUniverse>()} {
                if (!resolvers.is_none()) {
                    if (!PyDict_Check(resolvers.ptr())) { throw_error<ValidationError>("resolvers must be a mapping"); }
                    _resolvers = nb::borrow<nb::dict>(resolvers);
                }
            }

            BuiltSchema build() {
                Record roots(_definition.required("schema"), "schema roots");
                engine::SchemaBuilder builder(roots.required_string("query"), roots.optional_string("mutation"),
                                              roots.optional_string("subscription"));

                register_scalars(builder);
                register_enums(builder);
                collect_names();
                register_unions(builder);
                for (const auto &item: _definition.items("types")) { register_type(builder, item); }

                auto schema = std::make_shared<const engine::Schema>(builder.finish());
                return BuiltSchema{std::move(schema), _universe};
            }

        private:
            void register_scalars(engine::SchemaBuilder &builder) {
                for (const auto &item: _definition.items("scalars")) {
                    Record record(item, "scalar definition");
                    auto name = record.required_string("name");
                    _universe->scalars.push_back(ScalarBinding{
                        name, HostValue::make(_token, record.required("python_type")),
                        HostValue::make(_token, record.required("serialize"))
                    });
                    builder.register_type(engine::Scalar{
                        name, record.optional_string("description"), record.optional_string("specified_by_url")
                    });
                }
            }

            void register_enums(engine::SchemaBuilder &builder) {
                for (const auto &item: _definition.items("enums")) {
                    Record record(item, "enum definition");
                    engine::Enum enum_type{record.required_string("name"), record.optional_string("description"), {}};
                    for (const auto &value: record.items("values")) {
                        if (PyUnicode_Check(value.ptr())) {
                            enum_type.values.push_back({nb::cast<std::string>(value), std::nullopt, std::nullopt});
                            continue;
                        }
                        Record entry(value, fmt::format("value of enum \"{}\"", enum_type.name));
                        enum_type.values.push_back({
                            entry.required_string("name"), entry.optional_string("description"),
                            entry.optional_string("deprecation")
                        });
                    }
                    builder.register_type(std::move(enum_type));
                }
            }

            // Object and abstract type names must be known before any field's scalar hint is computed.
            void collect_names() {
                for (const auto &item: _definition.items("types")) {
                    Record record(item, "type definition");
                    auto kind = record.required_string("kind");
                    auto name = record.required_string("name");
                    if (kind == "object") {
                        _universe->object_types.insert(name);
                    } else if (kind == "interface" || kind == "union") {
                        _universe->abstract_types.insert(name);
                    }
                }
                for (const auto &item: _definition.items("unions")) {
                    _universe->abstract_types.insert(Record(item, "union definition").required_string("name"));
                }
            }

            void register_unions(engine::SchemaBuilder &builder) {
                for (const auto &item: _definition.items("unions")) {
                    Record record(item, "union definition");
                    builder.register_type(engine::Union{
                        record.required_string("name"), record.optional_string("description"), record.strings("types")
                    });
                }
            }

            void register_type(engine::SchemaBuilder &builder, nb::handle item) {
                Record record(item, "type definition");
                auto kind = record.required_string("kind");
                auto name = record.required_string("name");
                Record scoped(item, fmt::format("type \"{}\"", name));
                auto description = scoped.optional_string("description");

                if (kind == "object") {
                    engine::Object object{name, description, scoped.strings("implements"), {}};
                    for (const auto &field: scoped.items("fields")) { object.fields.push_back(object_field(name, field)); }
                    builder.register_type(std::move(object));
                } else if (kind == "interface") {
                    engine::Interface iface{name, description, scoped.strings("implements"), {}};
                    for (const auto &field: scoped.items("fields")) {
                        Record f(field, fmt::format("field of type \"{}\"", name));
                        iface.fields.push_back(field_definition(name, f));
                    }
                    builder.register_type(std::move(iface));
                } else if (kind == "subscription") {
                    engine::Subscription subscription{name, description, {}};
                    for (const auto &field: scoped.items("fields")) {
                        subscription.fields.push_back(subscription_field(name, field));
                    }
                    builder.register_type(std::move(subscription));
                } else if (kind == "input") {
                    engine::InputObject input{name, description, {}};
                    for (const auto &field: scoped.items("fields")) {
                        input.fields.push_back(input_value(Record(field, fmt::format("field of input \"{}\"", name))));
                    }
                    builder.register_type(std::move(input));
                } else if (kind == "union") {
                    builder.register_type(engine::Union{name, description, scoped.strings("types")});
                } else {
                    throw_error<ValidationError>("Unknown type kind: {}", kind);
                }
            }

            engine::InputValue input_value(const Record &record) {
                engine::InputValue value{
                    record.required_string("name"), parse_type_spec(_token, record.required("type")),
                    record.optional_string("description"), std::nullopt
                };
                // An explicit None default is a null default, unlike a missing key.
                if (record.has("default")) {
                    value.default_value = py_to_value(_token, record.required("default"), _universe->scalars);
                }
                return value;
            }

            engine::FieldDefinition field_definition(const std::string &type_name, const Record &record) {
                engine::FieldDefinition definition;
                definition.name = record.required_string("name");
                definition.type = parse_type_spec(_token, record.required("type"));
                for (const auto &arg: record.items("args")) {
                    definition.arguments.push_back(input_value(
                        Record(arg, fmt::format("argument of field \"{}.{}\"", type_name, definition.name))));
                }
                definition.description = record.optional_string("description");
                definition.deprecation = record.optional_string("deprecation");
                return definition;
            }

            field_context_s_ptr field_context(const engine::FieldDefinition &definition, const Record &record) {
                auto context = std::make_shared<FieldContext>();
                context->field_name = definition.name;
                context->source = record.optional_string("source").value_or(definition.name);
                context->output_type = definition.type;
                context->hint = scalar_hint_for(definition.type, *_universe);
                context->universe = _universe;
                context->resolver = resolver_entry(definition, record);
                if (context->resolver && shape_takes_context(context->resolver->shape)) {
                    context->context_class = context_class();
                }
                return context;
            }

            engine::Field object_field(const std::string &type_name, nb::handle item) {
                Record record(item, fmt::format("field of type \"{}\"", type_name));
                engine::Field field;
                static_cast<engine::FieldDefinition &>(field) = field_definition(type_name, record);
                auto context = field_context(field, record);
                field.is_async = context->resolver && context->resolver->is_async;
                if (field.is_async) {
                    field.start = [context](const engine::ResolverContext &ctx) { return start_field(ctx, context); };
                } else {
                    field.resolver = [context](const engine::ResolverContext &ctx) {
                        return resolve_field(ctx, *context);
                    };
                }
                return field;
            }

            engine::SubscriptionField subscription_field(const std::string &type_name, nb::handle item) {
                Record record(item, fmt::format("field of type \"{}\"", type_name));
                engine::SubscriptionField field;
                static_cast<engine::FieldDefinition &>(field) = field_definition(type_name, record);
                field_context_s_ptr context = field_context(field, record);
                field.resolver = [context](const engine::ResolverContext &ctx) {
                    return resolve_subscription(ctx, context);
                };
                return field;
            }

            std::optional<ResolverEntry> resolver_entry(const engine::FieldDefinition &definition,
                                                        const Record &record) {
                auto key = record.optional("resolver");
                if (!key) { return std::nullopt; }

                nb::object spec = *key;
                if (PyUnicode_Check(key->ptr())) {
                    if (!_resolvers.is_valid() || !_resolvers.contains(*key)) {
                        throw_error<ValidationError>("Unknown resolver \"{}\" for field \"{}\"",
                                                     nb::cast<std::string>(*key), definition.name);
                    }
                    spec = _resolvers[*key];
                }

                auto inspect = nb::module_::import_("inspect");
                ResolverEntry entry;
                for (const auto &arg: definition.arguments) { entry.arg_names.push_back(arg.name); }

                nb::object func;
                if (PyDict_Check(spec.ptr())) {
                    Record options(spec, fmt::format("resolver of field \"{}\"", definition.name));
                    func = options.required("func");
                    if (auto shape = options.optional_string("shape")) { entry.shape = parse_resolver_shape(*shape); }
                    else { entry.shape = default_shape(definition); }
                    entry.is_async = options.has("is_async")
                                         ? nb::cast<bool>(options.required("is_async"))
                                         : nb::cast<bool>(inspect.attr("iscoroutinefunction")(func));
                    entry.is_async_gen = options.has("is_async_gen")
                                             ? nb::cast<bool>(options.required("is_async_gen"))
                                             : nb::cast<bool>(inspect.attr("isasyncgenfunction")(func));
                    if (auto coercers = options.optional("coercers")) {
                        if (!PyDict_Check(coercers->ptr())) {
                            throw_error<ValidationError>("coercers of field \"{}\" must be a mapping", definition.name);
                        }
                        for (auto [name, coercer]: nb::borrow<nb::dict>(*coercers)) {
                            entry.coercers.emplace(nb::cast<std::string>(name), HostValue::make(_token, coercer));
                        }
                    }
                } else if (PyCallable_Check(spec.ptr())) {
                    func = spec;
                    entry.shape = default_shape(definition);
                    entry.is_async = nb::cast<bool>(inspect.attr("iscoroutinefunction")(func));
                    entry.is_async_gen = nb::cast<bool>(inspect.attr("isasyncgenfunction")(func));
                } else {
                    throw_error<ValidationError>("Resolver of field \"{}\" must be a callable or a mapping",
                                                 definition.name);
                }
                if (!PyCallable_Check(func.ptr())) {
                    throw_error<ValidationError>("Resolver of field \"{}\" is not callable", definition.name);
                }
                entry.func = HostValue::make(_token, func);
                return entry;
            }

            static ResolverShape default_shape(const engine::FieldDefinition &definition) {
                return definition.arguments.empty() ? ResolverShape::SelfOnly : ResolverShape::SelfAndArgs;
            }

            host_value_ptr context_class() {
                if (!_context_class) {
                    auto configured = _definition.optional("context_class");
                    _context_class = HostValue::make(_token, configured ? nb::handle(*configured) : nb::type<Context>());
                }
                return _context_class;
            }

            const ExecutionToken &_token;
            Record _definition;
            nb::dict _resolvers;
            std::shared_ptr<TypeUniverse> _universe;
            host_value_ptr _context_class;
        };
    } // namespace

    engine::TypeRef parse_type_spec(const ExecutionToken &token, nb::handle spec) {
        if (PyUnicode_Check(spec.ptr())) { return engine::TypeRef::parse(nb::cast<std::string>(spec)); }
        Record record(spec, "type reference");
        auto kind = record.required_string("kind");
        bool nullable = record.has("nullable") ? nb::cast<bool>(record.required("nullable")) : true;
        engine::TypeRef type;
        if (kind == "list") {
            type = engine::TypeRef::list(parse_type_spec(token, record.required("of_type")));
        } else if (kind == "named") {
            type = engine::TypeRef::named(record.required_string("name"));
        } else {
            throw_error<ValidationError>("Unknown type reference kind: {}", kind);
        }
        return nullable ? type : engine::TypeRef::non_null(std::move(type));
    }

    BuiltSchema build_schema(const ExecutionToken &token, nb::handle definition, nb::handle resolvers) {
        return Builder(token, definition, resolvers).build();
    }
} // namespace grommet
