#include <grommet/engine/parser.h>
#include <grommet/engine/schema.h>
#include <grommet/runtime/task_executor.h>
#include <grommet/util/errors.h>

#include <ankerl/unordered_dense.h>
#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace grommet::engine {
    struct ExecutionScope {
        const Registry &registry;
        const Document &document;
        const OperationDefinition &operation;
        ValueMap variables;
        const Data &data;
        const CancellationToken &cancellation;
        task_executor_s_ptr executor;

        std::mutex errors_mutex;
        std::vector<ServerError> errors;
        std::shared_ptr<ScopeLifetime> lifetime{std::make_shared<ScopeLifetime>()};

        ~ExecutionScope() {
            std::unique_lock lock(lifetime->mutex);
            lifetime->alive = false;
        }

        void add_error(std::string message, Location location, std::vector<PathSegment> path) {
            std::lock_guard lock(errors_mutex);
            errors.push_back(ServerError{std::move(message), {location}, std::move(path), std::nullopt});
        }

        std::vector<ServerError> take_errors() {
            std::lock_guard lock(errors_mutex);
            return std::exchange(errors, {});
        }

        const Value *variable(const std::string &name) const {
            for (const auto &[key, value]: variables) {
                if (key == name) { return &value; }
            }
            return nullptr;
        }
    };

    const Value *ArgumentValues::get(std::string_view name) const {
        for (const auto &[key, value]: _values) {
            if (key == name) { return &value; }
        }
        return nullptr;
    }

    namespace {
        // Response key to the field nodes merged under it, in document order.
        using FieldGroups = std::vector<std::pair<std::string, std::vector<const Selection *>>>;

        std::vector<PathSegment> extend(const std::vector<PathSegment> &path, PathSegment segment) {
            auto out = path;
            out.push_back(std::move(segment));
            return out;
        }

        // ====================================================================
        // Literal and input coercion
        // ====================================================================

        bool has_variables(const AstValue &value) {
            switch (value.kind) {
                case AstValue::Kind::Variable: return true;
                case AstValue::Kind::List:
                    return std::ranges::any_of(value.items, [](const AstValue &item) { return has_variables(item); });
                case AstValue::Kind::Object:
                    return std::ranges::any_of(value.fields, [](const auto &f) { return has_variables(f.second); });
                default: return false;
            }
        }

        void collect_variable_names(const AstValue &value, std::vector<const AstValue *> &out) {
            if (value.kind == AstValue::Kind::Variable) {
                out.push_back(&value);
            } else if (value.kind == AstValue::Kind::List) {
                for (const auto &item: value.items) { collect_variable_names(item, out); }
            } else if (value.kind == AstValue::Kind::Object) {
                for (const auto &[_, field]: value.fields) { collect_variable_names(field, out); }
            }
        }

        // nullopt when the literal is a variable the request did not supply.
        std::optional<Value> ast_to_value(const AstValue &value, const ExecutionScope *scope) {
            switch (value.kind) {
                case AstValue::Kind::Variable: {
                    auto found = scope == nullptr ? nullptr : scope->variable(value.text);
                    if (found == nullptr) { return std::nullopt; }
                    return *found;
                }
                case AstValue::Kind::Null: return Value::null();
                case AstValue::Kind::Int: return Value(value.int_value);
                case AstValue::Kind::Float: return Value(value.float_value);
                case AstValue::Kind::String: return Value(value.text);
                case AstValue::Kind::Boolean: return Value(value.bool_value);
                case AstValue::Kind::Enum: return Value::enum_value(value.text);
                case AstValue::Kind::List: {
                    ValueList items;
                    items.reserve(value.items.size());
                    for (const auto &item: value.items) {
                        items.push_back(ast_to_value(item, scope).value_or(Value::null()));
                    }
                    return Value::list(std::move(items));
                }
                case AstValue::Kind::Object: {
                    ValueMap fields;
                    for (const auto &[name, field]: value.fields) {
                        if (auto converted = ast_to_value(field, scope)) { fields.emplace_back(name, *converted); }
                    }
                    return Value::object(std::move(fields));
                }
            }
            return Value::null();
        }

        Value coerce_input(const Registry &registry, const Value &value, const TypeRef &type);

        Value coerce_named_input(const Registry &registry, const Value &value, const std::string &name) {
            auto type = registry.find(name);
            if (type == nullptr) { throw_error("Unknown type \"{}\"", name); }

            if (name == "Int") {
                if (value.is_int()) { return value; }
                if (value.is_float()) {
                    double d = value.as_float();
                    // 2^63 itself is representable as a double but not as an int64
                    if (std::trunc(d) == d && d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
                        return Value(static_cast<int64_t>(d));
                    }
                }
                throw_error("Int cannot represent non-integer value: {}", value.to_string());
            }
            if (name == "Float") {
                if (value.is_int() || value.is_float()) { return Value(value.as_float()); }
                throw_error("Float cannot represent non numeric value: {}", value.to_string());
            }
            if (name == "String") {
                if (value.is_string()) { return value; }
                throw_error("String cannot represent a non string value: {}", value.to_string());
            }
            if (name == "Boolean") {
                if (value.is_bool()) { return value; }
                throw_error("Boolean cannot represent a non boolean value: {}", value.to_string());
            }
            if (name == "ID") {
                if (value.is_string()) { return value; }
                if (value.is_int()) { return Value(std::to_string(value.as_int())); }
                throw_error("ID cannot represent value: {}", value.to_string());
            }
            if (std::holds_alternative<Scalar>(*type)) { return value; }
            if (auto enum_type = std::get_if<Enum>(type)) {
                const std::string *member = value.is_enum() ? &value.as_enum()
                                            : value.is_string() ? &value.as_string()
                                            : nullptr;
                if (member != nullptr && enum_type->contains(*member)) { return Value::enum_value(*member); }
                throw_error("Enum \"{}\" cannot represent value: {}", name, value.to_string());
            }
            if (auto input = std::get_if<InputObject>(type)) {
                if (!value.is_object()) {
                    throw_error("Expected type \"{}\" to be an object, found {}", name, value.to_string());
                }
                for (const auto &[key, _]: value.as_object()) {
                    bool known = std::ranges::any_of(input->fields, [&](const InputValue &f) { return f.name == key; });
                    if (!known) { throw_error("Unknown field \"{}\" for input object \"{}\"", key, name); }
                }
                ValueMap fields;
                for (const auto &field: input->fields) {
                    if (auto provided = value.find(field.name)) {
                        fields.emplace_back(field.name, coerce_input(registry, *provided, field.type));
                    } else if (field.default_value) {
                        fields.emplace_back(field.name, coerce_input(registry, *field.default_value, field.type));
                    } else if (field.type.is_non_null()) {
                        throw_error("Field \"{}.{}\" of required type \"{}\" was not provided", name, field.name,
                                    field.type.to_string());
                    }
                }
                return Value::object(std::move(fields));
            }
            throw_error("Type \"{}\" is not an input type", name);
        }

        Value coerce_input(const Registry &registry, const Value &value, const TypeRef &type) {
            if (type.is_non_null()) {
                if (value.is_null()) { throw_error("Expected non-null value of type \"{}\"", type.to_string()); }
                return coerce_input(registry, value, type.of_type());
            }
            if (value.is_null()) { return value; }
            if (type.is_list()) {
                ValueList items;
                if (value.is_list()) {
                    items.reserve(value.as_list().size());
                    for (const auto &item: value.as_list()) {
                        items.push_back(coerce_input(registry, item, type.of_type()));
                    }
                } else {
                    // A single value is accepted where a list is expected.
                    items.push_back(coerce_input(registry, value, type.of_type()));
                }
                return Value::list(std::move(items));
            }
            return coerce_named_input(registry, value, type.name());
        }

        Value serialize_leaf(const Registry &registry, const std::string &name, const Value &value) {
            if (name == "Int") {
                if (value.is_int()) { return value; }
                if (value.is_float() && std::trunc(value.as_float()) == value.as_float()) {
                    return Value(static_cast<int64_t>(value.as_float()));
                }
                throw_error("Int cannot represent non-integer value: {}", value.to_string());
            }
            if (name == "Float") {
                if (value.is_int() || value.is_float()) { return Value(value.as_float()); }
                throw_error("Float cannot represent non numeric value: {}", value.to_string());
            }
            if (name == "String") {
                if (value.is_string()) { return value; }
                if (value.is_enum()) { return Value(value.as_enum()); }
                throw_error("String cannot represent value: {}", value.to_string());
            }
            if (name == "Boolean") {
                if (value.is_bool()) { return value; }
                throw_error("Boolean cannot represent a non boolean value: {}", value.to_string());
            }
            if (name == "ID") {
                if (value.is_string()) { return value; }
                if (value.is_int()) { return Value(std::to_string(value.as_int())); }
                throw_error("ID cannot represent value: {}", value.to_string());
            }
            if (auto enum_type = registry.find_as<Enum>(name)) {
                const std::string *member = value.is_enum() ? &value.as_enum()
                                            : value.is_string() ? &value.as_string()
                                            : nullptr;
                if (member != nullptr && enum_type->contains(*member)) { return Value::enum_value(*member); }
                throw_error("Enum \"{}\" cannot represent value: {}", name, value.to_string());
            }
            return value;
        }

        // ====================================================================
        // Field collection
        // ====================================================================

        bool directive_flag(const Directive &directive, const ExecutionScope &scope) {
            for (const auto &arg: directive.arguments) {
                if (arg.name != "if") { continue; }
                auto value = ast_to_value(arg.value, &scope);
                if (!value || !value->is_bool()) {
                    throw QueryError(fmt::format("Directive \"@{}\" argument \"if\" must be a Boolean", directive.name),
                                     {directive.location});
                }
                return value->as_bool();
            }
            throw QueryError(fmt::format("Directive \"@{}\" argument \"if\" is required", directive.name),
                             {directive.location});
        }

        bool should_include(const std::vector<Directive> &directives, const ExecutionScope &scope) {
            for (const auto &directive: directives) {
                if (directive.name == "skip" && directive_flag(directive, scope)) { return false; }
                if (directive.name == "include" && !directive_flag(directive, scope)) { return false; }
            }
            return true;
        }

        // object_type == nullptr collects through every fragment regardless of its type condition.
        void collect_fields(const ExecutionScope &scope, const std::string *object_type, const SelectionSet &selections,
                            FieldGroups &groups, ankerl::unordered_dense::set<std::string> &visited) {
            for (const auto &selection: selections) {
                if (!should_include(selection.directives, scope)) { continue; }
                switch (selection.kind) {
                    case Selection::Kind::Field: {
                        const auto &key = selection.response_key();
                        auto it = std::ranges::find_if(groups, [&](const auto &g) { return g.first == key; });
                        if (it == groups.end()) {
                            groups.emplace_back(key, std::vector<const Selection *>{&selection});
                        } else {
                            it->second.push_back(&selection);
                        }
                        break;
                    }
                    case Selection::Kind::FragmentSpread: {
                        if (!visited.insert(selection.name).second) { break; }
                        auto fragment = scope.document.fragments.find(selection.name);
                        if (fragment == scope.document.fragments.end()) { break; }
                        if (object_type != nullptr &&
                            !scope.registry.type_applies(*object_type, fragment->second.type_condition)) {
                            break;
                        }
                        if (!should_include(fragment->second.directives, scope)) { break; }
                        collect_fields(scope, object_type, fragment->second.selection_set, groups, visited);
                        break;
                    }
                    case Selection::Kind::InlineFragment: {
                        if (object_type != nullptr && selection.type_condition &&
                            !scope.registry.type_applies(*object_type, *selection.type_condition)) {
                            break;
                        }
                        collect_fields(scope, object_type, selection.selection_set, groups, visited);
                        break;
                    }
                }
            }
        }

        FieldGroups collect_subfields(const ExecutionScope &scope, const std::string *object_type,
                                      const std::vector<const Selection *> &nodes) {
            FieldGroups groups;
            ankerl::unordered_dense::set<std::string> visited;
            for (auto node: nodes) { collect_fields(scope, object_type, node->selection_set, groups, visited); }
            return groups;
        }

        const Field *find_object_field(const Registry &registry, const std::string &type_name, const std::string &name) {
            auto object = registry.find_as<Object>(type_name);
            if (object == nullptr) { return nullptr; }
            auto it = std::ranges::find_if(object->fields, [&](const Field &f) { return f.name == name; });
            return it == object->fields.end() ? nullptr : &*it;
        }

        // ====================================================================
        // Validation
        // ====================================================================

        class Validator {
        public:
            Validator(const Registry &registry, const Document &document, const OperationDefinition &operation)
                : _registry{registry}, _document{document}, _operation{operation} {}

            std::vector<ServerError> run(const std::string &root_type) {
                ankerl::unordered_dense::set<std::string> names;
                for (const auto &variable: _operation.variables) {
                    if (!names.insert(variable.name).second) {
                        error(variable.location, "There can be only one variable named \"${}\".", variable.name);
                    }
                    const auto &base = variable.type.base_name();
                    if (!_registry.is_input_type(base)) {
                        error(variable.location, "Variable \"${}\" cannot be non-input type \"{}\".", variable.name,
                              variable.type.to_string());
                    }
                    _defined.insert(variable.name);
                }
                check_directives(_operation.directives);
                if (_operation.type == OperationType::Subscription) { check_single_root_field(); }
                check_selection_set(root_type, _operation.selection_set);
                return std::move(_errors);
            }

        private:
            template<typename... Ts>
            void error(Location location, fmt::format_string<Ts...> fmt_str, Ts &&... args) {
                _errors.push_back(ServerError{fmt::format(fmt_str, std::forward<Ts>(args)...), {location}, {},
                                              std::nullopt});
            }

            void check_single_root_field() {
                size_t count = 0;
                for (const auto &selection: _operation.selection_set) {
                    if (selection.kind == Selection::Kind::Field) {
                        ++count;
                    } else if (selection.kind == Selection::Kind::InlineFragment) {
                        count += selection.selection_set.size();
                    } else {
                        auto fragment = _document.fragments.find(selection.name);
                        if (fragment != _document.fragments.end()) { count += fragment->second.selection_set.size(); }
                    }
                }
                if (count != 1) {
                    if (_operation.name) {
                        error(_operation.location, "Subscription \"{}\" must select only one top level field.",
                              *_operation.name);
                    } else {
                        error(_operation.location, "Anonymous Subscription must select only one top level field.");
                    }
                }
            }

            void check_variables(const AstValue &value) {
                std::vector<const AstValue *> used;
                collect_variable_names(value, used);
                for (auto variable: used) {
                    if (!_defined.contains(variable->text)) {
                        error(variable->location, "Variable \"${}\" is not defined.", variable->text);
                    }
                }
            }

            void check_directives(const std::vector<Directive> &directives) {
                for (const auto &directive: directives) {
                    if (directive.name != "skip" && directive.name != "include") {
                        error(directive.location, "Unknown directive \"@{}\".", directive.name);
                        continue;
                    }
                    for (const auto &arg: directive.arguments) { check_variables(arg.value); }
                }
            }

            void check_field(const std::string &parent_type, const Selection &selection) {
                check_directives(selection.directives);
                if (selection.name == "__typename") {
                    if (!selection.selection_set.empty()) {
                        error(selection.location,
                              "Field \"__typename\" must not have a selection since type \"String!\" has no subfields.");
                    }
                    return;
                }
                auto field = _registry.field(parent_type, selection.name);
                if (field == nullptr) {
                    error(selection.location, "Unknown field \"{}\" on type \"{}\".", selection.name, parent_type);
                    return;
                }

                for (const auto &arg: selection.arguments) {
                    check_variables(arg.value);
                    auto definition = field->argument(arg.name);
                    if (definition == nullptr) {
                        error(arg.location, "Unknown argument \"{}\" on field \"{}.{}\".", arg.name, parent_type,
                              selection.name);
                        continue;
                    }
                    if (!has_variables(arg.value)) {
                        try {
                            coerce_input(_registry, *ast_to_value(arg.value, nullptr), definition->type);
                        } catch (const GrommetError &e) {
                            error(arg.location, "Invalid value for argument \"{}\": {}", arg.name, e.what());
                        }
                    }
                }
                for (const auto &definition: field->arguments) {
                    if (!definition.type.is_non_null() || definition.default_value) { continue; }
                    bool provided = std::ranges::any_of(selection.arguments,
                                                        [&](const Argument &a) { return a.name == definition.name; });
                    if (!provided) {
                        error(selection.location,
                              "Field \"{}\" argument \"{}\" of type \"{}\" is required, but it was not provided.",
                              selection.name, definition.name, definition.type.to_string());
                    }
                }

                const auto &base = field->type.base_name();
                if (_registry.is_leaf(base)) {
                    if (!selection.selection_set.empty()) {
                        error(selection.location,
                              "Field \"{}\" must not have a selection since type \"{}\" has no subfields.",
                              selection.name, field->type.to_string());
                    }
                } else if (selection.selection_set.empty()) {
                    error(selection.location, "Field \"{}\" of type \"{}\" must have a selection of subfields.",
                          selection.name, field->type.to_string());
                } else {
                    check_selection_set(base, selection.selection_set);
                }
            }

            bool check_type_condition(const std::string &condition, Location location) {
                if (_registry.find(condition) == nullptr) {
                    error(location, "Unknown type \"{}\".", condition);
                    return false;
                }
                if (!_registry.is_composite(condition)) {
                    error(location, "Fragment cannot condition on non composite type \"{}\".", condition);
                    return false;
                }
                return true;
            }

            void check_selection_set(const std::string &parent_type, const SelectionSet &selections) {
                for (const auto &selection: selections) {
                    switch (selection.kind) {
                        case Selection::Kind::Field: check_field(parent_type, selection);
                            break;
                        case Selection::Kind::InlineFragment: {
                            check_directives(selection.directives);
                            const auto &type = selection.type_condition ? *selection.type_condition : parent_type;
                            if (check_type_condition(type, selection.location)) {
                                check_selection_set(type, selection.selection_set);
                            }
                            break;
                        }
                        case Selection::Kind::FragmentSpread: {
                            check_directives(selection.directives);
                            auto fragment = _document.fragments.find(selection.name);
                            if (fragment == _document.fragments.end()) {
                                error(selection.location, "Unknown fragment \"{}\".", selection.name);
                                break;
                            }
                            if (std::ranges::find(_fragment_stack, selection.name) != _fragment_stack.end()) {
                                error(selection.location, "Cannot spread fragment \"{}\" within itself.",
                                      selection.name);
                                break;
                            }
                            if (!_checked_fragments.insert(selection.name).second) { break; }
                            const auto &definition = fragment->second;
                            check_directives(definition.directives);
                            if (check_type_condition(definition.type_condition, definition.location)) {
                                _fragment_stack.push_back(selection.name);
                                check_selection_set(definition.type_condition, definition.selection_set);
                                _fragment_stack.pop_back();
                            }
                            break;
                        }
                    }
                }
            }

            const Registry &_registry;
            const Document &_document;
            const OperationDefinition &_operation;
            ankerl::unordered_dense::set<std::string> _defined;
            ankerl::unordered_dense::set<std::string> _checked_fragments;
            std::vector<std::string> _fragment_stack;
            std::vector<ServerError> _errors;
        };

        // ====================================================================
        // Preparation: parse, select, validate, coerce variables
        // ====================================================================

        struct Prepared {
            Document document;
            const OperationDefinition *operation{nullptr};
            std::string root_type;
            std::unique_ptr<ExecutionScope> scope;
        };

        const OperationDefinition &select_operation(const Document &document,
                                                    const std::optional<std::string> &operation_name) {
            if (operation_name) {
                for (const auto &op: document.operations) {
                    if (op.name == operation_name) { return op; }
                }
                throw QueryError(fmt::format("Unknown operation named \"{}\".", *operation_name));
            }
            if (document.operations.empty()) { throw QueryError("Must provide an operation."); }
            if (document.operations.size() > 1) {
                throw QueryError("Must provide operation name if query contains multiple operations.");
            }
            return document.operations.front();
        }

        ValueMap coerce_variables(const Registry &registry, const OperationDefinition &operation,
                                  const ValueMap &provided) {
            ValueMap coerced;
            for (const auto &definition: operation.variables) {
                auto it = std::ranges::find_if(provided, [&](const auto &p) { return p.first == definition.name; });
                try {
                    if (it != provided.end()) {
                        coerced.emplace_back(definition.name, coerce_input(registry, it->second, definition.type));
                    } else if (definition.default_value) {
                        coerced.emplace_back(definition.name,
                                             coerce_input(registry, *ast_to_value(*definition.default_value, nullptr),
                                                          definition.type));
                    } else if (definition.type.is_non_null()) {
                        throw QueryError(fmt::format("Variable \"${}\" of required type \"{}\" was not provided.",
                                                     definition.name, definition.type.to_string()),
                                         {definition.location});
                    }
                } catch (const QueryError &) {
                    throw;
                } catch (const GrommetError &e) {
                    throw QueryError(fmt::format("Variable \"${}\" got invalid value; {}", definition.name, e.what()),
                                     {definition.location});
                }
            }
            return coerced;
        }

        // Fills prepared; returns the error response when the request cannot run.
        std::optional<Response> prepare(const Registry &registry, const Request &request, Prepared &prepared) {
            try {
                prepared.document = parse_query(request.query);
                const auto &operation = select_operation(prepared.document, request.operation_name);
                prepared.operation = &operation;

                std::optional<std::string> root;
                switch (operation.type) {
                    case OperationType::Query: root = registry.query_type;
                        break;
                    case OperationType::Mutation: root = registry.mutation_type;
                        break;
                    case OperationType::Subscription: root = registry.subscription_type;
                        break;
                }
                if (!root) {
                    throw QueryError(fmt::format("Schema is not configured for {}s.",
                                                 operation_type_name(operation.type)),
                                     {operation.location});
                }
                prepared.root_type = *root;

                auto errors = Validator(registry, prepared.document, operation).run(prepared.root_type);
                if (!errors.empty()) { return Response::from_errors(std::move(errors)); }

                prepared.scope.reset(new ExecutionScope{
                    registry, prepared.document, operation, coerce_variables(registry, operation, request.variables),
                    request.data, request.cancellation, request.executor, {}, {}
                });
            } catch (const QueryError &e) {
                return Response::from_errors({e.to_server_error()});
            }
            return std::nullopt;
        }

        // ====================================================================
        // Execution
        // ====================================================================

        class Executor {
        public:
            explicit Executor(ExecutionScope &scope) : _scope{scope}, _registry{scope.registry} {}

            // nullopt when a non-null field failed and the whole object has to become null.
            std::optional<Value> execute_selection_set(const std::string &object_type, const FieldValue *parent,
                                                       const FieldGroups &groups, const std::vector<PathSegment> &path,
                                                       bool serial) {
                std::vector<std::optional<Value>> results(groups.size());
                if (serial) {
                    for (size_t i = 0; i < groups.size(); ++i) {
                        results[i] = execute_field(object_type, parent, groups[i].first, groups[i].second, path);
                    }
                } else {
                    TaskGroup group(_scope.executor);
                    std::vector<std::pair<size_t, std::function<std::optional<Value>()>>> started;
                    for (size_t i = 0; i < groups.size(); ++i) {
                        auto field = find_object_field(_registry, object_type, groups[i].second.front()->name);
                        if (field != nullptr && field->is_async && field->start) {
                            started.emplace_back(i, start_field(*field, object_type, parent, groups[i].first,
                                                                groups[i].second, path));
                        } else if (field != nullptr && field->is_async) {
                            group.spawn([this, &results, &groups, &object_type, parent, &path, i] {
                                results[i] = execute_field(object_type, parent, groups[i].first, groups[i].second,
                                                           path);
                            });
                        } else {
                            results[i] = execute_field(object_type, parent, groups[i].first, groups[i].second, path);
                        }
                    }
                    for (auto &entry: started) {
                        group.spawn([&results, index = entry.first, finish = std::move(entry.second)] {
                            results[index] = finish();
                        });
                    }
                    group.wait();
                }

                ValueMap fields;
                fields.reserve(groups.size());
                for (size_t i = 0; i < groups.size(); ++i) {
                    if (!results[i]) { return std::nullopt; }
                    fields.emplace_back(groups[i].first, std::move(*results[i]));
                }
                return Value::object(std::move(fields));
            }

            // nullopt only when a non-null field failed.
            std::optional<Value> execute_field(const std::string &object_type, const FieldValue *parent,
                                               const std::string &key, const std::vector<const Selection *> &nodes,
                                               const std::vector<PathSegment> &path) {
                const auto &node = *nodes.front();
                if (node.name == "__typename") { return Value(object_type); }

                auto field_path = extend(path, key);
                auto field = find_object_field(_registry, object_type, node.name);
                if (field == nullptr) {
                    _scope.add_error(fmt::format("Unknown field \"{}\" on type \"{}\".", node.name, object_type),
                                     node.location, field_path);
                    return Value::null();
                }
                auto label = fmt::format("{}.{}", object_type, node.name);

                _scope.cancellation.throw_if_cancelled();
                FieldValue resolved;
                try {
                    auto args = coerce_arguments(*field, node);
                    if (field->start || field->resolver) {
                        ResolverContext ctx(_scope.data, _scope.cancellation, parent, std::move(args),
                                            SelectionField(nodes, &_scope), field_path);
                        resolved = field->start ? field->start(ctx)() : field->resolver(ctx);
                    } else {
                        resolved = default_resolve(parent, node.name);
                    }
                } catch (const Cancelled &) {
                    throw;
                } catch (const std::exception &e) {
                    return field_error(*field, e.what(), node, field_path);
                }
                return complete_value(field->type, resolved, nodes, field_path, label);
            }

            // Runs the first phase of a started field; the returned task completes it.
            std::function<std::optional<Value>()> start_field(const Field &field, const std::string &object_type,
                                                              const FieldValue *parent, const std::string &key,
                                                              const std::vector<const Selection *> &nodes,
                                                              const std::vector<PathSegment> &path) {
                const auto &node = *nodes.front();
                auto field_path = extend(path, key);
                _scope.cancellation.throw_if_cancelled();

                FieldCompletion completion;
                try {
                    ResolverContext ctx(_scope.data, _scope.cancellation, parent, coerce_arguments(field, node),
                                        SelectionField(nodes, &_scope), field_path);
                    completion = field.start(ctx);
                } catch (const Cancelled &) {
                    throw;
                } catch (const std::exception &e) {
                    return [this, &field, &node, field_path, message = std::string(e.what())] {
                        return field_error(field, message, node, field_path);
                    };
                }
                return [this, &field, &nodes, field_path, label = fmt::format("{}.{}", object_type, node.name),
                        completion = std::move(completion)]() -> std::optional<Value> {
                    FieldValue resolved;
                    try {
                        resolved = completion();
                    } catch (const Cancelled &) {
                        throw;
                    } catch (const std::exception &e) {
                        return field_error(field, e.what(), *nodes.front(), field_path);
                    }
                    return complete_value(field.type, resolved, nodes, field_path, label);
                };
            }

            std::optional<Value> complete_value(const TypeRef &type, const FieldValue &value,
                                                const std::vector<const Selection *> &nodes,
                                                const std::vector<PathSegment> &path, const std::string &label) {
                if (type.is_non_null()) {
                    if (value.is_null()) {
                        _scope.add_error(fmt::format("Cannot return null for non-nullable field {}.", label),
                                         nodes.front()->location, path);
                        return std::nullopt;
                    }
                    // A null propagated from below was already reported where it happened.
                    try {
                        return complete_nullable(type.of_type(), value, nodes, path, label);
                    } catch (const Cancelled &) {
                        throw;
                    } catch (const std::exception &e) {
                        _scope.add_error(e.what(), nodes.front()->location, path);
                        return std::nullopt;
                    }
                }
                if (value.is_null()) { return Value::null(); }
                try {
                    auto result = complete_nullable(type, value, nodes, path, label);
                    return result ? std::move(*result) : Value::null();
                } catch (const Cancelled &) {
                    throw;
                } catch (const std::exception &e) {
                    _scope.add_error(e.what(), nodes.front()->location, path);
                    return Value::null();
                }
            }

        private:
            // Records a resolver failure; nullopt when the field is non-null and the parent has to become null.
            std::optional<Value> field_error(const Field &field, const std::string &message, const Selection &node,
                                             const std::vector<PathSegment> &path) {
                _scope.add_error(message, node.location, path);
                if (field.type.is_non_null()) { return std::nullopt; }
                return Value::null();
            }

            ArgumentValues coerce_arguments(const FieldDefinition &field, const Selection &node) {
                ValueMap values;
                for (const auto &definition: field.arguments) {
                    auto provided = std::ranges::find_if(node.arguments,
                                                         [&](const Argument &a) { return a.name == definition.name; });
                    std::optional<Value> raw;
                    if (provided != node.arguments.end()) { raw = ast_to_value(provided->value, &_scope); }
                    if (!raw && definition.default_value) { raw = *definition.default_value; }
                    if (!raw) {
                        if (definition.type.is_non_null()) {
                            throw_error("Field \"{}\" argument \"{}\" of type \"{}\" is required, but it was not provided.",
                                        field.name, definition.name, definition.type.to_string());
                        }
                        continue;
                    }
                    try {
                        values.emplace_back(definition.name, coerce_input(_registry, *raw, definition.type));
                    } catch (const GrommetError &e) {
                        throw_error("Invalid value for argument \"{}\": {}", definition.name, e.what());
                    }
                }
                return ArgumentValues(std::move(values));
            }

            static FieldValue default_resolve(const FieldValue *parent, const std::string &name) {
                if (parent == nullptr || parent->kind() != FieldValue::Kind::Value) { return FieldValue::null(); }
                auto found = parent->as_value().find(name);
                return found == nullptr ? FieldValue::null() : FieldValue(*found);
            }

            // Completes a nullable list or named type; throws for an error at this position.
            std::optional<Value> complete_nullable(const TypeRef &type, const FieldValue &value,
                                                   const std::vector<const Selection *> &nodes,
                                                   const std::vector<PathSegment> &path, const std::string &label) {
                if (type.is_list()) {
                    ValueList items;
                    auto complete_item = [&](size_t index, const FieldValue &item) {
                        auto result = complete_value(type.of_type(), item, nodes, extend(path, index), label);
                        if (!result) { return false; }
                        items.push_back(std::move(*result));
                        return true;
                    };
                    if (value.kind() == FieldValue::Kind::List) {
                        const auto &list = value.as_list();
                        items.reserve(list.size());
                        for (size_t i = 0; i < list.size(); ++i) {
                            if (!complete_item(i, list[i])) { return std::nullopt; }
                        }
                    } else if (value.kind() == FieldValue::Kind::Value && value.as_value().is_list()) {
                        const auto &list = value.as_value().as_list();
                        items.reserve(list.size());
                        for (size_t i = 0; i < list.size(); ++i) {
                            if (!complete_item(i, FieldValue(list[i]))) { return std::nullopt; }
                        }
                    } else {
                        throw ExpectedList();
                    }
                    return Value::list(std::move(items));
                }

                const auto &name = type.name();
                if (_registry.is_leaf(name)) {
                    if (value.kind() != FieldValue::Kind::Value) {
                        throw_error("Expected a value of type \"{}\" for field {}", name, label);
                    }
                    return serialize_leaf(_registry, name, value.as_value());
                }

                std::string object_type = name;
                if (_registry.is_abstract(name)) {
                    if (value.type_name()) {
                        object_type = *value.type_name();
                    } else if (auto typename_value = value.kind() == FieldValue::Kind::Value
                                                         ? value.as_value().find("__typename")
                                                         : nullptr;
                               typename_value != nullptr && typename_value->is_string()) {
                        object_type = typename_value->as_string();
                    } else {
                        throw_error("Abstract type \"{}\" must resolve to an object type at runtime for field {}",
                                    name, label);
                    }
                    if (_registry.find_as<Object>(object_type) == nullptr ||
                        !_registry.type_applies(object_type, name)) {
                        throw_error("Runtime object type \"{}\" is not a possible type for \"{}\"", object_type, name);
                    }
                }
                if (value.kind() == FieldValue::Kind::List ||
                    (value.kind() == FieldValue::Kind::Value && !value.as_value().is_object())) {
                    throw_error("Expected an object of type \"{}\" for field {}", object_type, label);
                }
                auto groups = collect_subfields(_scope, &object_type, nodes);
                return execute_selection_set(object_type, &value, groups, path, false);
            }

            ExecutionScope &_scope;
            const Registry &_registry;
        };

        Response run_operation(Prepared &prepared) {
            auto &scope = *prepared.scope;
            Executor executor(scope);
            FieldGroups groups;
            ankerl::unordered_dense::set<std::string> visited;
            Response response;
            try {
                collect_fields(scope, &prepared.root_type, prepared.operation->selection_set, groups, visited);
                bool serial = prepared.operation->type == OperationType::Mutation;
                auto data = executor.execute_selection_set(prepared.root_type, nullptr, groups, {}, serial);
                response.data = data ? std::move(*data) : Value::null();
            } catch (const Cancelled &e) {
                return Response::from_errors({ServerError{e.what(), {}, {}, std::nullopt}});
            } catch (const QueryError &e) {
                return Response::from_errors({e.to_server_error()});
            }
            response.errors = scope.take_errors();
            return response;
        }
    } // namespace

    SelectionField::SelectionField(std::vector<const Selection *> nodes, const ExecutionScope *scope)
        : _nodes{std::move(nodes)}, _scope{scope}, _lifetime{scope != nullptr ? scope->lifetime : nullptr} {}

    std::optional<std::vector<SelectionField>> SelectionField::try_selection_set() const {
        if (!_lifetime) { return selection_set(); }
        std::shared_lock lock(_lifetime->mutex);
        if (!_lifetime->alive) { return std::nullopt; }
        return selection_set();
    }

    std::vector<SelectionField> SelectionField::selection_set() const {
        std::vector<SelectionField> children;
        if (_scope == nullptr) { return children; }
        auto groups = collect_subfields(*_scope, nullptr, _nodes);
        children.reserve(groups.size());
        for (auto &[_, nodes]: groups) { children.emplace_back(std::move(nodes), _scope); }
        return children;
    }

    Response Schema::execute(Request request) const {
        Prepared prepared;
        if (auto failed = prepare(*_registry, request, prepared)) { return std::move(*failed); }
        return run_operation(prepared);
    }

    response_stream_s_ptr Schema::execute_stream(Request request) const {
        return std::make_shared<ResponseStream>(_registry, std::move(request));
    }

    // ========================================================================
    // ResponseStream
    // ========================================================================

    struct ResponseStream::State {
        std::shared_ptr<const Registry> registry;
        Request request;
        Prepared prepared;
        bool started{false};

        const SubscriptionField *field{nullptr};
        std::string key;
        std::vector<const Selection *> nodes;
        field_stream_u_ptr stream;

        Response item_error(const std::string &message) const {
            return Response::from_errors({ServerError{message, {nodes.front()->location}, {key}, std::nullopt}});
        }

        // Resolves the subscription root field into its stream; returns the response when it cannot stream.
        std::optional<Response> start() {
            if (auto failed = prepare(*registry, request, prepared)) { return std::move(*failed); }
            if (prepared.operation->type != OperationType::Subscription) { return run_operation(prepared); }

            auto &scope = *prepared.scope;
            FieldGroups groups;
            ankerl::unordered_dense::set<std::string> visited;
            try {
                collect_fields(scope, &prepared.root_type, prepared.operation->selection_set, groups, visited);
            } catch (const QueryError &e) {
                return Response::from_errors({e.to_server_error()});
            }
            if (groups.empty()) {
                Response empty;
                empty.data = Value::object();
                return empty;
            }
            key = groups.front().first;
            nodes = groups.front().second;

            auto subscription = registry->find_as<Subscription>(prepared.root_type);
            auto it = std::ranges::find_if(subscription->fields,
                                           [&](const SubscriptionField &f) { return f.name == nodes.front()->name; });
            if (it == subscription->fields.end()) {
                return item_error(fmt::format("Unknown field \"{}\" on type \"{}\".", nodes.front()->name,
                                              prepared.root_type));
            }
            field = &*it;

            try {
                scope.cancellation.throw_if_cancelled();
                ValueMap values;
                for (const auto &definition: field->arguments) {
                    auto provided = std::ranges::find_if(nodes.front()->arguments,
                                                         [&](const Argument &a) { return a.name == definition.name; });
                    std::optional<Value> raw;
                    if (provided != nodes.front()->arguments.end()) { raw = ast_to_value(provided->value, &scope); }
                    if (!raw && definition.default_value) { raw = *definition.default_value; }
                    if (!raw) { continue; }
                    values.emplace_back(definition.name, coerce_input(*registry, *raw, definition.type));
                }
                ResolverContext ctx(scope.data, scope.cancellation, nullptr, ArgumentValues(std::move(values)),
                                    SelectionField(nodes, &scope), {key});
                stream = field->resolver(ctx);
            } catch (const std::exception &e) {
                return item_error(e.what());
            }
            if (!stream) { return item_error("Subscription resolver did not produce a stream"); }
            return std::nullopt;
        }
    };

    ResponseStream::ResponseStream(std::shared_ptr<const Registry> registry, Request request)
        : _state{std::make_unique<State>()} {
        _state->registry = std::move(registry);
        _state->request = std::move(request);
    }

    ResponseStream::~ResponseStream() = default;

    std::optional<Response> ResponseStream::next() {
        if (_finished || is_closed()) { return std::nullopt; }
        auto &state = *_state;
        if (!state.started) {
            state.started = true;
            if (auto response = state.start()) {
                _finished = true;
                if (is_closed()) { return std::nullopt; }
                return response;
            }
        }

        std::optional<FieldValue> item;
        try {
            item = state.stream->next();
        } catch (const std::exception &e) {
            _finished = true;
            state.stream.reset();
            if (is_closed()) { return std::nullopt; }
            return state.item_error(e.what());
        }
        if (!item || is_closed()) {
            _finished = true;
            state.stream.reset();
            return std::nullopt;
        }

        auto &scope = *state.prepared.scope;
        Executor executor(scope);
        Response response;
        try {
            auto label = fmt::format("{}.{}", state.prepared.root_type, state.field->name);
            auto value = executor.complete_value(state.field->type, *item, state.nodes, {state.key}, label);
            response.data = value ? Value::object({{state.key, std::move(*value)}}) : Value::null();
        } catch (const Cancelled &e) {
            _finished = true;
            if (is_closed()) { return std::nullopt; }
            return Response::from_errors({ServerError{e.what(), {}, {}, std::nullopt}});
        }
        response.errors = scope.take_errors();
        return response;
    }
} // namespace grommet::engine
