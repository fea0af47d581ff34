#include <grommet/engine/schema.h>
#include <grommet/util/errors.h>

#include <algorithm>

namespace grommet::engine {
    const InputValue *FieldDefinition::argument(const std::string &arg_name) const {
        auto it = std::ranges::find_if(arguments, [&](const InputValue &arg) { return arg.name == arg_name; });
        return it == arguments.end() ? nullptr : &*it;
    }

    bool Enum::contains(const std::string &value) const {
        return std::ranges::any_of(values, [&](const EnumValue &v) { return v.name == value; });
    }

    const std::string &type_name_of(const TypeDefinition &type) {
        return std::visit([](const auto &t) -> const std::string & { return t.name; }, type);
    }

    // ========================================================================
    // Registry
    // ========================================================================

    const TypeDefinition *Registry::find(const std::string &name) const {
        auto it = types.find(name);
        return it == types.end() ? nullptr : &it->second;
    }

    const FieldDefinition *Registry::field(const std::string &type_name, const std::string &field_name) const {
        auto type = find(type_name);
        if (type == nullptr) { return nullptr; }
        auto by_name = [&](const auto &fields) -> const FieldDefinition * {
            for (const auto &f: fields) {
                if (f.name == field_name) { return &f; }
            }
            return nullptr;
        };
        if (auto object = std::get_if<Object>(type)) { return by_name(object->fields); }
        if (auto iface = std::get_if<Interface>(type)) { return by_name(iface->fields); }
        if (auto subscription = std::get_if<Subscription>(type)) { return by_name(subscription->fields); }
        return nullptr;
    }

    bool Registry::is_leaf(const std::string &name) const {
        auto type = find(name);
        return type != nullptr && (std::holds_alternative<Scalar>(*type) || std::holds_alternative<Enum>(*type));
    }

    bool Registry::is_composite(const std::string &name) const {
        auto type = find(name);
        return type != nullptr && (std::holds_alternative<Object>(*type) || std::holds_alternative<Interface>(*type) ||
                                   std::holds_alternative<Union>(*type) ||
                                   std::holds_alternative<Subscription>(*type));
    }

    bool Registry::is_abstract(const std::string &name) const {
        auto type = find(name);
        return type != nullptr && (std::holds_alternative<Interface>(*type) || std::holds_alternative<Union>(*type));
    }

    bool Registry::is_input_type(const std::string &name) const {
        auto type = find(name);
        return type != nullptr && (std::holds_alternative<Scalar>(*type) || std::holds_alternative<Enum>(*type) ||
                                   std::holds_alternative<InputObject>(*type));
    }

    bool Registry::is_output_type(const std::string &name) const {
        auto type = find(name);
        return type != nullptr && !std::holds_alternative<InputObject>(*type) &&
               !std::holds_alternative<Subscription>(*type);
    }

    bool Registry::type_applies(const std::string &object_type, const std::string &condition) const {
        if (object_type == condition) { return true; }
        auto it = possible_types.find(condition);
        return it != possible_types.end() && std::ranges::find(it->second, object_type) != it->second.end();
    }

    bool Registry::is_builtin_scalar(const std::string &name) {
        return name == "Int" || name == "Float" || name == "String" || name == "Boolean" || name == "ID";
    }

    // ========================================================================
    // SchemaBuilder
    // ========================================================================

    SchemaBuilder::SchemaBuilder(std::string query, std::optional<std::string> mutation,
                                 std::optional<std::string> subscription) {
        _registry.query_type = std::move(query);
        _registry.mutation_type = std::move(mutation);
        _registry.subscription_type = std::move(subscription);
        for (const char *name: {"Int", "Float", "String", "Boolean", "ID"}) {
            _registry.types.emplace(name, Scalar{name, std::nullopt, std::nullopt});
        }
    }

    SchemaBuilder &SchemaBuilder::register_type(TypeDefinition type) {
        auto name = type_name_of(type);
        if (_registry.types.contains(name)) {
            _duplicates.push_back(name);
            return *this;
        }
        _registry.types.emplace(name, std::move(type));
        _registry.type_order.push_back(std::move(name));
        return *this;
    }

    namespace {
        // An object field may narrow the interface field's type: add non-null or pick a possible type.
        bool is_valid_implementation(const Registry &registry, const TypeRef &object_type, const TypeRef &iface_type) {
            if (iface_type.is_non_null()) {
                return object_type.is_non_null() &&
                       is_valid_implementation(registry, object_type.of_type(), iface_type.of_type());
            }
            if (object_type.is_non_null()) {
                return is_valid_implementation(registry, object_type.of_type(), iface_type);
            }
            if (iface_type.is_list()) {
                return object_type.is_list() &&
                       is_valid_implementation(registry, object_type.of_type(), iface_type.of_type());
            }
            if (object_type.is_list()) { return false; }
            return object_type.name() == iface_type.name() ||
                   registry.type_applies(object_type.name(), iface_type.name());
        }
    } // namespace

    void SchemaBuilder::check() const {
        const auto &registry = _registry;

        if (!_duplicates.empty()) { throw_error<SchemaBuildError>("Type \"{}\" is already registered", _duplicates.front()); }

        auto check_root = [&](const std::string &name, const char *operation, bool subscription) {
            auto type = registry.find(name);
            if (type == nullptr) { throw_error<SchemaBuildError>("{} root \"{}\" not found", operation, name); }
            bool ok = subscription ? std::holds_alternative<Subscription>(*type) : std::holds_alternative<Object>(*type);
            if (!ok) { throw_error<SchemaBuildError>("{} root \"{}\" has the wrong kind of type", operation, name); }
        };
        check_root(registry.query_type, "Query", false);
        if (registry.mutation_type) { check_root(*registry.mutation_type, "Mutation", false); }
        if (registry.subscription_type) { check_root(*registry.subscription_type, "Subscription", true); }

        auto check_arguments = [&](const std::string &owner, const FieldDefinition &field) {
            for (const auto &arg: field.arguments) {
                const auto &base = arg.type.base_name();
                if (registry.find(base) == nullptr) {
                    throw_error<SchemaBuildError>("Unknown type \"{}\" used by argument \"{}.{}.{}\"", base, owner,
                                                  field.name, arg.name);
                }
                if (!registry.is_input_type(base)) {
                    throw_error<SchemaBuildError>("Argument \"{}.{}.{}\" must use an input type, got \"{}\"", owner,
                                                  field.name, arg.name, base);
                }
            }
        };
        auto check_fields = [&](const std::string &owner, const auto &fields) {
            if (fields.empty()) { throw_error<SchemaBuildError>("Type \"{}\" must define one or more fields", owner); }
            for (const auto &field: fields) {
                const auto &base = field.type.base_name();
                if (registry.find(base) == nullptr) {
                    throw_error<SchemaBuildError>("Unknown type \"{}\" used by field \"{}.{}\"", base, owner,
                                                  field.name);
                }
                if (!registry.is_output_type(base)) {
                    throw_error<SchemaBuildError>("Field \"{}.{}\" must use an output type, got \"{}\"", owner,
                                                  field.name, base);
                }
                check_arguments(owner, field);
            }
        };
        auto check_implements = [&](const std::string &owner, const std::vector<std::string> &interfaces,
                                    auto find_field) {
            for (const auto &iface_name: interfaces) {
                auto iface = registry.find_as<Interface>(iface_name);
                if (iface == nullptr) {
                    throw_error<SchemaBuildError>("Type \"{}\" implements unknown interface \"{}\"", owner,
                                                  iface_name);
                }
                for (const auto &iface_field: iface->fields) {
                    const FieldDefinition *own = find_field(iface_field.name);
                    if (own == nullptr) {
                        throw_error<SchemaBuildError>("Type \"{}\" does not implement field \"{}\" of interface \"{}\"",
                                                      owner, iface_field.name, iface_name);
                    }
                    if (!is_valid_implementation(registry, own->type, iface_field.type)) {
                        throw_error<SchemaBuildError>(
                            "Field \"{}.{}\" of type \"{}\" does not match interface field \"{}.{}\" of type \"{}\"",
                            owner, own->name, own->type.to_string(), iface_name, iface_field.name,
                            iface_field.type.to_string());
                    }
                    for (const auto &arg: iface_field.arguments) {
                        if (own->argument(arg.name) == nullptr) {
                            throw_error<SchemaBuildError>(
                                "Field \"{}.{}\" is missing argument \"{}\" required by interface \"{}\"", owner,
                                own->name, arg.name, iface_name);
                        }
                    }
                }
            }
        };

        for (const auto &name: registry.type_order) {
            const auto &type = registry.types.at(name);
            if (auto object = std::get_if<Object>(&type)) {
                check_fields(name, object->fields);
                check_implements(name, object->implements, [&](const std::string &field_name) {
                    return registry.field(name, field_name);
                });
            } else if (auto iface = std::get_if<Interface>(&type)) {
                check_fields(name, iface->fields);
                check_implements(name, iface->implements, [&](const std::string &field_name) {
                    return registry.field(name, field_name);
                });
            } else if (auto subscription = std::get_if<Subscription>(&type)) {
                check_fields(name, subscription->fields);
                for (const auto &field: subscription->fields) {
                    if (!field.resolver) {
                        throw_error<SchemaBuildError>("Subscription field \"{}.{}\" has no resolver", name,
                                                      field.name);
                    }
                }
            } else if (auto union_type = std::get_if<Union>(&type)) {
                if (union_type->possible_types.empty()) {
                    throw_error<SchemaBuildError>("Union \"{}\" must define one or more member types", name);
                }
                for (const auto &member: union_type->possible_types) {
                    if (registry.find_as<Object>(member) == nullptr) {
                        throw_error<SchemaBuildError>("Union \"{}\" member \"{}\" is not an object type", name, member);
                    }
                }
            } else if (auto enum_type = std::get_if<Enum>(&type)) {
                if (enum_type->values.empty()) {
                    throw_error<SchemaBuildError>("Enum \"{}\" must define one or more values", name);
                }
            } else if (auto input = std::get_if<InputObject>(&type)) {
                if (input->fields.empty()) {
                    throw_error<SchemaBuildError>("Type \"{}\" must define one or more fields", name);
                }
                for (const auto &field: input->fields) {
                    const auto &base = field.type.base_name();
                    if (!registry.is_input_type(base)) {
                        throw_error<SchemaBuildError>("Input field \"{}.{}\" must use a known input type, got \"{}\"",
                                                      name, field.name, base);
                    }
                }
            }
        }
    }

    Schema SchemaBuilder::finish() {
        for (const auto &name: _registry.type_order) {
            const auto &type = _registry.types.at(name);
            if (auto object = std::get_if<Object>(&type)) {
                for (const auto &iface: object->implements) { _registry.possible_types[iface].push_back(name); }
            } else if (auto union_type = std::get_if<Union>(&type)) {
                auto &members = _registry.possible_types[name];
                members.insert(members.end(), union_type->possible_types.begin(), union_type->possible_types.end());
            }
        }
        check();
        return Schema(std::make_shared<const Registry>(std::move(_registry)));
    }
} // namespace grommet::engine
