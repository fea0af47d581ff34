#include <grommet/python/value_codec.h>
#include <grommet/util/errors.h>

namespace grommet {
    using engine::FieldValue;
    using engine::TypeRef;
    using engine::Value;

    ScalarHint scalar_hint_for(const TypeRef &type, const TypeUniverse &universe) {
        const auto &name = type.base_name();
        if (name == "String") { return ScalarHint::String; }
        if (name == "Int") { return ScalarHint::Int; }
        if (name == "Float") { return ScalarHint::Float; }
        if (name == "Boolean") { return ScalarHint::Boolean; }
        if (name == "ID") { return ScalarHint::ID; }
        if (universe.object_types.contains(name) || universe.abstract_types.contains(name)) {
            return ScalarHint::Object;
        }
        return ScalarHint::Unknown;
    }

    std::optional<HostMeta> host_meta(const ExecutionToken &, nb::handle value) {
        nb::handle type(reinterpret_cast<PyObject *>(Py_TYPE(value.ptr())));
        if (!nb::hasattr(type, "__grommet_meta__")) { return std::nullopt; }
        nb::object meta = type.attr("__grommet_meta__");

        nb::object kind;
        nb::object name;
        if (PyDict_Check(meta.ptr())) {
            nb::dict entries = nb::borrow<nb::dict>(meta);
            if (!entries.contains("kind")) { return std::nullopt; }
            kind = entries["kind"];
            if (entries.contains("name")) { name = entries["name"]; }
        } else {
            if (!nb::hasattr(meta, "kind")) { return std::nullopt; }
            kind = meta.attr("kind");
            if (nb::hasattr(meta, "name")) { name = meta.attr("name"); }
        }
        if (nb::hasattr(kind, "value")) { kind = kind.attr("value"); }
        if (!PyUnicode_Check(kind.ptr())) { return std::nullopt; }
        if (!name.is_valid() || name.is_none()) { name = type.attr("__name__"); }
        return HostMeta{nb::cast<std::string>(kind), nb::cast<std::string>(name)};
    }

    namespace {
        nb::object input_fields(nb::handle value) {
            auto dataclasses = nb::module_::import_("dataclasses");
            if (nb::cast<bool>(dataclasses.attr("is_dataclass")(value))) { return dataclasses.attr("asdict")(value); }
            return nb::module_::import_("builtins").attr("vars")(value);
        }

        const ScalarBinding *find_binding(const ExecutionToken &token, nb::handle value,
                                          const std::vector<ScalarBinding> &scalars) {
            for (const auto &binding: scalars) {
                int matched = PyObject_IsInstance(value.ptr(), binding.python_type->bind(token).ptr());
                if (matched < 0) { throw nb::python_error(); }
                if (matched == 1) { return &binding; }
            }
            return nullptr;
        }

        Value int_value(nb::handle value) {
            int overflow = 0;
            long long result = PyLong_AsLongLongAndOverflow(value.ptr(), &overflow);
            if (overflow != 0) {
                double widened = PyLong_AsDouble(value.ptr());
                if (widened == -1.0 && PyErr_Occurred()) { throw nb::python_error(); }
                return Value(widened);
            }
            if (result == -1 && PyErr_Occurred()) { throw nb::python_error(); }
            return Value(static_cast<int64_t>(result));
        }

        std::optional<Value> primitive_value(nb::handle value) {
            if (value.is_none()) { return Value::null(); }
            if (PyBool_Check(value.ptr())) { return Value(value.ptr() == Py_True); }
            if (PyLong_Check(value.ptr())) { return int_value(value); }
            if (PyFloat_Check(value.ptr())) { return Value(PyFloat_AS_DOUBLE(value.ptr())); }
            if (PyUnicode_Check(value.ptr())) { return Value(nb::cast<std::string>(value)); }
            if (PyBytes_Check(value.ptr())) {
                return Value::binary(std::string(PyBytes_AS_STRING(value.ptr()),
                                                 static_cast<size_t>(PyBytes_GET_SIZE(value.ptr()))));
            }
            return std::nullopt;
        }

        FieldValue owned(const ExecutionToken &token, nb::handle value,
                         std::optional<std::string> type_name = std::nullopt) {
            return FieldValue::owned_any(HostValue::make(token, value), std::move(type_name));
        }

        // Scalar binding, enum metadata, primitives; anything else stays a python handle.
        FieldValue leaf_or_handle(const ExecutionToken &token, nb::handle value, const TypeUniverse &universe) {
            if (auto binding = find_binding(token, value, universe.scalars)) {
                nb::object serialized = binding->serialize->bind(token)(value);
                return py_to_value(token, serialized, universe.scalars, false);
            }
            if (auto meta = host_meta(token, value); meta && meta->kind == "enum") {
                return Value::enum_value(nb::cast<std::string>(value.attr("name")));
            }
            if (auto primitive = primitive_value(value)) { return std::move(*primitive); }
            return owned(token, value);
        }

        template<typename Fn>
        void for_each_item(nb::handle sequence, Fn &&fn) {
            if (PyList_Check(sequence.ptr())) {
                for (nb::handle item: nb::borrow<nb::list>(sequence)) { fn(item); }
            } else if (PyTuple_Check(sequence.ptr())) {
                for (nb::handle item: nb::borrow<nb::tuple>(sequence)) { fn(item); }
            } else {
                throw ExpectedList();
            }
        }
    } // namespace

    Value py_to_value(const ExecutionToken &token, nb::handle value, const std::vector<ScalarBinding> &scalars,
                      bool allow_scalar) {
        if (allow_scalar) {
            if (auto binding = find_binding(token, value, scalars)) {
                nb::object serialized = binding->serialize->bind(token)(value);
                return py_to_value(token, serialized, scalars, false);
            }
        }
        if (auto meta = host_meta(token, value)) {
            if (meta->kind == "enum") { return Value::enum_value(nb::cast<std::string>(value.attr("name"))); }
            if (meta->kind == "input") { return py_to_value(token, input_fields(value), scalars, allow_scalar); }
        }
        if (auto primitive = primitive_value(value)) { return std::move(*primitive); }
        if (PyList_Check(value.ptr()) || PyTuple_Check(value.ptr())) {
            engine::ValueList items;
            items.reserve(static_cast<size_t>(nb::len(value)));
            for_each_item(value, [&](nb::handle item) { items.push_back(py_to_value(token, item, scalars, allow_scalar)); });
            return Value::list(std::move(items));
        }
        if (PyDict_Check(value.ptr())) {
            engine::ValueMap fields;
            fields.reserve(static_cast<size_t>(nb::len(value)));
            for (auto [key, item]: nb::borrow<nb::dict>(value)) {
                if (!PyUnicode_Check(key.ptr())) { throw UnsupportedValueType(); }
                fields.emplace_back(nb::cast<std::string>(key), py_to_value(token, item, scalars, allow_scalar));
            }
            return Value::object(std::move(fields));
        }
        throw UnsupportedValueType();
    }

    FieldValue py_to_field_value_for_type(const ExecutionToken &token, nb::handle value, const TypeRef &type,
                                          ScalarHint hint, const TypeUniverse &universe) {
        if (value.is_none()) { return FieldValue::null(); }
        switch (type.kind()) {
            case TypeRef::Kind::NonNull:
                return py_to_field_value_for_type(token, value, type.of_type(), hint, universe);
            case TypeRef::Kind::List: {
                std::vector<FieldValue> items;
                for_each_item(value, [&](nb::handle item) {
                    items.push_back(py_to_field_value_for_type(token, item, type.of_type(), hint, universe));
                });
                return FieldValue::list(std::move(items));
            }
            case TypeRef::Kind::Named: break;
        }

        if (universe.abstract_types.contains(type.name())) {
            auto meta = host_meta(token, value);
            if (!meta || meta->kind == "enum" || meta->kind == "input") { throw AbstractTypeRequiresObject(); }
            return owned(token, value, meta->name);
        }

        auto ptr = value.ptr();
        switch (hint) {
            case ScalarHint::String:
                if (PyUnicode_Check(ptr)) { return Value(nb::cast<std::string>(value)); }
                break;
            case ScalarHint::Int:
                if (PyLong_Check(ptr) && !PyBool_Check(ptr)) { return int_value(value); }
                break;
            case ScalarHint::Float:
                if (PyFloat_Check(ptr)) { return Value(PyFloat_AS_DOUBLE(ptr)); }
                break;
            case ScalarHint::Boolean:
                if (PyBool_Check(ptr)) { return Value(ptr == Py_True); }
                break;
            case ScalarHint::ID:
                if (PyUnicode_Check(ptr)) { return Value(nb::cast<std::string>(value)); }
                if (PyLong_Check(ptr) && !PyBool_Check(ptr)) { return int_value(value); }
                break;
            case ScalarHint::Object:
                return owned(token, value);
            case ScalarHint::Unknown:
                break;
        }
        return leaf_or_handle(token, value, universe);
    }

    nb::object value_to_py(const ExecutionToken &token, const Value &value) {
        switch (value.kind()) {
            case Value::Kind::Null: return nb::none();
            case Value::Kind::Boolean: return nb::bool_(value.as_bool());
            case Value::Kind::Int: return nb::int_(value.as_int());
            case Value::Kind::Float: return nb::float_(value.as_float());
            case Value::Kind::String: return nb::str(value.as_string().data(), value.as_string().size());
            case Value::Kind::Bytes: return nb::bytes(value.as_bytes().data(), value.as_bytes().size());
            case Value::Kind::Enum: return nb::str(value.as_enum().data(), value.as_enum().size());
            case Value::Kind::List: {
                nb::list items;
                for (const auto &item: value.as_list()) { items.append(value_to_py(token, item)); }
                return std::move(items);
            }
            case Value::Kind::Object: {
                nb::dict fields;
                for (const auto &[key, item]: value.as_object()) {
                    fields[nb::str(key.data(), key.size())] = value_to_py(token, item);
                }
                return std::move(fields);
            }
        }
        return nb::none();
    }

    namespace {
        nb::dict error_to_py(const ExecutionToken &token, const engine::ServerError &error) {
            nb::dict entry;
            entry["message"] = nb::str(error.message.data(), error.message.size());
            if (!error.locations.empty()) {
                nb::list locations;
                for (const auto &location: error.locations) {
                    nb::dict loc;
                    loc["line"] = nb::int_(location.line);
                    loc["column"] = nb::int_(location.column);
                    locations.append(loc);
                }
                entry["locations"] = locations;
            }
            if (!error.path.empty()) {
                nb::list path;
                for (const auto &segment: error.path) {
                    if (auto key = std::get_if<std::string>(&segment)) {
                        path.append(nb::str(key->data(), key->size()));
                    } else {
                        path.append(nb::int_(std::get<size_t>(segment)));
                    }
                }
                entry["path"] = path;
            }
            if (error.extensions && !error.extensions->empty()) {
                entry["extensions"] = value_to_py(token, Value::object(*error.extensions));
            }
            return entry;
        }
    } // namespace

    nb::dict response_to_py(const ExecutionToken &token, const engine::Response &response) {
        nb::dict result;
        result["data"] = value_to_py(token, response.data);
        result["extensions"] = value_to_py(token, Value::object(response.extensions));
        nb::list errors;
        for (const auto &error: response.errors) { errors.append(error_to_py(token, error)); }
        result["errors"] = errors;
        return result;
    }
} // namespace grommet
