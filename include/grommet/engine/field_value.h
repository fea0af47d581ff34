#ifndef GROMMET_ENGINE_FIELD_VALUE_H
#define GROMMET_ENGINE_FIELD_VALUE_H

#include <grommet/engine/value.h>

#include <any>
#include <optional>
#include <string>
#include <vector>

namespace grommet::engine {
    /**
     * What a resolver hands back to the executor: an immediate Value, a list of field values, or an opaque
     * owned object the executor passes down as the parent of the next selection set.
     *
     * An owned value may carry a concrete type name; the executor uses it to pick the object type when the
     * field's declared type is an interface or union.
     */
    class GROMMET_EXPORT FieldValue {
    public:
        enum class Kind { Value, List, Owned };

        FieldValue() = default;

        FieldValue(Value value) : _kind{Kind::Value}, _value{std::move(value)} {}

        static FieldValue null() { return {}; }

        static FieldValue value(Value value) { return FieldValue{std::move(value)}; }

        static FieldValue list(std::vector<FieldValue> items) {
            FieldValue fv;
            fv._kind = Kind::List;
            fv._items = std::move(items);
            return fv;
        }

        static FieldValue owned_any(std::any owned, std::optional<std::string> type_name = std::nullopt) {
            FieldValue fv;
            fv._kind = Kind::Owned;
            fv._owned = std::move(owned);
            fv._type_name = std::move(type_name);
            return fv;
        }

        [[nodiscard]] Kind kind() const { return _kind; }

        [[nodiscard]] bool is_null() const { return _kind == Kind::Value && _value.is_null(); }

        [[nodiscard]] const Value &as_value() const { return _value; }

        [[nodiscard]] const std::vector<FieldValue> &as_list() const { return _items; }

        [[nodiscard]] const std::any &as_owned() const { return _owned; }

        template<typename T>
        [[nodiscard]] const T *try_downcast() const {
            return _kind == Kind::Owned ? std::any_cast<T>(&_owned) : nullptr;
        }

        [[nodiscard]] const std::optional<std::string> &type_name() const { return _type_name; }

        FieldValue &with_type(std::string type_name) {
            _type_name = std::move(type_name);
            return *this;
        }

    private:
        Kind _kind{Kind::Value};
        Value _value;
        std::vector<FieldValue> _items;
        std::any _owned;
        std::optional<std::string> _type_name;
    };
} // namespace grommet::engine

#endif // GROMMET_ENGINE_FIELD_VALUE_H
