//
// The canonical GraphQL value flowing through the engine: arguments, variables, defaults and response data.
//

#ifndef GROMMET_ENGINE_VALUE_H
#define GROMMET_ENGINE_VALUE_H

#include <grommet/grommet_export.h>

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace grommet::engine {
    class Value;

    using ValueList = std::vector<Value>;
    // Insertion ordered; response objects must keep the document's field order.
    using ValueMap = std::vector<std::pair<std::string, Value>>;

    struct EnumName {
        std::string name;

        bool operator==(const EnumName &) const = default;
    };

    struct Binary {
        std::string bytes;

        bool operator==(const Binary &) const = default;
    };

    class GROMMET_EXPORT Value {
    public:
        enum class Kind { Null = 0, Boolean, Int, Float, String, Bytes, Enum, List, Object };

        Value() = default;

        Value(std::nullptr_t) {}

        Value(bool value) : _storage{value} {}

        template<std::integral T>
            requires (!std::same_as<T, bool>)
        Value(T value) : _storage{static_cast<int64_t>(value)} {}

        Value(double value) : _storage{value} {}

        Value(std::string value) : _storage{std::move(value)} {}

        Value(std::string_view value) : _storage{std::string(value)} {}

        Value(const char *value) : _storage{std::string(value)} {}

        Value(ValueList items) : _storage{std::move(items)} {}

        Value(ValueMap fields) : _storage{std::move(fields)} {}

        static Value null() { return {}; }

        static Value enum_value(std::string name) { return Value{EnumName{std::move(name)}}; }

        static Value binary(std::string bytes) { return Value{Binary{std::move(bytes)}}; }

        static Value list(ValueList items = {}) { return Value{std::move(items)}; }

        static Value object(ValueMap fields = {}) { return Value{std::move(fields)}; }

        [[nodiscard]] Kind kind() const { return static_cast<Kind>(_storage.index()); }

        [[nodiscard]] bool is_null() const { return kind() == Kind::Null; }
        [[nodiscard]] bool is_bool() const { return kind() == Kind::Boolean; }
        [[nodiscard]] bool is_int() const { return kind() == Kind::Int; }
        [[nodiscard]] bool is_float() const { return kind() == Kind::Float; }
        [[nodiscard]] bool is_string() const { return kind() == Kind::String; }
        [[nodiscard]] bool is_bytes() const { return kind() == Kind::Bytes; }
        [[nodiscard]] bool is_enum() const { return kind() == Kind::Enum; }
        [[nodiscard]] bool is_list() const { return kind() == Kind::List; }
        [[nodiscard]] bool is_object() const { return kind() == Kind::Object; }

        // Accessors throw std::bad_variant_access on a kind mismatch.
        [[nodiscard]] bool as_bool() const { return std::get<bool>(_storage); }
        [[nodiscard]] int64_t as_int() const { return std::get<int64_t>(_storage); }
        // Ints widen to float, as GraphQL Float input coercion requires.
        [[nodiscard]] double as_float() const;
        [[nodiscard]] const std::string &as_string() const { return std::get<std::string>(_storage); }
        [[nodiscard]] const std::string &as_bytes() const { return std::get<Binary>(_storage).bytes; }
        [[nodiscard]] const std::string &as_enum() const { return std::get<EnumName>(_storage).name; }
        [[nodiscard]] const ValueList &as_list() const { return std::get<ValueList>(_storage); }
        [[nodiscard]] ValueList &as_list() { return std::get<ValueList>(_storage); }
        [[nodiscard]] const ValueMap &as_object() const { return std::get<ValueMap>(_storage); }
        [[nodiscard]] ValueMap &as_object() { return std::get<ValueMap>(_storage); }

        // Object lookup; nullptr when this is not an object or the key is absent.
        [[nodiscard]] const Value *find(std::string_view key) const;

        // Object insert-or-replace keeping the original position of an existing key.
        void set(std::string key, Value value);

        // GraphQL literal syntax, used for SDL defaults and error messages.
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] static std::string_view kind_name(Kind kind);

        bool operator==(const Value &other) const { return _storage == other._storage; }

    private:
        explicit Value(EnumName value) : _storage{std::move(value)} {}

        explicit Value(Binary value) : _storage{std::move(value)} {}

        std::variant<std::monostate, bool, int64_t, double, std::string, Binary, EnumName, ValueList, ValueMap>
        _storage;
    };

    // Quoted and escaped GraphQL string literal.
    std::string quote_string(std::string_view text);
} // namespace grommet::engine

#endif // GROMMET_ENGINE_VALUE_H
