#include <grommet/engine/type_ref.h>
#include <grommet/util/errors.h>

#include <cctype>

namespace grommet::engine {
    TypeRef TypeRef::named(std::string name) {
        TypeRef ref;
        ref._kind = Kind::Named;
        ref._name = std::move(name);
        return ref;
    }

    TypeRef TypeRef::list(TypeRef inner) {
        TypeRef ref;
        ref._kind = Kind::List;
        ref._inner = std::make_shared<const TypeRef>(std::move(inner));
        return ref;
    }

    TypeRef TypeRef::non_null(TypeRef inner) {
        if (inner.is_non_null()) { return inner; }
        TypeRef ref;
        ref._kind = Kind::NonNull;
        ref._inner = std::make_shared<const TypeRef>(std::move(inner));
        return ref;
    }

    namespace {
        bool is_name_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }

        bool is_name_continue(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

        void skip_spaces(std::string_view text, size_t &pos) {
            while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) { ++pos; }
        }

        TypeRef parse_type(std::string_view text, size_t &pos) {
            skip_spaces(text, pos);
            if (pos >= text.size()) { throw_error<ValidationError>("Malformed type reference '{}'", text); }
            TypeRef ty;
            if (text[pos] == '[') {
                ++pos;
                auto inner = parse_type(text, pos);
                skip_spaces(text, pos);
                if (pos >= text.size() || text[pos] != ']') {
                    throw_error<ValidationError>("Malformed type reference '{}'", text);
                }
                ++pos;
                ty = TypeRef::list(std::move(inner));
            } else {
                if (!is_name_start(text[pos])) { throw_error<ValidationError>("Malformed type reference '{}'", text); }
                size_t start = pos;
                while (pos < text.size() && is_name_continue(text[pos])) { ++pos; }
                ty = TypeRef::named(std::string(text.substr(start, pos - start)));
            }
            skip_spaces(text, pos);
            if (pos < text.size() && text[pos] == '!') {
                ++pos;
                ty = TypeRef::non_null(std::move(ty));
            }
            return ty;
        }
    } // namespace

    TypeRef TypeRef::parse(std::string_view text) {
        size_t pos = 0;
        auto ty = parse_type(text, pos);
        skip_spaces(text, pos);
        if (pos != text.size()) { throw_error<ValidationError>("Malformed type reference '{}'", text); }
        return ty;
    }

    const std::string &TypeRef::base_name() const {
        const TypeRef *current = this;
        while (!current->is_named()) { current = current->_inner.get(); }
        return current->_name;
    }

    std::string TypeRef::to_string() const {
        switch (_kind) {
            case Kind::Named: return _name;
            case Kind::List: return "[" + _inner->to_string() + "]";
            case Kind::NonNull: return _inner->to_string() + "!";
        }
        return _name;
    }

    bool TypeRef::operator==(const TypeRef &other) const {
        if (_kind != other._kind) { return false; }
        if (_kind == Kind::Named) { return _name == other._name; }
        return *_inner == *other._inner;
    }
} // namespace grommet::engine
