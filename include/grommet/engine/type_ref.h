#ifndef GROMMET_ENGINE_TYPE_REF_H
#define GROMMET_ENGINE_TYPE_REF_H

#include <grommet/grommet_export.h>

#include <memory>
#include <string>
#include <string_view>

namespace grommet::engine {
    /**
     * Reference to a schema type: Named(name) | List(inner) | NonNull(inner).
     * Immutable; inner references are shared so copies are cheap.
     */
    class GROMMET_EXPORT TypeRef {
    public:
        enum class Kind { Named, List, NonNull };

        TypeRef() = default;

        static TypeRef named(std::string name);

        static TypeRef named_nn(std::string name) { return non_null(named(std::move(name))); }

        static TypeRef list(TypeRef inner);

        static TypeRef non_null(TypeRef inner);

        /**
         * Parse the compact SDL form: "Int", "Int!", "[Int]", "[Int!]!".
         * @throws ValidationError on malformed input
         */
        static TypeRef parse(std::string_view text);

        [[nodiscard]] Kind kind() const { return _kind; }

        [[nodiscard]] bool is_named() const { return _kind == Kind::Named; }
        [[nodiscard]] bool is_list() const { return _kind == Kind::List; }
        [[nodiscard]] bool is_non_null() const { return _kind == Kind::NonNull; }
        [[nodiscard]] bool is_nullable() const { return _kind != Kind::NonNull; }

        // Only meaningful for Named.
        [[nodiscard]] const std::string &name() const { return _name; }

        // Only meaningful for List and NonNull.
        [[nodiscard]] const TypeRef &of_type() const { return *_inner; }

        // The innermost named type, e.g. "Int" for "[Int!]!".
        [[nodiscard]] const std::string &base_name() const;

        [[nodiscard]] std::string to_string() const;

        bool operator==(const TypeRef &other) const;

    private:
        Kind _kind{Kind::Named};
        std::string _name;
        std::shared_ptr<const TypeRef> _inner;
    };
} // namespace grommet::engine

#endif // GROMMET_ENGINE_TYPE_REF_H
