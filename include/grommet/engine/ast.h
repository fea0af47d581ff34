//
// Executable document syntax tree produced by the parser.
//

#ifndef GROMMET_ENGINE_AST_H
#define GROMMET_ENGINE_AST_H

#include <grommet/engine/type_ref.h>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace grommet::engine {
    struct Location {
        size_t line{0};
        size_t column{0};

        bool operator==(const Location &) const = default;
    };

    // A value literal as written in the document; unlike Value it may reference variables.
    struct AstValue {
        enum class Kind { Variable, Null, Int, Float, String, Boolean, Enum, List, Object };

        Kind kind{Kind::Null};
        std::string text; // variable name, string contents or enum name
        int64_t int_value{0};
        double float_value{0.0};
        bool bool_value{false};
        std::vector<AstValue> items;
        std::vector<std::pair<std::string, AstValue>> fields;
        Location location;
    };

    struct Argument {
        std::string name;
        AstValue value;
        Location location;
    };

    struct Directive {
        std::string name;
        std::vector<Argument> arguments;
        Location location;
    };

    struct Selection;
    using SelectionSet = std::vector<Selection>;

    struct Selection {
        enum class Kind { Field, FragmentSpread, InlineFragment };

        Kind kind{Kind::Field};
        std::string alias;
        // Field name, or the fragment name for a spread.
        std::string name;
        std::vector<Argument> arguments;
        std::vector<Directive> directives;
        std::optional<std::string> type_condition;
        SelectionSet selection_set;
        Location location;

        [[nodiscard]] const std::string &response_key() const { return alias.empty() ? name : alias; }
    };

    struct VariableDefinition {
        std::string name;
        TypeRef type;
        std::optional<AstValue> default_value;
        Location location;
    };

    enum class OperationType { Query, Mutation, Subscription };

    struct OperationDefinition {
        OperationType type{OperationType::Query};
        std::optional<std::string> name;
        std::vector<VariableDefinition> variables;
        std::vector<Directive> directives;
        SelectionSet selection_set;
        Location location;
    };

    struct FragmentDefinition {
        std::string name;
        std::string type_condition;
        std::vector<Directive> directives;
        SelectionSet selection_set;
        Location location;
    };

    struct Document {
        std::vector<OperationDefinition> operations;
        ankerl::unordered_dense::map<std::string, FragmentDefinition> fragments;

        [[nodiscard]] bool has_subscription() const;
    };

    const char *operation_type_name(OperationType type);
} // namespace grommet::engine

#endif // GROMMET_ENGINE_AST_H
