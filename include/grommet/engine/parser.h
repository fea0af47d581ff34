#ifndef GROMMET_ENGINE_PARSER_H
#define GROMMET_ENGINE_PARSER_H

#include <grommet/engine/ast.h>
#include <grommet/engine/response.h>

#include <string>
#include <string_view>

namespace grommet::engine {
    /**
     * Recursive descent parser for executable GraphQL documents.
     *
     * Commas are insignificant, comments run to end of line. Every node records the line and column (both
     * 1-based) of its first token so errors can point back into the query text.
     *
     * Selection sets, list and object values and list types may nest at most max_depth levels.
     *
     * @throws ParseError on the first syntax error or when nesting exceeds max_depth
     */
    class GROMMET_EXPORT Parser {
    public:
        static constexpr size_t max_depth = 64;

        explicit Parser(std::string_view source);

        Document parse_document();

        // Parses a single constant value; used for defaults supplied as GraphQL literals.
        AstValue parse_value_literal();

        TypeRef parse_type_reference();

    private:
        enum class TokenKind { End, Punct, Name, Int, Float, String, BlockString };

        struct Token {
            TokenKind kind{TokenKind::End};
            std::string text;
            Location location;
        };

        OperationDefinition parse_operation();

        FragmentDefinition parse_fragment();

        std::vector<VariableDefinition> parse_variable_definitions();

        SelectionSet parse_selection_set();

        Selection parse_selection();

        std::vector<Argument> parse_arguments(bool is_const);

        std::vector<Directive> parse_directives(bool is_const);

        AstValue parse_value(bool is_const);

        TypeRef parse_type();

        std::string expect_name();

        void expect_punct(std::string_view punct);

        bool peek_punct(std::string_view punct) const;

        bool peek_name(std::string_view name) const;

        [[noreturn]] void unexpected() const;

        // Counts one nesting level for the lifetime of the guard.
        class DepthGuard {
        public:
            explicit DepthGuard(Parser &parser);

            DepthGuard(const DepthGuard &) = delete;

            DepthGuard &operator=(const DepthGuard &) = delete;

            ~DepthGuard() { --_parser._depth; }

        private:
            Parser &_parser;
        };

        // Lexer
        void advance();

        void skip_ignored();

        char peek_char(size_t offset = 0) const;

        Token read_number();

        Token read_string();

        Token read_block_string();

        void append_utf8(std::string &out, uint32_t code_point) const;

        std::string_view _source;
        size_t _pos{0};
        size_t _line{1};
        size_t _line_start{0};
        size_t _depth{0};
        Token _token;
    };

    Document parse_query(std::string_view source);
} // namespace grommet::engine

#endif // GROMMET_ENGINE_PARSER_H
