#include <grommet/engine/parser.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <charconv>
#include <cstdlib>

namespace grommet::engine {
    bool Document::has_subscription() const {
        for (const auto &op: operations) {
            if (op.type == OperationType::Subscription) { return true; }
        }
        return false;
    }

    const char *operation_type_name(OperationType type) {
        switch (type) {
            case OperationType::Query: return "query";
            case OperationType::Mutation: return "mutation";
            case OperationType::Subscription: return "subscription";
        }
        return "query";
    }

    Parser::Parser(std::string_view source) : _source(source) { advance(); }

    Parser::DepthGuard::DepthGuard(Parser &parser) : _parser{parser} {
        if (++_parser._depth > max_depth) {
            --_parser._depth;
            throw ParseError(fmt::format("Syntax Error: Nesting deeper than {} levels", max_depth),
                             {_parser._token.location});
        }
    }

    Document parse_query(std::string_view source) {
        Parser parser(source);
        return parser.parse_document();
    }

    // ========================================================================
    // Lexer
    // ========================================================================

    char Parser::peek_char(size_t offset) const {
        return _pos + offset < _source.size() ? _source[_pos + offset] : '\0';
    }

    void Parser::skip_ignored() {
        while (_pos < _source.size()) {
            char c = _source[_pos];
            if (c == ' ' || c == '\t' || c == ',') {
                ++_pos;
            } else if (c == '\n') {
                ++_pos;
                ++_line;
                _line_start = _pos;
            } else if (c == '\r') {
                ++_pos;
                if (peek_char() == '\n') { ++_pos; }
                ++_line;
                _line_start = _pos;
            } else if (c == '#') {
                while (_pos < _source.size() && _source[_pos] != '\n' && _source[_pos] != '\r') { ++_pos; }
            } else if (static_cast<unsigned char>(c) == 0xEF && peek_char(1) == '\xBB' && peek_char(2) == '\xBF') {
                _pos += 3;
            } else {
                break;
            }
        }
    }

    void Parser::advance() {
        skip_ignored();
        Location location{_line, _pos - _line_start + 1};
        if (_pos >= _source.size()) {
            _token = Token{TokenKind::End, {}, location};
            return;
        }

        char c = _source[_pos];
        switch (c) {
            case '!': case '$': case '&': case '(': case ')': case ':': case '=': case '@': case '[': case ']':
            case '{': case '|': case '}':
                ++_pos;
                _token = Token{TokenKind::Punct, std::string(1, c), location};
                return;
            case '.':
                if (peek_char(1) == '.' && peek_char(2) == '.') {
                    _pos += 3;
                    _token = Token{TokenKind::Punct, "...", location};
                    return;
                }
                throw ParseError("Syntax Error: Unexpected \".\"", {location});
            case '"': {
                auto token = (peek_char(1) == '"' && peek_char(2) == '"') ? read_block_string() : read_string();
                token.location = location;
                _token = std::move(token);
                return;
            }
            default: break;
        }

        if (c == '-' || (c >= '0' && c <= '9')) {
            auto token = read_number();
            token.location = location;
            _token = std::move(token);
            return;
        }

        if (c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
            size_t start = _pos;
            while (_pos < _source.size()) {
                char n = _source[_pos];
                if (n == '_' || (n >= 'a' && n <= 'z') || (n >= 'A' && n <= 'Z') || (n >= '0' && n <= '9')) {
                    ++_pos;
                } else {
                    break;
                }
            }
            _token = Token{TokenKind::Name, std::string(_source.substr(start, _pos - start)), location};
            return;
        }

        throw ParseError(fmt::format("Syntax Error: Unexpected character \"{}\"", c), {location});
    }

    Parser::Token Parser::read_number() {
        size_t start = _pos;
        bool is_float = false;
        auto digits = [this] {
            size_t begin = _pos;
            while (peek_char() >= '0' && peek_char() <= '9') { ++_pos; }
            return _pos - begin;
        };
        auto fail = [this] {
            throw ParseError("Syntax Error: Invalid number", {Location{_line, _pos - _line_start + 1}});
        };

        if (peek_char() == '-') { ++_pos; }
        if (peek_char() == '0') {
            ++_pos;
            if (peek_char() >= '0' && peek_char() <= '9') { fail(); }
        } else if (digits() == 0) {
            fail();
        }
        if (peek_char() == '.') {
            is_float = true;
            ++_pos;
            if (digits() == 0) { fail(); }
        }
        if (peek_char() == 'e' || peek_char() == 'E') {
            is_float = true;
            ++_pos;
            if (peek_char() == '+' || peek_char() == '-') { ++_pos; }
            if (digits() == 0) { fail(); }
        }
        char next = peek_char();
        if (next == '.' || next == '_' || (next >= 'a' && next <= 'z') || (next >= 'A' && next <= 'Z')) { fail(); }

        return Token{is_float ? TokenKind::Float : TokenKind::Int, std::string(_source.substr(start, _pos - start)), {}};
    }

    void Parser::append_utf8(std::string &out, uint32_t cp) const {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    Parser::Token Parser::read_string() {
        auto here = [this] { return Location{_line, _pos - _line_start + 1}; };
        auto read_hex4 = [this, &here]() -> uint32_t {
            uint32_t value = 0;
            for (int i = 0; i < 4; ++i) {
                char h = peek_char();
                value <<= 4;
                if (h >= '0' && h <= '9') {
                    value |= static_cast<uint32_t>(h - '0');
                } else if (h >= 'a' && h <= 'f') {
                    value |= static_cast<uint32_t>(h - 'a' + 10);
                } else if (h >= 'A' && h <= 'F') {
                    value |= static_cast<uint32_t>(h - 'A' + 10);
                } else {
                    throw ParseError("Syntax Error: Invalid Unicode escape sequence", {here()});
                }
                ++_pos;
            }
            return value;
        };

        ++_pos; // opening quote
        std::string result;
        while (true) {
            if (_pos >= _source.size() || peek_char() == '\n' || peek_char() == '\r') {
                throw ParseError("Syntax Error: Unterminated string", {here()});
            }
            char c = _source[_pos++];
            if (c == '"') { break; }
            if (c != '\\') {
                result.push_back(c);
                continue;
            }
            char esc = _source[_pos < _source.size() ? _pos++ : _pos];
            switch (esc) {
                case '"': result.push_back('"');
                    break;
                case '\\': result.push_back('\\');
                    break;
                case '/': result.push_back('/');
                    break;
                case 'b': result.push_back('\b');
                    break;
                case 'f': result.push_back('\f');
                    break;
                case 'n': result.push_back('\n');
                    break;
                case 'r': result.push_back('\r');
                    break;
                case 't': result.push_back('\t');
                    break;
                case 'u': {
                    uint32_t cp = read_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF && peek_char() == '\\' && peek_char(1) == 'u') {
                        _pos += 2;
                        uint32_t low = read_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            throw ParseError("Syntax Error: Invalid Unicode escape sequence", {here()});
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(result, cp);
                    break;
                }
                default:
                    throw ParseError(fmt::format("Syntax Error: Invalid character escape sequence \"\\{}\"", esc),
                                     {here()});
            }
        }
        return Token{TokenKind::String, std::move(result), {}};
    }

    Parser::Token Parser::read_block_string() {
        _pos += 3;
        std::string raw;
        while (true) {
            if (_pos >= _source.size()) {
                throw ParseError("Syntax Error: Unterminated string", {Location{_line, _pos - _line_start + 1}});
            }
            if (peek_char() == '"' && peek_char(1) == '"' && peek_char(2) == '"') {
                _pos += 3;
                break;
            }
            if (peek_char() == '\\' && peek_char(1) == '"' && peek_char(2) == '"' && peek_char(3) == '"') {
                raw += "\"\"\"";
                _pos += 4;
                continue;
            }
            char c = _source[_pos++];
            if (c == '\n') {
                ++_line;
                _line_start = _pos;
            }
            raw.push_back(c);
        }

        // Block string value: split lines, strip the common indentation and blank leading/trailing lines.
        std::vector<std::string> lines;
        size_t start = 0;
        for (size_t i = 0; i <= raw.size(); ++i) {
            if (i == raw.size() || raw[i] == '\n') {
                std::string line = raw.substr(start, i - start);
                if (!line.empty() && line.back() == '\r') { line.pop_back(); }
                lines.push_back(std::move(line));
                start = i + 1;
            }
        }
        size_t common = std::string::npos;
        for (size_t i = 1; i < lines.size(); ++i) {
            const auto &line = lines[i];
            size_t indent = line.find_first_not_of(" \t");
            if (indent != std::string::npos && indent < common) { common = indent; }
        }
        if (common != std::string::npos) {
            for (size_t i = 1; i < lines.size(); ++i) {
                lines[i] = lines[i].size() >= common ? lines[i].substr(common) : std::string{};
            }
        }
        auto is_blank = [](const std::string &line) { return line.find_first_not_of(" \t") == std::string::npos; };
        while (!lines.empty() && is_blank(lines.front())) { lines.erase(lines.begin()); }
        while (!lines.empty() && is_blank(lines.back())) { lines.pop_back(); }

        return Token{TokenKind::BlockString, fmt::format("{}", fmt::join(lines, "\n")), {}};
    }

    // ========================================================================
    // Grammar
    // ========================================================================

    bool Parser::peek_punct(std::string_view punct) const {
        return _token.kind == TokenKind::Punct && _token.text == punct;
    }

    bool Parser::peek_name(std::string_view name) const {
        return _token.kind == TokenKind::Name && _token.text == name;
    }

    void Parser::unexpected() const {
        std::string found;
        switch (_token.kind) {
            case TokenKind::End: found = "<EOF>";
                break;
            case TokenKind::Punct: found = fmt::format("\"{}\"", _token.text);
                break;
            case TokenKind::Name: found = fmt::format("Name \"{}\"", _token.text);
                break;
            case TokenKind::Int: found = fmt::format("Int \"{}\"", _token.text);
                break;
            case TokenKind::Float: found = fmt::format("Float \"{}\"", _token.text);
                break;
            case TokenKind::String:
            case TokenKind::BlockString: found = fmt::format("String {}", quote_string(_token.text));
                break;
        }
        throw ParseError(fmt::format("Syntax Error: Unexpected {}", found), {_token.location});
    }

    void Parser::expect_punct(std::string_view punct) {
        if (!peek_punct(punct)) { unexpected(); }
        advance();
    }

    std::string Parser::expect_name() {
        if (_token.kind != TokenKind::Name) { unexpected(); }
        std::string name = std::move(_token.text);
        advance();
        return name;
    }

    Document Parser::parse_document() {
        Document document;
        if (_token.kind == TokenKind::End) { unexpected(); }
        while (_token.kind != TokenKind::End) {
            if (peek_punct("{") || peek_name("query") || peek_name("mutation") || peek_name("subscription")) {
                document.operations.push_back(parse_operation());
            } else if (peek_name("fragment")) {
                auto fragment = parse_fragment();
                if (document.fragments.contains(fragment.name)) {
                    throw QueryError(fmt::format("There can be only one fragment named \"{}\".", fragment.name),
                                     {fragment.location});
                }
                auto name = fragment.name;
                document.fragments.emplace(std::move(name), std::move(fragment));
            } else {
                unexpected();
            }
        }
        return document;
    }

    OperationDefinition Parser::parse_operation() {
        OperationDefinition op;
        op.location = _token.location;
        if (peek_punct("{")) {
            op.type = OperationType::Query;
            op.selection_set = parse_selection_set();
            return op;
        }

        auto keyword = expect_name();
        op.type = keyword == "mutation"
                      ? OperationType::Mutation
                      : keyword == "subscription"
                            ? OperationType::Subscription
                            : OperationType::Query;
        if (_token.kind == TokenKind::Name) { op.name = expect_name(); }
        if (peek_punct("(")) { op.variables = parse_variable_definitions(); }
        op.directives = parse_directives(false);
        op.selection_set = parse_selection_set();
        return op;
    }

    FragmentDefinition Parser::parse_fragment() {
        FragmentDefinition fragment;
        fragment.location = _token.location;
        advance(); // "fragment"
        if (peek_name("on")) { unexpected(); }
        fragment.name = expect_name();
        if (!peek_name("on")) { unexpected(); }
        advance();
        fragment.type_condition = expect_name();
        fragment.directives = parse_directives(false);
        fragment.selection_set = parse_selection_set();
        return fragment;
    }

    std::vector<VariableDefinition> Parser::parse_variable_definitions() {
        std::vector<VariableDefinition> variables;
        expect_punct("(");
        do {
            VariableDefinition variable;
            variable.location = _token.location;
            expect_punct("$");
            variable.name = expect_name();
            expect_punct(":");
            variable.type = parse_type();
            if (peek_punct("=")) {
                advance();
                variable.default_value = parse_value(true);
            }
            parse_directives(true);
            variables.push_back(std::move(variable));
        } while (!peek_punct(")"));
        advance();
        return variables;
    }

    SelectionSet Parser::parse_selection_set() {
        DepthGuard depth(*this);
        SelectionSet selections;
        expect_punct("{");
        do {
            selections.push_back(parse_selection());
        } while (!peek_punct("}"));
        advance();
        return selections;
    }

    Selection Parser::parse_selection() {
        Selection selection;
        selection.location = _token.location;

        if (peek_punct("...")) {
            advance();
            if (_token.kind == TokenKind::Name && _token.text != "on") {
                selection.kind = Selection::Kind::FragmentSpread;
                selection.name = expect_name();
                selection.directives = parse_directives(false);
                return selection;
            }
            selection.kind = Selection::Kind::InlineFragment;
            if (peek_name("on")) {
                advance();
                selection.type_condition = expect_name();
            }
            selection.directives = parse_directives(false);
            selection.selection_set = parse_selection_set();
            return selection;
        }

        selection.kind = Selection::Kind::Field;
        auto name_or_alias = expect_name();
        if (peek_punct(":")) {
            advance();
            selection.alias = std::move(name_or_alias);
            selection.name = expect_name();
        } else {
            selection.name = std::move(name_or_alias);
        }
        if (peek_punct("(")) { selection.arguments = parse_arguments(false); }
        selection.directives = parse_directives(false);
        if (peek_punct("{")) { selection.selection_set = parse_selection_set(); }
        return selection;
    }

    std::vector<Argument> Parser::parse_arguments(bool is_const) {
        std::vector<Argument> arguments;
        expect_punct("(");
        do {
            Argument argument;
            argument.location = _token.location;
            argument.name = expect_name();
            expect_punct(":");
            argument.value = parse_value(is_const);
            arguments.push_back(std::move(argument));
        } while (!peek_punct(")"));
        advance();
        return arguments;
    }

    std::vector<Directive> Parser::parse_directives(bool is_const) {
        std::vector<Directive> directives;
        while (peek_punct("@")) {
            Directive directive;
            directive.location = _token.location;
            advance();
            directive.name = expect_name();
            if (peek_punct("(")) { directive.arguments = parse_arguments(is_const); }
            directives.push_back(std::move(directive));
        }
        return directives;
    }

    AstValue Parser::parse_value(bool is_const) {
        AstValue value;
        value.location = _token.location;
        switch (_token.kind) {
            case TokenKind::Punct:
                if (peek_punct("$") && !is_const) {
                    advance();
                    value.kind = AstValue::Kind::Variable;
                    value.text = expect_name();
                    return value;
                }
                if (peek_punct("[")) {
                    DepthGuard depth(*this);
                    advance();
                    value.kind = AstValue::Kind::List;
                    while (!peek_punct("]")) {
                        if (_token.kind == TokenKind::End) { unexpected(); }
                        value.items.push_back(parse_value(is_const));
                    }
                    advance();
                    return value;
                }
                if (peek_punct("{")) {
                    DepthGuard depth(*this);
                    advance();
                    value.kind = AstValue::Kind::Object;
                    while (!peek_punct("}")) {
                        auto field_name = expect_name();
                        expect_punct(":");
                        value.fields.emplace_back(std::move(field_name), parse_value(is_const));
                    }
                    advance();
                    return value;
                }
                unexpected();
            case TokenKind::Int: {
                value.kind = AstValue::Kind::Int;
                const auto &text = _token.text;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value.int_value);
                if (ec != std::errc{} || ptr != text.data() + text.size()) {
                    throw ParseError(
                        fmt::format("Int cannot represent non 64-bit signed integer value: {}", text),
                        {_token.location});
                }
                advance();
                return value;
            }
            case TokenKind::Float:
                value.kind = AstValue::Kind::Float;
                value.float_value = std::strtod(_token.text.c_str(), nullptr);
                advance();
                return value;
            case TokenKind::String:
            case TokenKind::BlockString:
                value.kind = AstValue::Kind::String;
                value.text = std::move(_token.text);
                advance();
                return value;
            case TokenKind::Name:
                if (_token.text == "true" || _token.text == "false") {
                    value.kind = AstValue::Kind::Boolean;
                    value.bool_value = _token.text == "true";
                } else if (_token.text == "null") {
                    value.kind = AstValue::Kind::Null;
                } else {
                    value.kind = AstValue::Kind::Enum;
                    value.text = _token.text;
                }
                advance();
                return value;
            case TokenKind::End: break;
        }
        unexpected();
    }

    TypeRef Parser::parse_type() {
        TypeRef type;
        if (peek_punct("[")) {
            DepthGuard depth(*this);
            advance();
            auto inner = parse_type();
            expect_punct("]");
            type = TypeRef::list(std::move(inner));
        } else {
            type = TypeRef::named(expect_name());
        }
        if (peek_punct("!")) {
            advance();
            type = TypeRef::non_null(std::move(type));
        }
        return type;
    }

    AstValue Parser::parse_value_literal() {
        auto value = parse_value(true);
        if (_token.kind != TokenKind::End) { unexpected(); }
        return value;
    }

    TypeRef Parser::parse_type_reference() {
        auto type = parse_type();
        if (_token.kind != TokenKind::End) { unexpected(); }
        return type;
    }
} // namespace grommet::engine
