#include <grommet/engine/schema.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

namespace grommet::engine {
    namespace {
        void write_description(std::string &out, const std::optional<std::string> &description,
                               std::string_view indent) {
            if (!description || description->empty()) { return; }
            if (description->find('\n') == std::string::npos && description->find('"') == std::string::npos) {
                fmt::format_to(std::back_inserter(out), "{}\"\"\"{}\"\"\"\n", indent, *description);
                return;
            }
            fmt::format_to(std::back_inserter(out), "{}\"\"\"\n", indent);
            size_t start = 0;
            while (start <= description->size()) {
                auto end = description->find('\n', start);
                if (end == std::string::npos) { end = description->size(); }
                auto line = std::string_view(*description).substr(start, end - start);
                std::string escaped;
                for (size_t i = 0; i < line.size(); ++i) {
                    if (line.substr(i, 3) == "\"\"\"") {
                        escaped += "\\\"\"\"";
                        i += 2;
                    } else {
                        escaped.push_back(line[i]);
                    }
                }
                fmt::format_to(std::back_inserter(out), "{}{}\n", line.empty() ? "" : indent, escaped);
                start = end + 1;
            }
            fmt::format_to(std::back_inserter(out), "{}\"\"\"\n", indent);
        }

        std::string deprecated(const std::optional<std::string> &reason) {
            if (!reason) { return {}; }
            if (reason->empty() || *reason == "No longer supported") { return " @deprecated"; }
            return fmt::format(" @deprecated(reason: {})", quote_string(*reason));
        }

        std::string input_value(const InputValue &value) {
            auto text = fmt::format("{}: {}", value.name, value.type.to_string());
            if (value.default_value) { text += fmt::format(" = {}", value.default_value->to_string()); }
            return text;
        }

        std::string arguments(const std::vector<InputValue> &args) {
            if (args.empty()) { return {}; }
            bool described = std::ranges::any_of(args, [](const InputValue &a) { return a.description.has_value(); });
            if (!described) {
                std::vector<std::string> parts;
                parts.reserve(args.size());
                for (const auto &arg: args) { parts.push_back(input_value(arg)); }
                return fmt::format("({})", fmt::join(parts, ", "));
            }
            std::string out = "(\n";
            for (const auto &arg: args) {
                write_description(out, arg.description, "    ");
                fmt::format_to(std::back_inserter(out), "    {}\n", input_value(arg));
            }
            out += "  )";
            return out;
        }

        template<typename Fields>
        void write_fields(std::string &out, const Fields &fields) {
            out += " {\n";
            for (const auto &field: fields) {
                write_description(out, field.description, "  ");
                fmt::format_to(std::back_inserter(out), "  {}{}: {}{}\n", field.name, arguments(field.arguments),
                               field.type.to_string(), deprecated(field.deprecation));
            }
            out += "}\n";
        }

        std::string implements(const std::vector<std::string> &interfaces) {
            if (interfaces.empty()) { return {}; }
            return fmt::format(" implements {}", fmt::join(interfaces, " & "));
        }

        struct TypePrinter {
            std::string &out;

            void operator()(const Scalar &type) const {
                write_description(out, type.description, "");
                fmt::format_to(std::back_inserter(out), "scalar {}", type.name);
                if (type.specified_by_url) {
                    fmt::format_to(std::back_inserter(out), " @specifiedBy(url: {})",
                                   quote_string(*type.specified_by_url));
                }
                out += "\n";
            }

            void operator()(const Object &type) const {
                write_description(out, type.description, "");
                fmt::format_to(std::back_inserter(out), "type {}{}", type.name, implements(type.implements));
                write_fields(out, type.fields);
            }

            void operator()(const Interface &type) const {
                write_description(out, type.description, "");
                fmt::format_to(std::back_inserter(out), "interface {}{}", type.name, implements(type.implements));
                write_fields(out, type.fields);
            }

            void operator()(const Subscription &type) const {
                write_description(out, type.description, "");
                fmt::format_to(std::back_inserter(out), "type {}", type.name);
                write_fields(out, type.fields);
            }

            void operator()(const Union &type) const {
                write_description(out, type.description, "");
                fmt::format_to(std::back_inserter(out), "union {} = {}\n", type.name,
                               fmt::join(type.possible_types, " | "));
            }

            void operator()(const Enum &type) const {
                write_description(out, type.description, "");
                fmt::format_to(std::back_inserter(out), "enum {} {{\n", type.name);
                for (const auto &value: type.values) {
                    write_description(out, value.description, "  ");
                    fmt::format_to(std::back_inserter(out), "  {}{}\n", value.name, deprecated(value.deprecation));
                }
                out += "}\n";
            }

            void operator()(const InputObject &type) const {
                write_description(out, type.description, "");
                fmt::format_to(std::back_inserter(out), "input {} {{\n", type.name);
                for (const auto &field: type.fields) {
                    write_description(out, field.description, "  ");
                    fmt::format_to(std::back_inserter(out), "  {}\n", input_value(field));
                }
                out += "}\n";
            }
        };
    } // namespace

    std::string Schema::sdl() const {
        const auto &registry = *_registry;
        std::vector<std::string> blocks;

        bool default_roots = registry.query_type == "Query" &&
                             (!registry.mutation_type || *registry.mutation_type == "Mutation") &&
                             (!registry.subscription_type || *registry.subscription_type == "Subscription");
        if (!default_roots) {
            std::string block = "schema {\n";
            fmt::format_to(std::back_inserter(block), "  query: {}\n", registry.query_type);
            if (registry.mutation_type) {
                fmt::format_to(std::back_inserter(block), "  mutation: {}\n", *registry.mutation_type);
            }
            if (registry.subscription_type) {
                fmt::format_to(std::back_inserter(block), "  subscription: {}\n", *registry.subscription_type);
            }
            block += "}\n";
            blocks.push_back(std::move(block));
        }

        for (const auto &name: registry.type_order) {
            std::string block;
            std::visit(TypePrinter{block}, registry.types.at(name));
            blocks.push_back(std::move(block));
        }
        return fmt::format("{}", fmt::join(blocks, "\n"));
    }
} // namespace grommet::engine
