#include <grommet/engine/value.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace grommet::engine {
    double Value::as_float() const {
        if (is_int()) { return static_cast<double>(as_int()); }
        return std::get<double>(_storage);
    }

    const Value *Value::find(std::string_view key) const {
        if (!is_object()) { return nullptr; }
        const auto &fields = as_object();
        auto it = std::find_if(fields.begin(), fields.end(), [key](const auto &entry) { return entry.first == key; });
        return it == fields.end() ? nullptr : &it->second;
    }

    void Value::set(std::string key, Value value) {
        if (!is_object()) { _storage = ValueMap{}; }
        auto &fields = as_object();
        auto it = std::find_if(fields.begin(), fields.end(), [&key](const auto &entry) { return entry.first == key; });
        if (it != fields.end()) {
            it->second = std::move(value);
        } else {
            fields.emplace_back(std::move(key), std::move(value));
        }
    }

    std::string quote_string(std::string_view text) {
        std::string out;
        out.reserve(text.size() + 2);
        out.push_back('"');
        for (unsigned char c: text) {
            switch (c) {
                case '"': out += "\\\"";
                    break;
                case '\\': out += "\\\\";
                    break;
                case '\n': out += "\\n";
                    break;
                case '\r': out += "\\r";
                    break;
                case '\t': out += "\\t";
                    break;
                case '\b': out += "\\b";
                    break;
                case '\f': out += "\\f";
                    break;
                default:
                    if (c < 0x20) {
                        out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                    } else {
                        out.push_back(static_cast<char>(c));
                    }
            }
        }
        out.push_back('"');
        return out;
    }

    std::string Value::to_string() const {
        switch (kind()) {
            case Kind::Null: return "null";
            case Kind::Boolean: return as_bool() ? "true" : "false";
            case Kind::Int: return std::to_string(as_int());
            case Kind::Float: {
                auto text = fmt::format("{}", std::get<double>(_storage));
                // Keep floats recognisable as floats when printed back into a document.
                if (text.find_first_of(".eEn") == std::string::npos) { text += ".0"; }
                return text;
            }
            case Kind::String: return quote_string(as_string());
            case Kind::Bytes: return quote_string(as_bytes());
            case Kind::Enum: return as_enum();
            case Kind::List: {
                std::vector<std::string> items;
                items.reserve(as_list().size());
                for (const auto &item: as_list()) { items.push_back(item.to_string()); }
                return fmt::format("[{}]", fmt::join(items, ", "));
            }
            case Kind::Object: {
                std::vector<std::string> items;
                items.reserve(as_object().size());
                for (const auto &[key, value]: as_object()) {
                    items.push_back(fmt::format("{}: {}", key, value.to_string()));
                }
                return fmt::format("{{{}}}", fmt::join(items, ", "));
            }
        }
        return "null";
    }

    std::string_view Value::kind_name(Kind kind) {
        switch (kind) {
            case Kind::Null: return "null";
            case Kind::Boolean: return "boolean";
            case Kind::Int: return "int";
            case Kind::Float: return "float";
            case Kind::String: return "string";
            case Kind::Bytes: return "bytes";
            case Kind::Enum: return "enum";
            case Kind::List: return "list";
            case Kind::Object: return "object";
        }
        return "unknown";
    }
} // namespace grommet::engine
