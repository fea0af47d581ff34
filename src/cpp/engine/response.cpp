#include <grommet/engine/response.h>

#include <fmt/format.h>

namespace grommet::engine {
    std::string ServerError::to_string() const {
        std::string out = message;
        if (!locations.empty()) {
            out += fmt::format(" (line {}, column {})", locations.front().line, locations.front().column);
        }
        if (!path.empty()) {
            out += " at ";
            bool first = true;
            for (const auto &segment: path) {
                if (std::holds_alternative<size_t>(segment)) {
                    out += fmt::format("[{}]", std::get<size_t>(segment));
                } else {
                    if (!first) { out += '.'; }
                    out += std::get<std::string>(segment);
                }
                first = false;
            }
        }
        return out;
    }

    Response Response::from_errors(std::vector<ServerError> errors) {
        Response response;
        response.errors = std::move(errors);
        return response;
    }
} // namespace grommet::engine
