#ifndef GROMMET_ENGINE_RESPONSE_H
#define GROMMET_ENGINE_RESPONSE_H

#include <grommet/engine/ast.h>
#include <grommet/engine/value.h>
#include <grommet/util/errors.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace grommet::engine {
    // A response path step: field response key, or list index.
    using PathSegment = std::variant<std::string, size_t>;

    struct ServerError {
        std::string message;
        std::vector<Location> locations;
        std::vector<PathSegment> path;
        std::optional<ValueMap> extensions;

        [[nodiscard]] std::string to_string() const;
    };

    struct GROMMET_EXPORT Response {
        Value data;
        std::vector<ServerError> errors;
        ValueMap extensions;

        [[nodiscard]] bool is_ok() const { return errors.empty(); }

        static Response from_errors(std::vector<ServerError> errors);
    };

    /**
     * Request level failure raised while parsing, validating or coercing variables. Carries the document
     * locations the failure refers to; surfaces as a response with null data.
     */
    struct QueryError : GrommetError {
        QueryError(std::string message, std::vector<Location> locations_ = {})
            : GrommetError(std::move(message)), locations(std::move(locations_)) {}

        std::vector<Location> locations;

        [[nodiscard]] ServerError to_server_error() const { return ServerError{what(), locations, {}, std::nullopt}; }
    };

    struct ParseError : QueryError {
        using QueryError::QueryError;
    };
} // namespace grommet::engine

#endif // GROMMET_ENGINE_RESPONSE_H
