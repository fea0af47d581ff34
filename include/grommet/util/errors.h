#ifndef GROMMET_UTIL_ERRORS
#define GROMMET_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <stdexcept>
#include <string>
#include <string_view>

namespace grommet {

    /**
     * Root of every error grommet raises itself. The message is what ends up in a GraphQL error entry or in the
     * python exception, so it never carries location or stack information.
     */
    struct GrommetError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Malformed declarative schema: missing record field, bad type reference, unknown kind or resolver.
    struct ValidationError : GrommetError {
        using GrommetError::GrommetError;
    };

    // The composed schema was rejected by the engine.
    struct SchemaBuildError : GrommetError {
        using GrommetError::GrommetError;
    };

    struct UnsupportedValueType : GrommetError {
        UnsupportedValueType() : GrommetError("Unsupported value type") {}
        using GrommetError::GrommetError;
    };

    struct ExpectedList : GrommetError {
        ExpectedList() : GrommetError("Expected list for GraphQL list type") {}
    };

    struct AbstractTypeRequiresObject : GrommetError {
        AbstractTypeRequiresObject() : GrommetError("Abstract type requires an object with type metadata") {}
    };

    struct SubscriptionRequiresAsyncIterator : GrommetError {
        SubscriptionRequiresAsyncIterator() : GrommetError("Subscription resolver must return an async iterator") {}
    };

    struct RuntimeThreadsConflict : GrommetError {
        RuntimeThreadsConflict() : GrommetError("use_current_thread cannot be combined with worker_threads") {}
    };

    struct NoParentValue : GrommetError {
        NoParentValue() : GrommetError("No parent value for field") {}
    };

    // A host exception captured as text while the interpreter lock was held, e.g. "ValueError: boom".
    struct HostException : GrommetError {
        using GrommetError::GrommetError;
    };

    // Raised inside a worker once the owning request or subscription has been cancelled.
    struct Cancelled : GrommetError {
        Cancelled() : GrommetError("Request cancelled") {}
    };

    template<typename Error = GrommetError>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] void throw_error(std::string_view msg) {
        throw Error{std::string(msg)};
    }

    template<typename Error = GrommetError, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] void throw_error(fmt::format_string<Ts...> fmt_str, Ts &&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace grommet

#endif // GROMMET_UTIL_ERRORS
