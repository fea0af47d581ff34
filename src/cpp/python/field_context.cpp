#include <grommet/python/field_context.h>
#include <grommet/util/errors.h>

namespace grommet {
    ResolverShape parse_resolver_shape(std::string_view name) {
        if (name == "self_only") { return ResolverShape::SelfOnly; }
        if (name == "self_and_context") { return ResolverShape::SelfAndContext; }
        if (name == "self_and_args") { return ResolverShape::SelfAndArgs; }
        if (name == "self_context_and_args") { return ResolverShape::SelfContextAndArgs; }
        throw_error<ValidationError>("Unknown resolver shape: {}", name);
    }

    const RequestHandles &request_handles(const engine::ResolverContext &ctx) {
        auto handles = ctx.data<RequestHandles>();
        if (handles == nullptr) { throw_error("Request carries no python handles"); }
        return *handles;
    }
} // namespace grommet
