//
// Per field descriptors installed into the resolver closures at schema build time.
//

#ifndef GROMMET_PYTHON_FIELD_CONTEXT_H
#define GROMMET_PYTHON_FIELD_CONTEXT_H

#include <grommet/engine/resolver_context.h>
#include <grommet/engine/type_ref.h>
#include <grommet/python/host_value.h>
#include <grommet/python/value_codec.h>

#include <ankerl/unordered_dense.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace grommet {
    enum class ResolverShape { SelfOnly, SelfAndContext, SelfAndArgs, SelfContextAndArgs };

    // @throws ValidationError for an unknown shape name
    ResolverShape parse_resolver_shape(std::string_view name);

    [[nodiscard]] constexpr bool shape_takes_context(ResolverShape shape) {
        return shape == ResolverShape::SelfAndContext || shape == ResolverShape::SelfContextAndArgs;
    }

    [[nodiscard]] constexpr bool shape_takes_args(ResolverShape shape) {
        return shape == ResolverShape::SelfAndArgs || shape == ResolverShape::SelfContextAndArgs;
    }

    struct GROMMET_EXPORT ResolverEntry {
        host_value_ptr func;
        ResolverShape shape{ResolverShape::SelfOnly};
        std::vector<std::string> arg_names;
        bool is_async{false};
        // The callable produces an async iterator; only meaningful for subscription fields.
        bool is_async_gen{false};
        // Argument name to a callable applied to the converted argument before the call.
        ankerl::unordered_dense::map<std::string, host_value_ptr> coercers;
    };

    struct GROMMET_EXPORT FieldContext {
        std::string field_name;
        std::optional<ResolverEntry> resolver;
        // Attribute or key read from the parent when there is no resolver.
        std::string source;
        engine::TypeRef output_type;
        ScalarHint hint{ScalarHint::Unknown};
        // Only set when the resolver shape takes a context.
        host_value_ptr context_class;
        type_universe_s_ptr universe;
    };

    // The handles a request threads through engine::Data for its resolvers.
    struct GROMMET_EXPORT RequestHandles {
        host_value_ptr root;
        host_value_ptr state;
        host_scheduler_s_ptr scheduler;
        // Set for subscription requests; the subscription resolver parks its iterator here.
        subscription_state_s_ptr subscription;
    };

    // @throws GrommetError when the request was not submitted through the python surface
    const RequestHandles &request_handles(const engine::ResolverContext &ctx);
} // namespace grommet

#endif // GROMMET_PYTHON_FIELD_CONTEXT_H
