//
// Builds an engine schema from the declarative python mapping.
//

#ifndef GROMMET_PYTHON_SCHEMA_BUILDER_H
#define GROMMET_PYTHON_SCHEMA_BUILDER_H

#include <grommet/engine/schema.h>
#include <grommet/python/field_context.h>
#include <grommet/python/host_value.h>

#include <memory>

namespace grommet {
    struct GROMMET_EXPORT BuiltSchema {
        std::shared_ptr<const engine::Schema> schema;
        type_universe_s_ptr universe;
    };

    /**
     * Translate the schema mapping and resolver map into an engine schema. Async resolvers are installed as
     * start_field starters and the remaining fields run resolve_field with their FieldContext. Subscription fields
     * adapt python async iterators.
     *
     * Mapping keys: schema {query, mutation?, subscription?}, types, scalars?, enums?, unions?, context_class?.
     * See the tests for the record shapes.
     *
     * @throws ValidationError for missing record fields, malformed type references, unknown kinds, unknown
     * resolver keys or shapes
     * @throws SchemaBuildError when the composed schema is rejected
     */
    BuiltSchema build_schema(const ExecutionToken &token, nb::handle definition, nb::handle resolvers);

    // Parses "T", "T!", "[T]", "[T!]!" or a {kind, nullable, of_type | name} record. @throws ValidationError
    engine::TypeRef parse_type_spec(const ExecutionToken &token, nb::handle spec);
} // namespace grommet

#endif // GROMMET_PYTHON_SCHEMA_BUILDER_H
