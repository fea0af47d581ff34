//
// Conversion between python objects and the engine's Value / FieldValue.
//

#ifndef GROMMET_PYTHON_VALUE_CODEC_H
#define GROMMET_PYTHON_VALUE_CODEC_H

#include <grommet/engine/field_value.h>
#include <grommet/engine/response.h>
#include <grommet/engine/type_ref.h>
#include <grommet/engine/value.h>
#include <grommet/python/host_value.h>

#include <ankerl/unordered_dense.h>

#include <optional>
#include <string>
#include <vector>

namespace grommet {
    // A user declared scalar: instances of python_type are passed through serialize before conversion.
    struct GROMMET_EXPORT ScalarBinding {
        std::string name;
        host_value_ptr python_type;
        host_value_ptr serialize;
    };

    // The schema wide facts the codec needs, shared read-only by every field.
    struct GROMMET_EXPORT TypeUniverse {
        std::vector<ScalarBinding> scalars;
        ankerl::unordered_dense::set<std::string> abstract_types;
        ankerl::unordered_dense::set<std::string> object_types;
    };

    // Fast path selector for a field's output type, computed from its innermost named type.
    enum class ScalarHint { String, Int, Float, Boolean, ID, Object, Unknown };

    ScalarHint scalar_hint_for(const engine::TypeRef &type, const TypeUniverse &universe);

    // The kind and name a python type declares through __grommet_meta__.
    struct HostMeta {
        std::string kind;
        std::string name;
    };

    std::optional<HostMeta> host_meta(const ExecutionToken &token, nb::handle value);

    /**
     * Convert a python value into a Value. With allow_scalar a scalar binding instance is serialized first; the
     * serializer's result is converted with allow_scalar=false so bindings are applied at most once.
     *
     * @throws UnsupportedValueType when nothing in the precedence list matches
     */
    engine::Value py_to_value(const ExecutionToken &token, nb::handle value, const std::vector<ScalarBinding> &scalars,
                              bool allow_scalar = true);

    /**
     * Convert a resolver result into a field value directed by the field's output type. Objects stay python side
     * as owned handles; values of abstract types are tagged with their concrete type name.
     *
     * @throws ExpectedList when a list position receives anything but a list or tuple
     * @throws AbstractTypeRequiresObject when an abstract position receives a value without type metadata
     */
    engine::FieldValue py_to_field_value_for_type(const ExecutionToken &token, nb::handle value,
                                                  const engine::TypeRef &type, ScalarHint hint,
                                                  const TypeUniverse &universe);

    nb::object value_to_py(const ExecutionToken &token, const engine::Value &value);

    nb::dict response_to_py(const ExecutionToken &token, const engine::Response &response);
} // namespace grommet

#endif // GROMMET_PYTHON_VALUE_CODEC_H
