//
// Everything a field resolver sees of the running request.
//

#ifndef GROMMET_ENGINE_RESOLVER_CONTEXT_H
#define GROMMET_ENGINE_RESOLVER_CONTEXT_H

#include <grommet/engine/ast.h>
#include <grommet/engine/field_value.h>
#include <grommet/engine/response.h>
#include <grommet/runtime/task_executor.h>

#include <ankerl/unordered_dense.h>

#include <any>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <typeindex>
#include <vector>

namespace grommet::engine {
    struct ExecutionScope;

    // Cleared under the exclusive lock when a request's ExecutionScope is destroyed.
    struct ScopeLifetime {
        std::shared_mutex mutex;
        bool alive{true};
    };

    /**
     * Request scoped, type keyed storage. The host layer uses it to thread its own handles (root value, context
     * state, scheduler) through the engine without the engine knowing their types.
     */
    class GROMMET_EXPORT Data {
    public:
        template<typename T>
        void insert(T value) {
            _entries.insert_or_assign(std::type_index(typeid(T)), std::any(std::move(value)));
        }

        template<typename T>
        [[nodiscard]] const T *get() const {
            auto it = _entries.find(std::type_index(typeid(T)));
            return it == _entries.end() ? nullptr : std::any_cast<T>(&it->second);
        }

        [[nodiscard]] bool empty() const { return _entries.empty(); }

    private:
        ankerl::unordered_dense::map<std::type_index, std::any> _entries;
    };

    // Arguments of one field invocation, already coerced against their declared types with defaults applied.
    class GROMMET_EXPORT ArgumentValues {
    public:
        ArgumentValues() = default;

        explicit ArgumentValues(ValueMap values) : _values{std::move(values)} {}

        // nullptr when the argument was neither supplied nor defaulted.
        [[nodiscard]] const Value *get(std::string_view name) const;

        [[nodiscard]] bool contains(std::string_view name) const { return get(name) != nullptr; }

        [[nodiscard]] const ValueMap &values() const { return _values; }

    private:
        ValueMap _values;
    };

    /**
     * View of a selected field: every node of the document that merged into one response key. Children are
     * collected through fragment spreads and inline fragments, honouring @skip and @include.
     */
    class GROMMET_EXPORT SelectionField {
    public:
        SelectionField(std::vector<const Selection *> nodes, const ExecutionScope *scope);

        [[nodiscard]] const std::string &name() const { return _nodes.front()->name; }

        [[nodiscard]] const std::string &alias() const { return _nodes.front()->alias; }

        [[nodiscard]] const std::vector<const Selection *> &nodes() const { return _nodes; }

        // Only valid while the request is running.
        [[nodiscard]] std::vector<SelectionField> selection_set() const;

        // selection_set() for copies that may outlive the request; nullopt once it has finished.
        [[nodiscard]] std::optional<std::vector<SelectionField>> try_selection_set() const;

    private:
        std::vector<const Selection *> _nodes;
        const ExecutionScope *_scope;
        std::shared_ptr<ScopeLifetime> _lifetime;
    };

    class GROMMET_EXPORT ResolverContext {
    public:
        ResolverContext(const Data &data, const CancellationToken &cancellation, const FieldValue *parent,
                        ArgumentValues args, SelectionField field, std::vector<PathSegment> path)
            : _data{data}, _cancellation{cancellation}, _parent{parent}, _args{std::move(args)},
              _field{std::move(field)}, _path{std::move(path)} {}

        [[nodiscard]] const ArgumentValues &args() const { return _args; }

        // nullptr for root fields.
        [[nodiscard]] const FieldValue *parent_value() const { return _parent; }

        template<typename T>
        [[nodiscard]] const T *data() const { return _data.get<T>(); }

        [[nodiscard]] const SelectionField &field() const { return _field; }

        [[nodiscard]] const std::vector<PathSegment> &path() const { return _path; }

        [[nodiscard]] const CancellationToken &cancellation() const { return _cancellation; }

    private:
        const Data &_data;
        const CancellationToken &_cancellation;
        const FieldValue *_parent;
        ArgumentValues _args;
        SelectionField _field;
        std::vector<PathSegment> _path;
    };

    /**
     * Pull based source of subscription items. next() blocks until an item is available, returns nullopt at the
     * end of the stream, and throws to report an item level failure (which also ends the stream).
     */
    class GROMMET_EXPORT FieldStream {
    public:
        virtual ~FieldStream() = default;

        virtual std::optional<FieldValue> next() = 0;
    };
} // namespace grommet::engine

#endif // GROMMET_ENGINE_RESOLVER_CONTEXT_H
