//
// Selection lookahead handed to resolvers through their context object.
//

#ifndef GROMMET_PYTHON_LOOKAHEAD_H
#define GROMMET_PYTHON_LOOKAHEAD_H

#include <grommet/grommet_base.h>
#include <grommet/engine/resolver_context.h>

#include <ankerl/unordered_dense.h>

#include <memory>
#include <string>

namespace grommet {
    /**
     * Tree of the fields selected below the current one, keyed by field name with fragments merged. Each level is
     * collected from the executor's selection the first time it is asked about, then cached. A lookahead for a
     * field that was not selected is the missing sentinel: exists() and requests() answer false and peek()
     * returns the sentinel again.
     *
     * Levels not yet visited when the request finishes can no longer be collected; asking about them raises.
     */
    class GROMMET_EXPORT Lookahead {
    public:
        static constexpr size_t max_depth = 32;

        using children_type = ankerl::unordered_dense::map<std::string, Lookahead>;

        // The missing sentinel.
        Lookahead() = default;

        static Lookahead from_selection(const engine::SelectionField &field);

        [[nodiscard]] bool exists() const { return _node != nullptr; }

        // @throws GrommetError when the level is first visited after the request finished
        [[nodiscard]] bool requests(const std::string &name) const;

        [[nodiscard]] Lookahead peek(const std::string &name) const;

        // Names of the selected children, in no particular order.
        [[nodiscard]] std::vector<std::string> fields() const;

        static void register_with_nanobind(nb::module_ &m);

    private:
        // Shared by copies; holds the selection until its children are collected.
        struct Node;

        explicit Lookahead(std::shared_ptr<Node> node) : _node{std::move(node)} {}

        // nullptr for the sentinel.
        [[nodiscard]] const children_type *children() const;

        std::shared_ptr<Node> _node;
    };

    /**
     * Default context object passed to resolvers that take one: the lookahead of the field being resolved and the
     * per request state supplied to execute.
     */
    class GROMMET_EXPORT Context {
    public:
        Context(nb::object graph, nb::object state) : _graph{std::move(graph)}, _state{std::move(state)} {}

        [[nodiscard]] const nb::object &graph() const { return _graph; }

        [[nodiscard]] const nb::object &state() const { return _state; }

        static void register_with_nanobind(nb::module_ &m);

    private:
        nb::object _graph;
        nb::object _state;
    };
} // namespace grommet

#endif // GROMMET_PYTHON_LOOKAHEAD_H
