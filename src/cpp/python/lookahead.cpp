#include <grommet/python/lookahead.h>
#include <grommet/util/errors.h>
#include <grommet/util/string_utils.h>

#include <fmt/ranges.h>

#include <algorithm>
#include <mutex>

namespace grommet {
    struct Lookahead::Node {
        Node(engine::SelectionField field, size_t depth) : field{std::move(field)}, depth{depth} {}

        engine::SelectionField field;
        size_t depth;
        std::once_flag built;
        children_type children;
    };

    Lookahead Lookahead::from_selection(const engine::SelectionField &field) {
        return Lookahead(std::make_shared<Node>(field, 0));
    }

    const Lookahead::children_type *Lookahead::children() const {
        if (!_node) { return nullptr; }
        std::call_once(_node->built, [node = _node.get()] {
            if (node->depth >= max_depth) { return; }
            auto selection = node->field.try_selection_set();
            if (!selection) { throw_error("Lookahead used after its request finished"); }
            for (auto &child: *selection) {
                // Aliased selections of the same field share one entry; the first one wins.
                if (node->children.contains(child.name())) { continue; }
                auto name = child.name();
                node->children.emplace(std::move(name), Lookahead(std::make_shared<Node>(std::move(child),
                                                                                         node->depth + 1)));
            }
        });
        return &_node->children;
    }

    bool Lookahead::requests(const std::string &name) const {
        auto selected = children();
        return selected != nullptr && selected->contains(name);
    }

    Lookahead Lookahead::peek(const std::string &name) const {
        auto selected = children();
        if (selected == nullptr) { return {}; }
        auto it = selected->find(name);
        return it == selected->end() ? Lookahead{} : it->second;
    }

    std::vector<std::string> Lookahead::fields() const {
        std::vector<std::string> names;
        auto selected = children();
        if (selected == nullptr) { return names; }
        names.reserve(selected->size());
        for (const auto &[name, _]: *selected) { names.push_back(name); }
        return names;
    }

    void Lookahead::register_with_nanobind(nb::module_ &m) {
        nb::class_<Lookahead>(m, "Lookahead")
            .def("exists", &Lookahead::exists)
            .def("requests", &Lookahead::requests, "name"_a)
            .def("peek", &Lookahead::peek, "name"_a)
            .def("field", &Lookahead::peek, "name"_a)
            .def_prop_ro("fields", &Lookahead::fields)
            .def("__bool__", &Lookahead::exists)
            .def("__repr__", [](const Lookahead &self) {
                if (!self.exists()) { return std::string("Lookahead(MISSING)"); }
                auto names = self.fields();
                std::ranges::sort(names);
                return fmt::format("Lookahead({})", fmt::join(names, ", "));
            });
        m.attr("MISSING") = nb::cast(Lookahead{});
    }

    void Context::register_with_nanobind(nb::module_ &m) {
        nb::class_<Context>(m, "Context")
            .def(nb::init<nb::object, nb::object>(), "graph"_a, "state"_a = nb::none())
            .def_prop_ro("graph", &Context::graph)
            .def_prop_ro("state", &Context::state)
            .def("__repr__", [](const Context &self) {
                return fmt::format("Context(graph={}, state={})", to_string(nb::repr(self.graph())),
                                   to_string(nb::repr(self.state())));
            });
    }
} // namespace grommet
