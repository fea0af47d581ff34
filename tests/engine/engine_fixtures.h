//
// Shared schema for the engine tests, built directly against the engine API.
//

#ifndef GROMMET_TESTS_ENGINE_FIXTURES_H
#define GROMMET_TESTS_ENGINE_FIXTURES_H

#include <grommet/engine/schema.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

namespace grommet::testing {
    using namespace grommet::engine;

    inline Field field(std::string name, std::string type, FieldResolver resolver = {},
                       std::vector<InputValue> args = {}) {
        Field f;
        f.name = std::move(name);
        f.type = TypeRef::parse(type);
        f.resolver = std::move(resolver);
        f.arguments = std::move(args);
        return f;
    }

    inline InputValue arg(std::string name, std::string type, std::optional<Value> default_value = std::nullopt) {
        return InputValue{std::move(name), TypeRef::parse(type), std::nullopt, std::move(default_value)};
    }

    /**
     * type Query {
     *   hello: String!                      greet(name: String = "world"): String
     *   user(id: ID!): User                 users: [User!]!
     *   node: Node                          broken: String
     *   color(c: Color = RED): Color        echo(input: PointInput!): String
     *   version: Int                        (no resolver, always null)
     * }
     * interface Node { id: ID! }
     * type User implements Node { id: ID! name: String friend: User mandatory: String! }
     * type Mutation { bump: Int! }
     */
    struct LibrarySchema {
        std::shared_ptr<std::atomic<int>> counter{std::make_shared<std::atomic<int>>(0)};
        std::shared_ptr<const Schema> schema;

        LibrarySchema() {
            auto user_value = [](const std::string &id) {
                return Value::object({{"id", id}, {"name", "user-" + id}});
            };

            Object query{"Query", std::nullopt, {}, {}};
            query.fields.push_back(field("hello", "String!", [](const ResolverContext &) {
                return FieldValue(Value("hi"));
            }));
            query.fields.push_back(field("greet", "String", [](const ResolverContext &ctx) {
                return FieldValue(Value("hello, " + ctx.args().get("name")->as_string()));
            }, {arg("name", "String", Value("world"))}));
            query.fields.push_back(field("user", "User", [user_value](const ResolverContext &ctx) {
                return FieldValue(user_value(ctx.args().get("id")->as_string()));
            }, {arg("id", "ID!")}));
            query.fields.push_back(field("users", "[User!]!", [user_value](const ResolverContext &) {
                return FieldValue::list({FieldValue(user_value("1")), FieldValue(user_value("2"))});
            }));
            query.fields.push_back(field("node", "Node", [user_value](const ResolverContext &) {
                return FieldValue(user_value("7")).with_type("User");
            }));
            query.fields.push_back(field("broken", "String", [](const ResolverContext &) -> FieldValue {
                throw std::runtime_error("kaput");
            }));
            query.fields.push_back(field("color", "Color", [](const ResolverContext &ctx) {
                return FieldValue(*ctx.args().get("c"));
            }, {arg("c", "Color", Value::enum_value("RED"))}));
            query.fields.push_back(field("echo", "String", [](const ResolverContext &ctx) {
                return FieldValue(Value(ctx.args().get("input")->to_string()));
            }, {arg("input", "PointInput!")}));
            query.fields.push_back(field("version", "Int"));

            Interface node{"Node", std::nullopt, {}, {}};
            FieldDefinition node_id;
            node_id.name = "id";
            node_id.type = TypeRef::parse("ID!");
            node.fields.push_back(node_id);

            Object user{"User", std::nullopt, {"Node"}, {}};
            user.fields.push_back(field("id", "ID!"));
            user.fields.push_back(field("name", "String"));
            user.fields.push_back(field("friend", "User"));
            user.fields.push_back(field("mandatory", "String!", [](const ResolverContext &) -> FieldValue {
                throw std::runtime_error("boom");
            }));

            Enum color{"Color", std::nullopt, {{"RED", std::nullopt, std::nullopt}, {"GREEN", std::nullopt, std::nullopt}}};
            InputObject point{"PointInput", std::nullopt, {arg("x", "Int!"), arg("y", "Int", Value(0))}};

            Object mutation{"Mutation", std::nullopt, {}, {}};
            mutation.fields.push_back(field("bump", "Int!", [counter = counter](const ResolverContext &) {
                return FieldValue(Value(++*counter));
            }));

            SchemaBuilder builder("Query", "Mutation");
            builder.register_type(std::move(query))
                .register_type(std::move(node))
                .register_type(std::move(user))
                .register_type(std::move(color))
                .register_type(std::move(point))
                .register_type(std::move(mutation));
            schema = std::make_shared<const Schema>(builder.finish());
        }

        [[nodiscard]] Response run(std::string query, ValueMap variables = {},
                                   task_executor_s_ptr executor = nullptr) const {
            Request request;
            request.query = std::move(query);
            request.variables = std::move(variables);
            request.executor = std::move(executor);
            return schema->execute(std::move(request));
        }
    };
} // namespace grommet::testing

#endif // GROMMET_TESTS_ENGINE_FIXTURES_H
