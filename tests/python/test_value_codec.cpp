/**
 * Unit tests for the conversion between python objects and engine values.
 */

#include <catch2/catch_test_macros.hpp>
#include <grommet/python/value_codec.h>
#include <grommet/util/errors.h>
#include <grommet/util/string_utils.h>

#include "python_test_support.h"

using namespace grommet;
using namespace grommet::testing;
using engine::TypeRef;
using engine::Value;

namespace {
    TypeUniverse universe_with(std::initializer_list<std::string> objects,
                               std::initializer_list<std::string> abstract = {}) {
        TypeUniverse universe;
        for (const auto &name: objects) { universe.object_types.insert(name); }
        for (const auto &name: abstract) { universe.abstract_types.insert(name); }
        return universe;
    }
}

TEST_CASE("py_to_value - primitives and containers", "[python][codec]") {
    auto token = ExecutionToken::assume_held();
    auto scope = python_scope();

    auto value = py_to_value(token, eval_python(scope, "{'a': [1, 2.5, 'x', None, True], 'b': (b'\\x00z',)}"), {});
    REQUIRE(value.is_object());
    const auto &a = value.find("a")->as_list();
    REQUIRE(a.size() == 5);
    CHECK(a[0].as_int() == 1);
    CHECK(a[1].as_float() == 2.5);
    CHECK(a[2].as_string() == "x");
    CHECK(a[3].is_null());
    CHECK(a[4].as_bool());
    CHECK(value.find("b")->as_list()[0].as_bytes() == std::string("\0z", 2));
}

TEST_CASE("py_to_value - ints outside 64 bits widen to float", "[python][codec]") {
    auto token = ExecutionToken::assume_held();
    auto scope = python_scope();

    auto value = py_to_value(token, eval_python(scope, "2 ** 70"), {});
    REQUIRE(value.kind() == Value::Kind::Float);
    CHECK(value.as_float() == 1180591620717411303424.0);
}

TEST_CASE("py_to_value - json compatible values survive the round trip", "[python][codec]") {
    auto token = ExecutionToken::assume_held();
    auto scope = python_scope();
    run_python(scope, R"(
        samples = [None, True, -3, 1.25, "text", [], {}, [1, [2, [3]]], {"k": {"nested": ["v", 0]}}]
    )");

    for (auto sample: nb::borrow<nb::list>(scope["samples"])) {
        auto back = value_to_py(token, py_to_value(token, sample, {}));
        INFO(to_string(nb::repr(sample)));
        CHECK(back.equal(sample));
    }
}

TEST_CASE("py_to_value - enum and input metadata", "[python][codec]") {
    auto token = ExecutionToken::assume_held();
    auto scope = python_scope();
    run_python(scope, R"(
        class Color(enum.Enum):
            __grommet_meta__ = {"kind": "enum", "name": "Color"}
            RED = 1
            GREEN = 2

        @dataclasses.dataclass
        class Point:
            __grommet_meta__ = {"kind": "input"}
            x: int
            color: Color

        class Tags:
            __grommet_meta__ = {"kind": "input"}

            def __init__(self):
                self.names = ["a", "b"]
    )");

    auto color = py_to_value(token, eval_python(scope, "Color.GREEN"), {});
    REQUIRE(color.kind() == Value::Kind::Enum);
    CHECK(color.as_enum() == "GREEN");

    auto point = py_to_value(token, eval_python(scope, "Point(3, Color.RED)"), {});
    CHECK(point.find("x")->as_int() == 3);
    CHECK(point.find("color")->as_enum() == "RED");

    auto tags = py_to_value(token, eval_python(scope, "Tags()"), {});
    CHECK(tags.find("names")->as_list().size() == 2);

    // Enums cross back into python as their member names.
    CHECK(nb::cast<std::string>(value_to_py(token, color)) == "GREEN");
}

TEST_CASE("py_to_value - scalar bindings serialize once", "[python][codec]") {
    auto token = ExecutionToken::assume_held();
    auto scope = python_scope();
    run_python(scope, R"(
        class Money:
            def __init__(self, cents):
                self.cents = cents

        calls = []

        def serialize(value):
            calls.append(value.cents)
            # Returning another Money must not trigger a second serialization.
            return {"cents": value.cents, "again": Money(0)} if value.cents < 0 else f"${value.cents / 100:.2f}"
    )");

    std::vector<ScalarBinding> scalars{
        {"Money", HostValue::make(token, scope["Money"]), HostValue::make(token, scope["serialize"])}
    };

    auto price = py_to_value(token, eval_python(scope, "[Money(250)]"), scalars);
    CHECK(price.as_list()[0].as_string() == "$2.50");
    CHECK_THROWS_AS(py_to_value(token, eval_python(scope, "Money(-1)"), scalars), UnsupportedValueType);
    CHECK(eval_bool(scope, "calls == [250, -1]"));
}

TEST_CASE("py_to_value - unsupported values", "[python][codec]") {
    auto token = ExecutionToken::assume_held();
    auto scope = python_scope();

    CHECK_THROWS_AS(py_to_value(token, eval_python(scope, "object()"), {}), UnsupportedValueType);
    CHECK_THROWS_AS(py_to_value(token, eval_python(scope, "{1: 'non string key'}"), {}), UnsupportedValueType);
    CHECK_THROWS_WITH(py_to_value(token, eval_python(scope, "{'s': {1, 2}}"), {}), "Unsupported value type");
}

TEST_CASE("py_to_field_value_for_type - lists are required at list positions", "[python][codec]") {
    auto token = ExecutionToken::assume_held();
    auto scope = python_scope();
    auto universe = universe_with({});
    auto type = TypeRef::parse("[Int!]!");
    auto hint = scalar_hint_for(type, universe);

    auto items = py_to_field_value_for_type(token, eval_python(scope, "(3, 4)"), type, hint, universe);
    REQUIRE(items.kind() == engine::FieldValue::Kind::List);
    REQUIRE(items.as_list().size() == 2);
    CHECK(items.as_list()[1].as_value().as_int() == 4);

    CHECK_THROWS_AS(py_to_field_value_for_type(token, eval_python(scope, "'34'"), type, hint, universe),
                    ExpectedList);
    CHECK_THROWS_WITH(py_to_field_value_for_type(token, eval_python(scope, "{3: 4}"), type, hint, universe),
                      "Expected list for GraphQL list type");
}

TEST_CASE("py_to_field_value_for_type - abstract types need type metadata", "[python][codec]") {
    auto token = ExecutionToken::assume_held();
    auto scope = python_scope();
    run_python(scope, R"(
        class Cat:
            __grommet_meta__ = {"kind": "object", "name": "Feline"}

        class Dog:
            class __grommet_meta__:
                kind = "object"
                name = None
    )");
    auto universe = universe_with({"Feline", "Dog"}, {"Pet"});
    auto type = TypeRef::parse("Pet");
    auto hint = scalar_hint_for(type, universe);
    REQUIRE(hint == ScalarHint::Object);

    auto cat = py_to_field_value_for_type(token, eval_python(scope, "Cat()"), type, hint, universe);
    CHECK(cat.type_name() == "Feline");

    auto dog = py_to_field_value_for_type(token, eval_python(scope, "Dog()"), type, hint, universe);
    CHECK(dog.type_name() == "Dog");

    CHECK_THROWS_AS(py_to_field_value_for_type(token, eval_python(scope, "object()"), type, hint, universe),
                    AbstractTypeRequiresObject);
    CHECK(py_to_field_value_for_type(token, nb::none(), type, hint, universe).is_null());
}

TEST_CASE("py_to_field_value_for_type - scalar hints", "[python][codec]") {
    auto token = ExecutionToken::assume_held();
    auto scope = python_scope();
    auto universe = universe_with({"User"});

    auto id_type = TypeRef::parse("ID");
    auto id = py_to_field_value_for_type(token, eval_python(scope, "42"), id_type, scalar_hint_for(id_type, universe),
                                         universe);
    CHECK(id.as_value().as_int() == 42);

    auto user_type = TypeRef::parse("User!");
    auto user = py_to_field_value_for_type(token, eval_python(scope, "{'name': 'Ada'}"), user_type,
                                           scalar_hint_for(user_type, universe), universe);
    CHECK(user.kind() == engine::FieldValue::Kind::Owned);

    // A mismatching python type falls through to the generic conversion.
    auto int_type = TypeRef::parse("Int");
    auto text = py_to_field_value_for_type(token, eval_python(scope, "'7'"), int_type,
                                           scalar_hint_for(int_type, universe), universe);
    CHECK(text.as_value().as_string() == "7");
}

TEST_CASE("response_to_py - always carries data, extensions and errors", "[python][codec]") {
    auto token = ExecutionToken::assume_held();

    engine::Response response;
    response.data = Value::object({{"greet", Value("hi")}});
    engine::ServerError error;
    error.message = "boom";
    error.path = {"users", size_t{1}, "name"};
    response.errors.push_back(error);

    auto scope = python_scope();
    scope["result"] = response_to_py(token, response);
    CHECK(eval_bool(scope, "result['data'] == {'greet': 'hi'}"));
    CHECK(eval_bool(scope, "result['extensions'] == {}"));
    CHECK(eval_bool(scope, "result['errors'] == [{'message': 'boom', 'path': ['users', 1, 'name']}]"));
}
