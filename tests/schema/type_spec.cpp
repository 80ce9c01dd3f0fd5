#include "mcpserve/schema/type_spec.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>

using namespace mcpserve;
using namespace mcpserve::schema;

static bool has_required(const Json& schema, const std::string& name)
{
    const auto& req = schema.at("required");
    return std::find(req.begin(), req.end(), name) != req.end();
}

void test_primitives()
{
    std::cout << "test_primitives...\n";
    assert(to_schema(integer()) == (Json{{"type", "integer"}, {"format", "int64"}}));
    assert(to_schema(integer("int32")) == (Json{{"type", "integer"}, {"format", "int32"}}));
    assert(to_schema(integer("")) == (Json{{"type", "integer"}}));
    assert(to_schema(number()) == (Json{{"type", "number"}, {"format", "double"}}));
    assert(to_schema(number("float")).at("format") == "float");
    assert(to_schema(string()) == (Json{{"type", "string"}}));
    assert(to_schema(boolean()) == (Json{{"type", "boolean"}}));
    assert(to_schema(any()) == Json::object());
    std::cout << "  [PASS]\n";
}

void test_composites()
{
    std::cout << "test_composites...\n";
    auto arr = to_schema(array(string()));
    assert(arr.at("type") == "array");
    assert(arr.at("items").at("type") == "string");

    auto en = to_schema(enumeration({"floor", "ceil"}));
    assert(en.at("type") == "string");
    assert(en.at("enum") == Json::array({"floor", "ceil"}));

    auto obj = to_schema(object({field("x", number(), "Horizontal"),
                                 field("label", optional(string()))}));
    assert(obj.at("type") == "object");
    assert(obj.at("properties").at("x").at("description") == "Horizontal");
    assert(obj.at("properties").contains("label"));
    assert(has_required(obj, "x"));
    assert(!has_required(obj, "label"));

    auto described = to_schema(string().describe("A name"));
    assert(described.at("description") == "A name");
    std::cout << "  [PASS]\n";
}

void test_wrappers()
{
    std::cout << "test_wrappers...\n";
    // Optional and Result are transparent in the emitted schema
    assert(to_schema(optional(integer())) == to_schema(integer()));
    assert(to_schema(result(number())) == to_schema(number()));

    // optional(optional(T)) collapses
    auto twice = optional(optional(string()));
    assert(twice.kind == TypeSpec::Kind::Optional);
    assert(twice.element->kind == TypeSpec::Kind::String);

    assert(contains_result(result(integer())));
    assert(contains_result(array(result(integer()))));
    assert(contains_result(object({field("inner", optional(result(string())))})));
    assert(!contains_result(object({field("a", integer())})));
    std::cout << "  [PASS]\n";
}

void test_input_schema()
{
    std::cout << "test_input_schema...\n";
    auto schema = input_schema({field("a", integer(), "First number"),
                                field("b", integer(), "Second number"),
                                field("precision", optional(integer("int32")))});
    assert(schema.at("type") == "object");
    assert(schema.at("properties").size() == 3);
    assert(schema.at("properties").at("a").at("description") == "First number");
    assert(!schema.at("properties").at("precision").contains("description"));
    assert(schema.at("required") == Json::array({"a", "b"}));

    // Always present, even when empty
    auto empty = input_schema({});
    assert(empty.at("required").is_array() && empty.at("required").empty());
    assert(empty.at("properties").is_object() && empty.at("properties").empty());
    std::cout << "  [PASS]\n";
}

int main()
{
    test_primitives();
    test_composites();
    test_wrappers();
    test_input_schema();
    std::cout << "All type_spec tests passed\n";
    return 0;
}
