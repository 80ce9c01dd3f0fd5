#include "mcpserve/exceptions.hpp"
#include "mcpserve/tools/typed.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mcpserve;
using namespace mcpserve::tools;

static std::int64_t subtract(std::int64_t a, std::int64_t b)
{
    return a - b;
}

struct Greeter
{
    std::string prefix{"Hello"};
    std::string greet(const std::string& name) const
    {
        return prefix + ", " + name;
    }
    void rename(std::string p)
    {
        prefix = std::move(p);
    }
};

void test_lambda_signature()
{
    std::cout << "test_lambda_signature...\n";
    auto tool = make_tool("add", "Add two numbers", {{"a", "First number"}, "b"},
                          [](std::int64_t a, std::int64_t b) { return a + b; });

    const auto& schema = tool.input_schema();
    assert(schema.at("properties").at("a").at("type") == "integer");
    assert(schema.at("properties").at("a").at("format") == "int64");
    assert(schema.at("properties").at("a").at("description") == "First number");
    assert(!schema.at("properties").at("b").contains("description"));
    assert(schema.at("required") == Json::array({"a", "b"}));
    assert(tool.returns().type.kind == schema::TypeSpec::Kind::Integer);
    assert(!tool.returns().fallible());

    auto out = tool.invoke(tool.decode(Json{{"a", 2}, {"b", 3}}));
    assert(out.ok());
    assert(out.value() == 5);
    std::cout << "  [PASS]\n";
}

void test_function_pointer_and_optional()
{
    std::cout << "test_function_pointer_and_optional...\n";
    auto sub = make_tool("subtract", "", {"a", "b"}, &subtract);
    assert(sub.invoke(sub.decode(Json{{"a", 10}, {"b", 4}})).value() == 6);

    auto scale = make_tool("scale", "Scale a value", {"value", {"factor", "Defaults to 2"}},
                           [](double value, std::optional<double> factor)
                           { return value * factor.value_or(2.0); });
    assert(scale.input_schema().at("required") == Json::array({"value"}));
    assert(scale.input_schema().at("properties").at("factor").at("type") == "number");
    assert(scale.invoke(scale.decode(Json{{"value", 1.5}})).value() == 3.0);
    assert(scale.invoke(scale.decode(Json{{"value", 1.5}, {"factor", 4}})).value() == 6.0);
    std::cout << "  [PASS]\n";
}

void test_outcome_return()
{
    std::cout << "test_outcome_return...\n";
    auto divide = make_tool("divide", "Divide a by b", {"a", "b"},
                            [](std::int64_t a, std::int64_t b) -> Outcome<double>
                            {
                                if (b == 0)
                                    return Outcome<double>::fail("Cannot divide by zero");
                                return static_cast<double>(a) / b;
                            });
    assert(divide.returns().fallible());

    auto ok = divide.invoke(divide.decode(Json{{"a", 9}, {"b", 2}}));
    assert(ok.ok());
    assert(ok.value() == 4.5);

    auto fail = divide.invoke(divide.decode(Json{{"a", 4}, {"b", 0}}));
    assert(!fail.ok());
    assert(fail.failure().message == "Cannot divide by zero");
    assert(fail.failure().code == error_code::ToolFailure);
    std::cout << "  [PASS]\n";
}

void test_void_and_vector()
{
    std::cout << "test_void_and_vector...\n";
    std::vector<std::string> seen;
    auto record = make_tool("record", "", {"items"},
                            [&seen](std::vector<std::string> items)
                            { seen.insert(seen.end(), items.begin(), items.end()); });
    auto out = record.invoke(record.decode(Json{{"items", Json::array({"x", "y"})}}));
    assert(out.ok());
    assert(out.value().is_null());
    assert(seen.size() == 2);
    assert(record.input_schema().at("properties").at("items").at("items").at("type") == "string");
    std::cout << "  [PASS]\n";
}

void test_member_functions()
{
    std::cout << "test_member_functions...\n";
    auto greeter = std::make_shared<Greeter>();
    auto greet = make_tool("greet", "Greet someone", {"name"}, greeter, &Greeter::greet);
    auto rename = make_tool("rename", "Change greeting", {"prefix"}, greeter, &Greeter::rename);

    assert(greet.invoke(greet.decode(Json{{"name", "Ada"}})).value() == "Hello, Ada");
    rename.invoke(rename.decode(Json{{"prefix", "Hi"}}));
    assert(greet.invoke(greet.decode(Json{{"name", "Ada"}})).value() == "Hi, Ada");

    // Tools keep the owner alive
    std::weak_ptr<Greeter> weak = greeter;
    greeter.reset();
    assert(!weak.expired());
    std::cout << "  [PASS]\n";
}

void test_arity_mismatch()
{
    std::cout << "test_arity_mismatch...\n";
    bool threw = false;
    try
    {
        make_tool("bad", "", {"a"}, [](int a, int b) { return a + b; });
    }
    catch (const ConfigurationError& e)
    {
        threw = true;
        assert(e.name() == "bad");
    }
    assert(threw);
    std::cout << "  [PASS]\n";
}

void test_handler_exception_propagates()
{
    std::cout << "test_handler_exception_propagates...\n";
    auto boom = make_tool("boom", "", {}, []() -> std::int64_t { throw std::runtime_error("kaboom"); });
    bool threw = false;
    try
    {
        boom.invoke(boom.decode(Json::object()));
    }
    catch (const std::runtime_error& e)
    {
        threw = std::string(e.what()) == "kaboom";
    }
    assert(threw);
    std::cout << "  [PASS]\n";
}

int main()
{
    test_lambda_signature();
    test_function_pointer_and_optional();
    test_outcome_return();
    test_void_and_vector();
    test_member_functions();
    test_arity_mismatch();
    test_handler_exception_propagates();
    std::cout << "All typed tool tests passed\n";
    return 0;
}
