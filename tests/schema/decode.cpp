#include "mcpserve/exceptions.hpp"
#include "mcpserve/schema/decode.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

using namespace mcpserve;
using namespace mcpserve::schema;

// Returns the DecodeError path, or "" if decoding succeeded
static std::string failure_path(const std::vector<FieldSpec>& params, const Json& args)
{
    try
    {
        decode_arguments(params, args);
    }
    catch (const DecodeError& e)
    {
        return e.path();
    }
    return "";
}

void test_valid_arguments()
{
    std::cout << "test_valid_arguments...\n";
    std::vector<FieldSpec> params{field("a", integer()), field("b", number()),
                                  field("name", string()), field("flag", optional(boolean()))};
    auto out = decode_arguments(params, Json{{"a", 2}, {"b", 3}, {"name", "x"}, {"extra", 1}});
    assert(out.at("a") == 2);
    assert(out.at("b") == 3);
    assert(out.at("name") == "x");
    assert(out.at("flag").is_null());
    // Extra properties are dropped
    assert(!out.contains("extra"));

    out = decode_arguments(params, Json{{"a", 4.0}, {"b", 0.5}, {"name", ""}, {"flag", true}});
    assert(out.at("a").is_number_integer());
    assert(out.at("a") == 4);
    assert(out.at("flag") == true);
    std::cout << "  [PASS]\n";
}

void test_missing_and_mismatch()
{
    std::cout << "test_missing_and_mismatch...\n";
    std::vector<FieldSpec> params{field("a", integer()), field("b", integer())};
    assert(failure_path(params, Json{{"a", 1}}) == "arguments.b");
    assert(failure_path(params, Json{{"a", "1"}, {"b", 2}}) == "arguments.a");
    assert(failure_path(params, Json{{"a", 1.5}, {"b", 2}}) == "arguments.a");
    assert(failure_path(params, Json{{"a", nullptr}, {"b", 2}}) == "arguments.a");
    assert(failure_path(params, Json::array()) == "arguments");

    try
    {
        decode_arguments(params, Json{{"a", true}, {"b", 1}});
        assert(false);
    }
    catch (const DecodeError& e)
    {
        std::string msg = e.what();
        assert(msg.find("expected integer") != std::string::npos);
        assert(msg.find("boolean") != std::string::npos);
    }
    std::cout << "  [PASS]\n";
}

void test_integer_widths()
{
    std::cout << "test_integer_widths...\n";
    std::vector<FieldSpec> i32{field("v", integer("int32"))};
    assert(failure_path(i32, Json{{"v", 2147483647}}).empty());
    assert(failure_path(i32, Json{{"v", 2147483648LL}}) == "arguments.v");
    assert(failure_path(i32, Json{{"v", -2147483648LL}}).empty());

    std::vector<FieldSpec> u32{field("v", integer("uint32"))};
    assert(failure_path(u32, Json{{"v", -1}}) == "arguments.v");
    assert(failure_path(u32, Json{{"v", 4294967295LL}}).empty());

    std::vector<FieldSpec> i64{field("v", integer("int64"))};
    assert(failure_path(i64, Json{{"v", std::numeric_limits<std::uint64_t>::max()}}) ==
           "arguments.v");
    assert(failure_path(i64, Json{{"v", std::numeric_limits<std::int64_t>::min()}}).empty());

    std::vector<FieldSpec> u64{field("v", integer("uint64"))};
    assert(failure_path(u64, Json{{"v", std::numeric_limits<std::uint64_t>::max()}}).empty());
    std::cout << "  [PASS]\n";
}

void test_nested_paths()
{
    std::cout << "test_nested_paths...\n";
    auto point = object({field("x", number()), field("y", number())});
    std::vector<FieldSpec> params{field("point", point), field("tags", array(string())),
                                  field("mode", enumeration({"floor", "ceil"}))};

    Json good{{"point", {{"x", 1}, {"y", 2.5}}}, {"tags", Json::array({"a", "b"})}, {"mode", "ceil"}};
    auto out = decode_arguments(params, good);
    assert(out.at("point").at("y") == 2.5);
    assert(out.at("tags").size() == 2);

    Json bad_field = good;
    bad_field["point"].erase("x");
    assert(failure_path(params, bad_field) == "arguments.point.x");

    Json bad_item = good;
    bad_item["tags"] = Json::array({"a", 7});
    assert(failure_path(params, bad_item) == "arguments.tags[1]");

    Json bad_enum = good;
    bad_enum["mode"] = "nearest";
    try
    {
        decode_arguments(params, bad_enum);
        assert(false);
    }
    catch (const DecodeError& e)
    {
        assert(e.path() == "arguments.mode");
        assert(std::string(e.what()).find("floor, ceil") != std::string::npos);
    }
    std::cout << "  [PASS]\n";
}

void test_result_is_not_decodable()
{
    std::cout << "test_result_is_not_decodable...\n";
    bool threw = false;
    try
    {
        decode(result(integer()), Json(1));
    }
    catch (const DecodeError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS]\n";
}

int main()
{
    test_valid_arguments();
    test_missing_and_mismatch();
    test_integer_widths();
    test_nested_paths();
    test_result_is_not_decodable();
    std::cout << "All decode tests passed\n";
    return 0;
}
