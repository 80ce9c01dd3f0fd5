// Structured parameters, optional arguments and enums.
//
// Point is mapped through a TypeOf specialization; "round" uses the raw Tool
// API with a hand-written parameter list.
#include "mcpserve/server/mcp_server.hpp"
#include "mcpserve/server/stdio_server.hpp"
#include "mcpserve/tools/toolset.hpp"

#include <cmath>
#include <optional>

struct Point
{
    double x{0};
    double y{0};
};

inline void to_json(mcpserve::Json& j, const Point& p)
{
    j = mcpserve::Json{{"x", p.x}, {"y", p.y}};
}
inline void from_json(const mcpserve::Json& j, Point& p)
{
    p.x = j.at("x").get<double>();
    p.y = j.at("y").get<double>();
}

template <>
struct mcpserve::schema::TypeOf<Point>
{
    static TypeSpec spec()
    {
        return object({field("x", number(), "Horizontal coordinate"),
                       field("y", number(), "Vertical coordinate")});
    }
};

int main()
{
    using namespace mcpserve;
    namespace sc = mcpserve::schema;

    tools::Toolset geometry("geometry");
    geometry.add("distance", "Euclidean distance between two points",
                 {{"from", "Start point"}, {"to", "End point"}},
                 [](Point a, Point b) { return std::hypot(b.x - a.x, b.y - a.y); });
    geometry.add("midpoint", "Point halfway between two points, optionally offset",
                 {"from", "to", {"offset", "Added to both coordinates"}},
                 [](Point a, Point b, std::optional<double> offset)
                 {
                     double d = offset.value_or(0.0);
                     return Point{(a.x + b.x) / 2 + d, (a.y + b.y) / 2 + d};
                 });

    tools::Tool round_tool(
        "round", "Round a number",
        {sc::field("value", sc::number(), "Number to round"),
         sc::field("mode", sc::enumeration({"floor", "ceil", "nearest"}), "Rounding mode"),
         sc::field("digits", sc::optional(sc::integer("int32")), "Decimal places (default 0)")},
        tools::ReturnSpec{sc::number()},
        [](const tools::Arguments& args) -> ToolResult
        {
            double value = args.get<double>("value");
            auto mode = args.get<std::string>("mode");
            double scale = std::pow(10.0, args.get_optional<int>("digits").value_or(0));
            double scaled = value * scale;
            if (mode == "floor")
                scaled = std::floor(scaled);
            else if (mode == "ceil")
                scaled = std::ceil(scaled);
            else
                scaled = std::round(scaled);
            return Json(scaled / scale);
        });
    geometry.add(round_tool);

    server::McpServer srv(ServerInfo{"geometry", "1.0.0"});
    srv.add_toolset(geometry);
    srv.start_serving();

    server::StdioServer(srv.engine()).run();
    return 0;
}
