// Calculator and counter tools over stdin/stdout.
//
//   echo '{"jsonrpc":"2.0","id":1,"method":"tools/call",
//          "params":{"name":"calculator_add","arguments":{"a":2,"b":3}}}' | ./stdio_calculator
#include "demo_tools.hpp"
#include "mcpserve/server/mcp_server.hpp"
#include "mcpserve/server/stdio_server.hpp"
#include "mcpserve/util/log.hpp"

int main()
{
    using namespace mcpserve;

    util::log::set_level(util::log::Level::Warn);

    server::McpServer srv(ServerInfo{"calculator", "1.0.0"});
    srv.add_toolset(demo::make_calculator_toolset());
    srv.add_toolset(demo::make_counter_toolset(std::make_shared<demo::Counter>()));
    srv.start_serving();

    server::StdioServer stdio(srv.engine());
    stdio.run();
    return 0;
}
