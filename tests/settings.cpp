#include "mcpserve/exceptions.hpp"
#include "mcpserve/settings.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>

using namespace mcpserve;

static void test_defaults()
{
    std::cout << "test_defaults...\n";
    Settings s;
    assert(s.log_level == "INFO");
    assert(s.transport == "stdio");
    assert(s.host == "127.0.0.1");
    assert(s.port == 3000);
    assert(s.sse_path == "/sse");
    assert(s.message_path == "/message");
    assert(s.session_idle_timeout_ms == 300000);
    assert(s.keepalive_interval_ms == 15000);
    assert(s.max_sessions == 100);
    assert(s.max_queued_messages == 1000);
    assert(s.result_format == "raw");
    assert(!s.instructions);
    s.validate();
    std::cout << "  [PASS]\n";
}

static void test_from_env()
{
    std::cout << "test_from_env...\n";
    setenv("MCPSERVE_LOG_LEVEL", "debug", 1);
    setenv("MCPSERVE_TRANSPORT", "SSE", 1);
    setenv("MCPSERVE_PORT", "8123", 1);
    setenv("MCPSERVE_RESULT_FORMAT", "Content", 1);
    setenv("MCPSERVE_INSTRUCTIONS", "Use tools/list to see available tools", 1);

    auto s = Settings::from_env();
    assert(s.log_level == "DEBUG");
    assert(s.transport == "sse");
    assert(s.port == 8123);
    assert(s.result_format == "content");
    assert(s.instructions && *s.instructions == "Use tools/list to see available tools");
    s.validate();

    setenv("MCPSERVE_PORT", "80x", 1);
    bool threw = false;
    try
    {
        Settings::from_env();
    }
    catch (const ConfigurationError&)
    {
        threw = true;
    }
    assert(threw);

    unsetenv("MCPSERVE_LOG_LEVEL");
    unsetenv("MCPSERVE_TRANSPORT");
    unsetenv("MCPSERVE_PORT");
    unsetenv("MCPSERVE_RESULT_FORMAT");
    unsetenv("MCPSERVE_INSTRUCTIONS");
    std::cout << "  [PASS]\n";
}

static void test_from_json()
{
    std::cout << "test_from_json...\n";
    auto s = Settings::from_json(Json{{"port", 0},
                                      {"transport", "sse"},
                                      {"max_sessions", 2},
                                      {"unknown_key", true},
                                      {"instructions", "hello"}});
    assert(s.port == 0);
    assert(s.transport == "sse");
    assert(s.max_sessions == 2);
    assert(s.instructions && *s.instructions == "hello");
    assert(s.sse_path == "/sse");

    bool threw = false;
    try
    {
        Settings::from_json(Json{{"port", "not a number"}});
    }
    catch (const ConfigurationError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "  [PASS]\n";
}

static void test_validate()
{
    std::cout << "test_validate...\n";
    auto expect_invalid = [](Settings s)
    {
        try
        {
            s.validate();
        }
        catch (const ConfigurationError&)
        {
            return;
        }
        assert(false && "expected ConfigurationError");
    };

    Settings s;
    s.transport = "websocket";
    expect_invalid(s);

    s = Settings{};
    s.result_format = "xml";
    expect_invalid(s);

    s = Settings{};
    s.port = 70000;
    expect_invalid(s);

    s = Settings{};
    s.message_path = "message";
    expect_invalid(s);

    s = Settings{};
    s.message_path = s.sse_path;
    expect_invalid(s);

    s = Settings{};
    s.max_sessions = 0;
    expect_invalid(s);
    std::cout << "  [PASS]\n";
}

int main()
{
    test_defaults();
    test_from_env();
    test_from_json();
    test_validate();
    std::cout << "All settings tests passed\n";
    return 0;
}
