#include "mcpserve/util/log.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace mcpserve::util;

int main()
{
    std::vector<std::pair<log::Level, std::string>> records;
    log::set_sink([&](log::Level level, const std::string& msg) { records.emplace_back(level, msg); });

    // Level parsing
    assert(log::level_from_string("debug") == log::Level::Debug);
    assert(log::level_from_string("WARNING") == log::Level::Warn);
    assert(log::level_from_string("Error") == log::Level::Error);
    assert(log::level_from_string("off") == log::Level::Off);
    assert(log::level_from_string("bogus") == log::Level::Info);
    assert(std::string(log::to_string(log::Level::Warn)) == "WARN");

    // Filtering
    log::set_level(log::Level::Warn);
    log::debug("hidden");
    log::info("hidden");
    log::warn("shown warn");
    log::error("shown error");
    assert(records.size() == 2);
    assert(records[0].first == log::Level::Warn);
    assert(records[0].second == "shown warn");
    assert(records[1].first == log::Level::Error);

    log::set_level(log::Level::Off);
    log::error("nothing");
    assert(records.size() == 2);

    // Concurrent writers are serialized through the sink
    records.clear();
    log::set_level(log::Level::Debug);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
        threads.emplace_back(
            []
            {
                for (int i = 0; i < 100; ++i)
                    log::debug("tick");
            });
    for (auto& th : threads)
        th.join();
    assert(records.size() == 400);

    // A sink may log and replace the sink without deadlocking
    records.clear();
    log::set_sink(
        [&](log::Level level, const std::string& msg)
        {
            records.emplace_back(level, msg);
            if (msg == "outer")
                log::info("nested");
            if (msg == "swap")
                log::set_sink([&](log::Level l, const std::string& m)
                              { records.emplace_back(l, "swapped " + m); });
        });
    log::info("outer");
    assert(records.size() == 2);
    assert(records[0].second == "outer");
    assert(records[1].second == "nested");
    log::info("swap");
    log::info("after");
    assert(records.size() == 4);
    assert(records[3].second == "swapped after");

    log::set_sink(nullptr);
    log::set_level(log::Level::Info);
    std::cout << "[PASS] log\n";
    return 0;
}
