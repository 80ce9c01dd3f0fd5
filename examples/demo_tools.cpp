#include "demo_tools.hpp"

#include "mcpserve/outcome.hpp"

#include <limits>

namespace demo
{

using mcpserve::Outcome;
using mcpserve::tools::Toolset;

namespace
{

constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();

Outcome<std::int64_t> overflow()
{
    return Outcome<std::int64_t>::fail("Integer overflow");
}

Outcome<std::int64_t> checked_add(std::int64_t a, std::int64_t b)
{
    if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b))
        return overflow();
    return a + b;
}

Outcome<std::int64_t> checked_subtract(std::int64_t a, std::int64_t b)
{
    if ((b < 0 && a > kMax + b) || (b > 0 && a < kMin + b))
        return overflow();
    return a - b;
}

Outcome<std::int64_t> checked_multiply(std::int64_t a, std::int64_t b)
{
    if (a == 0 || b == 0)
        return std::int64_t{0};
    if (a > 0)
    {
        if (b > 0 ? a > kMax / b : b < kMin / a)
            return overflow();
    }
    else
    {
        if (b > 0 ? a < kMin / b : (a == kMin || b == kMin || -a > kMax / -b))
            return overflow();
    }
    return a * b;
}

} // namespace

Toolset make_calculator_toolset(const std::string& name_space)
{
    Toolset set(name_space.empty() ? mcpserve::tools::to_snake_case("Calculator") : name_space);

    set.add("add", "Add two numbers", {{"a", "First number"}, {"b", "Second number"}},
            &checked_add);
    set.add("subtract", "Subtract b from a", {{"a", "Number to subtract from"}, {"b", "Number to subtract"}},
            &checked_subtract);
    set.add("multiply", "Multiply two numbers", {{"a", "First factor"}, {"b", "Second factor"}},
            &checked_multiply);
    set.add("divide", "Divide a by b", {{"a", "Dividend"}, {"b", "Divisor"}},
            [](std::int64_t a, std::int64_t b) -> Outcome<double>
            {
                if (b == 0)
                    return Outcome<double>::fail("Cannot divide by zero");
                return static_cast<double>(a) / static_cast<double>(b);
            });
    return set;
}

Toolset make_counter_toolset(std::shared_ptr<Counter> counter)
{
    Toolset set(mcpserve::tools::to_snake_case("Counter"));
    set.add("get", "Get the current counter value", {}, counter, &Counter::get);
    set.add("increment", "Increment the counter and return the new value",
            {{"by", "Amount to add"}}, counter, &Counter::increment);
    return set;
}

} // namespace demo
