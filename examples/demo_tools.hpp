#pragma once
#include "mcpserve/tools/toolset.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace demo
{

/// add, subtract, multiply and divide over 64-bit integers.
/// Exposed as "<name_space>_add" etc.; the default namespace is "calculator".
mcpserve::tools::Toolset make_calculator_toolset(const std::string& name_space = "");

/// Shared counter; safe to call from several sessions at once.
class Counter
{
  public:
    explicit Counter(std::int64_t start = 0) : value_(start) {}

    std::int64_t get() const
    {
        return value_.load();
    }
    std::int64_t increment(std::int64_t by)
    {
        return value_.fetch_add(by) + by;
    }

  private:
    std::atomic<std::int64_t> value_;
};

/// counter_get and counter_increment bound to one shared Counter
mcpserve::tools::Toolset make_counter_toolset(std::shared_ptr<Counter> counter);

} // namespace demo
