#pragma once
#include "mcpserve/types.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace mcpserve
{

/// A failure reported by a tool handler. Sent to the client as a JSON-RPC
/// error in the application range; the session stays alive.
struct Failure
{
    std::string message;
    int code{error_code::ToolFailure};
    Json data{};

    Failure() = default;
    explicit Failure(std::string msg, int c = error_code::ToolFailure, Json d = Json())
        : message(std::move(msg)), code(c), data(std::move(d))
    {
    }
};

/// Success-or-failure result of a tool handler.
template <typename T>
class Outcome
{
  public:
    using value_type = T;

    Outcome(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Outcome(Failure failure) : state_(std::in_place_index<1>, std::move(failure)) {}

    static Outcome success(T value)
    {
        return Outcome(std::move(value));
    }
    static Outcome fail(std::string message, int code = error_code::ToolFailure)
    {
        return Outcome(Failure(std::move(message), code));
    }

    bool ok() const
    {
        return state_.index() == 0;
    }
    explicit operator bool() const
    {
        return ok();
    }

    const T& value() const
    {
        if (!ok())
            throw std::logic_error("Outcome holds a failure: " + failure().message);
        return std::get<0>(state_);
    }
    T& value()
    {
        if (!ok())
            throw std::logic_error("Outcome holds a failure: " + failure().message);
        return std::get<0>(state_);
    }
    const Failure& failure() const
    {
        if (ok())
            throw std::logic_error("Outcome holds a value");
        return std::get<1>(state_);
    }

  private:
    std::variant<T, Failure> state_;
};

using ToolResult = Outcome<Json>;

} // namespace mcpserve
