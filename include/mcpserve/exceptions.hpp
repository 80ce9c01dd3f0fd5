#pragma once
#include <stdexcept>
#include <string>

namespace mcpserve
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

/// Arguments did not match a tool's declared parameters.
/// path() names the offending field, e.g. "arguments.point.x".
class DecodeError : public ValidationError
{
  public:
    DecodeError(std::string path, const std::string& message)
        : ValidationError(message + " at " + path), path_(std::move(path))
    {
    }

    const std::string& path() const
    {
        return path_;
    }

  private:
    std::string path_;
};

/// Invalid registration detected before serving; fatal at startup.
class ConfigurationError : public Error
{
  public:
    explicit ConfigurationError(const std::string& message) : Error(message) {}
    ConfigurationError(std::string name, const std::string& message)
        : Error(message), name_(std::move(name))
    {
    }

    const std::string& name() const
    {
        return name_;
    }

  private:
    std::string name_;
};

struct TransportError : public Error
{
    using Error::Error;
};

} // namespace mcpserve
