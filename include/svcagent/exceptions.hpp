#pragma once
#include <stdexcept>
#include <string>

namespace svcagent
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

/// Unsupported top-level protocol method.
struct MethodNotFoundError : public NotFoundError
{
    using NotFoundError::NotFoundError;
};

/// tools/call named a tool that is not registered.
struct ToolNotFoundError : public NotFoundError
{
    using NotFoundError::NotFoundError;
};

struct ValidationError : public Error
{
    using Error::Error;
};

/// Inbound payload could not be decoded into a call envelope.
struct ParseError : public Error
{
    using Error::Error;
};

struct ToolTimeoutError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

struct ConfigError : public Error
{
    using Error::Error;
};

} // namespace svcagent
