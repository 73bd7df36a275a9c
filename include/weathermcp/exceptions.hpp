#pragma once
#include <stdexcept>
#include <string>

namespace weathermcp
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

struct TransportError : public Error
{
    using Error::Error;
};

/// JSON-RPC error object returned by the peer.
struct RpcError : public Error
{
    RpcError(int code, const std::string& message) : Error(message), code(code) {}

    int code;
};

} // namespace weathermcp
