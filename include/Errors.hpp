#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind
{
    None,
    StreamUnavailable,   // cannot open / connect
    DecodeFailure,       // read error mid-stream
    PersistenceFailure   // store write failed
};

struct ConfigError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct StreamError : std::runtime_error
{
    StreamError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind(kind) {}

    ErrorKind kind;
};

struct PersistenceError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

inline const char* error_kind_name(ErrorKind k)
{
    switch (k) {
    case ErrorKind::None:               return "none";
    case ErrorKind::StreamUnavailable:  return "stream unavailable";
    case ErrorKind::DecodeFailure:      return "decode failure";
    case ErrorKind::PersistenceFailure: return "persistence failure";
    }
    return "unknown";
}
