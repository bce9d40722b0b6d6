// server/errors.hpp
#pragma once
#include <stdexcept>
#include <string>

enum class DecodeErrorKind {
    LengthMismatch,
    MalformedPayload,
    MissingField,
    InvalidFlag,
};

enum class WriteErrorKind {
    BackendUnreachable,
    Timeout,
    Rejected,
};

const char* to_string(DecodeErrorKind kind);
const char* to_string(WriteErrorKind kind);

class DecodeError : public std::runtime_error {
private:
    DecodeErrorKind error_kind;

public:
    DecodeError(DecodeErrorKind kind, const std::string& what)
        : std::runtime_error(what), error_kind(kind) {}

    DecodeErrorKind kind() const { return error_kind; }
};

class WriteError : public std::runtime_error {
private:
    WriteErrorKind error_kind;

public:
    WriteError(WriteErrorKind kind, const std::string& what)
        : std::runtime_error(what), error_kind(kind) {}

    WriteErrorKind kind() const { return error_kind; }
};

class BindError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
