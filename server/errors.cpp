// server/errors.cpp
#include "errors.hpp"

const char* to_string(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::LengthMismatch: return "LengthMismatch";
        case DecodeErrorKind::MalformedPayload: return "MalformedPayload";
        case DecodeErrorKind::MissingField: return "MissingField";
        case DecodeErrorKind::InvalidFlag: return "InvalidFlag";
    }
    return "Unknown";
}

const char* to_string(WriteErrorKind kind) {
    switch (kind) {
        case WriteErrorKind::BackendUnreachable: return "BackendUnreachable";
        case WriteErrorKind::Timeout: return "Timeout";
        case WriteErrorKind::Rejected: return "Rejected";
    }
    return "Unknown";
}
