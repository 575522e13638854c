#pragma once

#include <expected>
#include <string>

enum class ErrorKind { Initialization, EngineInvocation, SessionClosed, BackendLoad };

struct GateError {
    ErrorKind kind;
    std::string message;
    // Model path, asset path or "input stream" for Initialization errors.
    std::string source;
};

template <typename T>
using GateResult = std::expected<T, GateError>;

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Initialization: return "initialization";
        case ErrorKind::EngineInvocation: return "engine invocation";
        case ErrorKind::SessionClosed: return "session closed";
        case ErrorKind::BackendLoad: return "backend load";
    }
    return "unknown";
}
