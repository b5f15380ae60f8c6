#pragma once

#include <string>
#include <utility>

enum class ErrorKind {
    None,
    Configuration,
    Client,
    Transfer,
    Archive,
    Provider
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Configuration:
            return "configuration";
        case ErrorKind::Client:
            return "client";
        case ErrorKind::Transfer:
            return "transfer";
        case ErrorKind::Archive:
            return "archive";
        case ErrorKind::Provider:
            return "provider";
    }
    return "unknown";
}

struct OperationResult {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    static OperationResult Success() {
        return {};
    }

    static OperationResult Failure(ErrorKind kind, std::string message) {
        OperationResult result;
        result.kind = kind;
        result.message = std::move(message);
        return result;
    }

    bool Ok() const {
        return kind == ErrorKind::None;
    }

    explicit operator bool() const {
        return Ok();
    }

    std::string Describe() const {
        if (Ok()) {
            return "ok";
        }
        return std::string(ToString(kind)) + " error: " + message;
    }
};
