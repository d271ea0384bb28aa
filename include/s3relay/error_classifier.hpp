#pragma once

#include "s3relay/storage/object_store.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace s3relay {

enum class ErrorKind {
    Configuration,
    StorageService,
    Transient,
    ClientDisconnect,
    Internal
};

const char* error_kind_name(ErrorKind kind);

/// A failure mapped onto the HTTP surface: the status the caller sees and
/// whether trying the same request again could succeed.
struct ClassifiedError {
    ErrorKind kind = ErrorKind::Internal;
    int http_status = 500;
    std::string code;
    std::string message;
    bool retriable = false;
};

/// Map a storage failure to its client-facing form. Service errors keep the
/// backend's status and message; transport and local faults are mapped by
/// origin. Must not be called with a successful StorageError.
ClassifiedError classify(const StorageError& error);

/// {"error": {"kind", "code", "message", "retriable"}}
nlohmann::json to_json(const ClassifiedError& error);

/// Status code reported for a client that went away (nginx convention).
constexpr int STATUS_CLIENT_CLOSED = 499;

}  // namespace s3relay
