#include "s3relay/error_classifier.hpp"

#include <array>
#include <string_view>

namespace s3relay {

namespace {

constexpr std::array<std::string_view, 8> RETRIABLE_CODES = {
    "SlowDown",
    "Throttling",
    "ThrottlingException",
    "TooManyRequests",
    "RequestLimitExceeded",
    "RequestTimeout",
    "InternalError",
    "ServiceUnavailable",
};

bool retriable_status(int status) {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

bool retriable_code(const std::string& code) {
    for (auto c : RETRIABLE_CODES) {
        if (code == c) return true;
    }
    return false;
}

// Status for a service error whose response carried none (e.g. an <Error>
// document inside a 200 CompleteMultipartUpload response)
int status_for_code(const std::string& code) {
    if (code == "NoSuchKey" || code == "NoSuchBucket" || code == "NoSuchUpload") return 404;
    if (code == "AccessDenied" || code == "InvalidAccessKeyId" ||
        code == "SignatureDoesNotMatch") return 403;
    if (code == "BucketAlreadyExists" || code == "BucketAlreadyOwnedByYou" ||
        code == "BucketNotEmpty") return 409;
    if (code == "InvalidRange") return 416;
    if (code == "SlowDown" || code == "TooManyRequests") return 503;
    if (code == "InternalError") return 500;
    if (code == "ServiceUnavailable") return 503;
    if (code == "RequestTimeout") return 400;
    if (code == "InvalidPart" || code == "InvalidPartOrder" || code == "EntityTooSmall" ||
        code == "MalformedXML" || code == "InvalidArgument" || code == "InvalidBucketName") return 400;
    return 502;
}

ClassifiedError make(ErrorKind kind, int status, const std::string& code,
                     const std::string& message, bool retriable) {
    ClassifiedError out;
    out.kind = kind;
    out.http_status = status;
    out.code = code;
    out.message = message;
    out.retriable = retriable;
    return out;
}

ClassifiedError classify_network(const StorageError& error) {
    std::string code = net::transport_fault_name(error.fault);
    switch (error.fault) {
        case net::TransportFault::Timeout:
            return make(ErrorKind::Transient, 504, code, error.message, true);
        case net::TransportFault::ConnectionReset:
            return make(ErrorKind::Transient, 502, code, error.message, true);
        case net::TransportFault::Aborted:
            return make(ErrorKind::ClientDisconnect, STATUS_CLIENT_CLOSED, code, error.message, false);
        case net::TransportFault::ConnectionRefused:
        case net::TransportFault::Resolve:
        case net::TransportFault::Tls:
        case net::TransportFault::Other:
        case net::TransportFault::None:
            break;
    }
    return make(ErrorKind::Transient, 502, code, error.message, false);
}

}  // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "ConfigurationError";
        case ErrorKind::StorageService: return "StorageServiceError";
        case ErrorKind::Transient: return "TransientError";
        case ErrorKind::ClientDisconnect: return "ClientDisconnectError";
        case ErrorKind::Internal: return "InternalError";
    }
    return "InternalError";
}

ClassifiedError classify(const StorageError& error) {
    switch (error.origin) {
        case ErrorOrigin::Service: {
            int status = error.http_status != 0 ? error.http_status : status_for_code(error.code);
            bool retriable = retriable_code(error.code) || retriable_status(status);
            std::string message = error.message.empty() ? error.code : error.message;
            return make(ErrorKind::StorageService, status, error.code, message, retriable);
        }
        case ErrorOrigin::Network:
            return classify_network(error);
        case ErrorOrigin::Configuration:
            return make(ErrorKind::Configuration, 500, "InvalidConfiguration", error.message, false);
        case ErrorOrigin::LocalIo:
            return make(ErrorKind::Internal, 500, "LocalIoError", error.message, false);
        case ErrorOrigin::ClientDisconnect:
            return make(ErrorKind::ClientDisconnect, STATUS_CLIENT_CLOSED, "ClientDisconnected",
                        error.message, false);
        case ErrorOrigin::Cancelled:
            return make(ErrorKind::ClientDisconnect, STATUS_CLIENT_CLOSED, "TransferCancelled",
                        error.message, false);
        case ErrorOrigin::Internal:
        case ErrorOrigin::None:
            break;
    }
    return make(ErrorKind::Internal, 500, "InternalError",
                error.message.empty() ? "internal error" : error.message, false);
}

nlohmann::json to_json(const ClassifiedError& error) {
    return {
        {"error", {
            {"kind", error_kind_name(error.kind)},
            {"code", error.code},
            {"message", error.message},
            {"retriable", error.retriable},
        }},
    };
}

}  // namespace s3relay
