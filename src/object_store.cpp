#include "s3relay/storage/object_store.hpp"
#include "s3relay/relay_config.hpp"

namespace s3relay {

const char* error_origin_name(ErrorOrigin origin) {
    switch (origin) {
        case ErrorOrigin::None: return "none";
        case ErrorOrigin::Service: return "service";
        case ErrorOrigin::Network: return "network";
        case ErrorOrigin::Configuration: return "configuration";
        case ErrorOrigin::LocalIo: return "local_io";
        case ErrorOrigin::ClientDisconnect: return "client_disconnect";
        case ErrorOrigin::Cancelled: return "cancelled";
        case ErrorOrigin::Internal: return "internal";
    }
    return "internal";
}

std::string StorageError::describe() const {
    std::string out = error_origin_name(origin);
    if (!code.empty()) out += "/" + code;
    if (http_status != 0) out += " (HTTP " + std::to_string(http_status) + ")";
    if (fault != net::TransportFault::None) {
        out += " [" + std::string(net::transport_fault_name(fault)) + "]";
    }
    out += ": " + message;
    return out;
}

StorageError StorageError::service(int status, const std::string& code, const std::string& message) {
    StorageError err;
    err.origin = ErrorOrigin::Service;
    err.http_status = status;
    err.code = code;
    err.message = message;
    return err;
}

StorageError StorageError::network(net::TransportFault fault, const std::string& message) {
    StorageError err;
    err.origin = ErrorOrigin::Network;
    err.fault = fault;
    err.message = message;
    return err;
}

StorageError StorageError::configuration(const std::string& message) {
    StorageError err;
    err.origin = ErrorOrigin::Configuration;
    err.message = message;
    return err;
}

StorageError StorageError::local_io(const std::string& message) {
    StorageError err;
    err.origin = ErrorOrigin::LocalIo;
    err.message = message;
    return err;
}

StorageError StorageError::client_disconnect(const std::string& message) {
    StorageError err;
    err.origin = ErrorOrigin::ClientDisconnect;
    err.message = message;
    return err;
}

StorageError StorageError::cancelled(const std::string& message) {
    StorageError err;
    err.origin = ErrorOrigin::Cancelled;
    err.message = message;
    return err;
}

StorageError StorageError::internal(const std::string& message) {
    StorageError err;
    err.origin = ErrorOrigin::Internal;
    err.message = message;
    return err;
}

std::string ByteRange::to_header() const {
    std::string header = "bytes=" + std::to_string(start) + "-";
    if (end) header += std::to_string(*end);
    return header;
}

std::shared_ptr<ObjectStore> ObjectStoreFactory::create(const BackendConfig& config) {
    if (config.type == "s3") return create_s3(config);
    if (config.type == "local") return create_local(config);
    throw ConfigurationError("unknown backend type: " + config.type);
}

} // namespace s3relay
