#pragma once

#include "s3relay/net/http.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace s3relay {

struct BackendConfig;

// Thrown when a backend configuration cannot be turned into a working client
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Where a failure came from. Service errors are explicit rejections by the
// backend; everything else is a fault on the way to it (or on our side).
enum class ErrorOrigin {
    None,
    Service,
    Network,
    Configuration,
    LocalIo,
    ClientDisconnect,
    Cancelled,
    Internal
};

const char* error_origin_name(ErrorOrigin origin);

// Failure record returned by every ObjectStore operation
struct StorageError {
    ErrorOrigin origin = ErrorOrigin::None;
    int http_status = 0;        // backend status (service errors)
    std::string code;           // backend error code, e.g. NoSuchKey, SlowDown
    std::string message;
    std::string request_id;
    net::TransportFault fault = net::TransportFault::None;

    bool ok() const { return origin == ErrorOrigin::None; }

    // "origin[/code]: message" for logs
    std::string describe() const;

    static StorageError service(int status, const std::string& code, const std::string& message);
    static StorageError network(net::TransportFault fault, const std::string& message);
    static StorageError configuration(const std::string& message);
    static StorageError local_io(const std::string& message);
    static StorageError client_disconnect(const std::string& message);
    static StorageError cancelled(const std::string& message);
    static StorageError internal(const std::string& message);
};

// Metadata about a stored object, as reported when a read is opened
struct ObjectInfo {
    std::string key;
    std::optional<uint64_t> size;          // bytes that will be delivered, when the backend says
    std::optional<uint64_t> total_size;    // full object size (ranged reads)
    std::optional<uint64_t> range_start;   // set for ranged reads
    std::string etag;
    std::string content_type = "application/octet-stream";
    std::string last_modified;             // RFC 7231 date when known
};

// Inclusive byte range; end unset means "to the end of the object"
struct ByteRange {
    uint64_t start = 0;
    std::optional<uint64_t> end;

    std::string to_header() const;
};

struct BucketInfo {
    std::string name;
    std::string creation_date;
};

struct ListEntry {
    std::string key;
    uint64_t size = 0;
    std::string last_modified;
    std::string etag;
    std::string storage_class;
};

struct ListOptions {
    std::string prefix;
    std::string delimiter = "/";
    uint32_t max_keys = 1000;
    std::string continuation_token;
};

struct ListResult {
    StorageError error;
    std::vector<ListEntry> objects;
    std::vector<std::string> prefixes;   // common prefixes ("folders")
    bool truncated = false;
    std::string next_continuation_token;
};

struct BucketListResult {
    StorageError error;
    std::vector<BucketInfo> buckets;
};

struct HeadResult {
    StorageError error;
    ObjectInfo info;
};

struct PutResult {
    StorageError error;
    std::string etag;
};

struct MultipartStart {
    StorageError error;
    std::string upload_id;
};

struct PartResult {
    StorageError error;
    std::string etag;
};

struct CompletedPart {
    int part_number = 0;
    std::string etag;
};

struct DeleteResult {
    StorageError error;
    size_t deleted = 0;
    std::vector<std::string> failed_keys;
};

struct GetStreamResult {
    StorageError error;
    ObjectInfo info;
    bool opened = false;          // on_open was called (headers may have gone out)
    uint64_t bytes_delivered = 0;
};

// Called once when the backend has accepted a read, before the first byte.
// Return false to abort the read.
using OpenCallback = std::function<bool(const ObjectInfo& info)>;

// Receives object bytes in order. Return false to abort the read.
using ChunkSink = std::function<bool(std::span<const uint8_t> chunk)>;

// Polled while a backend call is in flight; true cancels it.
using CancelCheck = std::function<bool()>;

// Abstract client for an S3-compatible object store.
// Implementations must be safe to call from many threads at once; a single
// instance is shared by every transfer holding the same registry snapshot.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    // Smallest part the backend accepts for all but the last part
    virtual size_t min_part_size() const { return 1; }

    virtual BucketListResult list_buckets() = 0;
    virtual StorageError create_bucket(const std::string& bucket) = 0;
    virtual StorageError delete_bucket(const std::string& bucket) = 0;

    virtual ListResult list_objects(const std::string& bucket, const ListOptions& options) = 0;

    virtual HeadResult head_object(const std::string& bucket, const std::string& key) = 0;

    // Streaming read. on_open fires once the backend accepted the request;
    // bytes then flow to sink as they arrive, with no intermediate buffering
    // beyond the transport's receive window.
    virtual GetStreamResult get_object(const std::string& bucket,
                                       const std::string& key,
                                       const std::optional<ByteRange>& range,
                                       const OpenCallback& on_open,
                                       const ChunkSink& sink,
                                       const CancelCheck& cancelled) = 0;

    // Single-request write for objects that fit in one part
    virtual PutResult put_object(const std::string& bucket,
                                 const std::string& key,
                                 std::span<const uint8_t> data,
                                 const std::string& content_type,
                                 const CancelCheck& cancelled) = 0;

    virtual MultipartStart create_multipart_upload(const std::string& bucket,
                                                   const std::string& key,
                                                   const std::string& content_type) = 0;

    virtual PartResult upload_part(const std::string& bucket,
                                   const std::string& key,
                                   const std::string& upload_id,
                                   int part_number,
                                   std::span<const uint8_t> data,
                                   const CancelCheck& cancelled) = 0;

    virtual PutResult complete_multipart_upload(const std::string& bucket,
                                                const std::string& key,
                                                const std::string& upload_id,
                                                const std::vector<CompletedPart>& parts) = 0;

    virtual StorageError abort_multipart_upload(const std::string& bucket,
                                                const std::string& key,
                                                const std::string& upload_id) = 0;

    // Server-side copy of a whole object; no bytes pass through the caller
    virtual PutResult copy_object(const std::string& source_bucket,
                                  const std::string& source_key,
                                  const std::string& bucket,
                                  const std::string& key) = 0;

    virtual StorageError delete_object(const std::string& bucket, const std::string& key) = 0;

    // Batch delete; keys that could not be removed are reported in failed_keys
    virtual DeleteResult delete_objects(const std::string& bucket,
                                        const std::vector<std::string>& keys) = 0;
};

// Factory for creating object stores from configuration
class ObjectStoreFactory {
public:
    // Dispatches on config.type. Throws ConfigurationError when the config
    // cannot produce a client.
    static std::shared_ptr<ObjectStore> create(const BackendConfig& config);

    static std::shared_ptr<ObjectStore> create_s3(const BackendConfig& config);
    static std::shared_ptr<ObjectStore> create_local(const BackendConfig& config);
};

} // namespace s3relay
