#pragma once

#include "s3relay/constants.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace s3relay {

/// Connection settings for the object-storage backend ("s3" or "local").
/// Treated as immutable once handed to the BackendRegistry: an update builds
/// a new BackendConfig and replaces the old one wholesale.
struct BackendConfig {
    std::string type = "s3";
    std::string endpoint;         // Empty for AWS, custom for MinIO/Ceph/etc
    std::string access_key;
    std::string secret_key;
    std::string session_token;    // STS/temporary credentials
    std::string region = constants::DEFAULT_REGION;
    std::string default_bucket;
    std::string http_proxy;
    std::string https_proxy;
    std::filesystem::path local_root;  // Root directory for the "local" backend
    bool use_path_style = true;
    bool verify_ssl = true;
    bool unsigned_payload = false;     // Skip SHA-256 payload hashing on part uploads
    uint32_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECONDS;
    uint32_t stall_timeout_secs = constants::DEFAULT_STALL_TIMEOUT_SECONDS;

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;

    /// One-line description with secrets masked, for logs.
    std::string summary() const;

    /// Proxy URL that applies to the configured endpoint scheme.
    std::string proxy_for_endpoint() const;

    bool operator==(const BackendConfig&) const = default;
};

/// Serialize a backend config. Secrets are replaced by "****" when masked.
nlohmann::json backend_to_json(const BackendConfig& config, bool mask_secrets);

/// Overlay the fields present in `j` onto `config`. Accepts both the
/// snake_case file keys and the camelCase keys used by the settings API
/// (accessKeyId, secretAccessKey, region, endpoint, defaultBucket,
/// httpProxy, httpsProxy). Returns error message or empty string.
std::string backend_from_json(const nlohmann::json& j, BackendConfig& config);

/// Configuration for the s3-relay daemon.
struct RelayConfig {
    // HTTP listener
    std::string listen_address = constants::DEFAULT_LISTEN_ADDRESS;
    uint16_t port = constants::DEFAULT_SERVER_PORT;

    // Storage backend
    BackendConfig backend;

    // Transfers
    size_t max_concurrent_transfers = constants::DEFAULT_MAX_CONCURRENT_TRANSFERS;
    size_t part_size = constants::DEFAULT_PART_SIZE;
    uint64_t progress_bytes = constants::DEFAULT_PROGRESS_BYTES;
    std::chrono::milliseconds progress_interval{constants::DEFAULT_PROGRESS_INTERVAL_MS};
    size_t subscriber_queue_depth = constants::DEFAULT_SUBSCRIBER_QUEUE_DEPTH;

    // Directories reachable by transfer jobs as "local-0", "local-1", ...
    std::vector<std::filesystem::path> local_paths;

    // Per-client limits, requests per window (0 = unlimited)
    uint64_t upload_rate_limit = constants::DEFAULT_UPLOAD_RATE_LIMIT;
    uint64_t transfer_rate_limit = constants::DEFAULT_TRANSFER_RATE_LIMIT;
    std::chrono::milliseconds rate_limit_window{constants::DEFAULT_RATE_LIMIT_WINDOW_MS};

    // Daemon
    bool daemonize = false;
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;
    std::filesystem::path log_dir = constants::DEFAULT_LOG_DIR;  // access.log lives here
    bool access_log_enabled = true;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments, after overlaying
    /// the environment (AWS_*, MAX_CONCURRENT_TRANSFERS, HTTP(S)_PROXY, PORT, IP,
    /// LOCAL_STORAGE_PATHS).
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<RelayConfig> from_args(int argc, char* argv[]);

    /// Overlay environment variables onto current values.
    /// Returns error message or empty string.
    std::string load_env();

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace s3relay
