#pragma once

#include "s3relay/access_log.hpp"
#include "s3relay/backend_registry.hpp"
#include "s3relay/concurrency_gate.hpp"
#include "s3relay/progress_notifier.hpp"
#include "s3relay/rate_limiter.hpp"
#include "s3relay/relay_config.hpp"
#include "s3relay/transfer_engine.hpp"
#include "s3relay/transfer_jobs.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace s3relay {

class MetricsExporter;
struct HttpExchange;

// --- Request validation (shared with tests) ---

/// S3 bucket naming rules: 3-63 of [a-z0-9-], alphanumeric at both ends,
/// no "--", no "xn--" prefix. Dots are refused, which rules out
/// IP-shaped names.
bool valid_bucket_name(const std::string& name);

/// Decode a base64 listing prefix from a path segment (URL-escaped base64
/// is accepted). At most 2048 encoded / 1024 decoded bytes of valid UTF-8,
/// with no ".." or NUL. Empty optional when invalid.
std::optional<std::string> decode_prefix(const std::string& segment);

/// Decode a base64 object key from a path segment. The key must be
/// non-empty, at most 1024 bytes, valid UTF-8 and free of NUL.
std::optional<std::string> decode_key(const std::string& segment);

/// Well-formed UTF-8: no overlong forms, surrogates or code points past
/// U+10FFFF.
bool valid_utf8(const std::string& text);

/// Content-Disposition value for a download of `key`. The quoted filename
/// holds printable ASCII only; the exact name follows as an RFC 8187
/// `filename*` parameter.
std::string content_disposition(const std::string& key, bool attachment);

/// Up to 512 characters of [A-Za-z0-9+/=_.-].
bool valid_continuation_token(const std::string& token);

/// "bytes=start-end" or "bytes=start-". Suffix and multi-range requests
/// are not supported and yield an empty optional.
std::optional<ByteRange> parse_range_header(const std::string& value);

/// HTTP/1.1 front end: one thread per connection, blocking socket I/O.
/// Transfers block their connection thread inside the TransferEngine; the
/// ConcurrencyGate, not the number of connections, bounds backend load.
class RelayServer {
public:
    RelayServer(const RelayConfig& config,
                BackendRegistry& registry,
                ConcurrencyGate& gate,
                ProgressNotifier& notifier,
                TransferEngine& engine,
                AccessLog& access_log);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Bind, listen and start accepting. Returns error message or empty string.
    std::string start();

    /// Stop accepting, cancel running transfers and wait for connections
    /// to drain.
    void stop();

    bool is_running() const { return running_.load(); }

    /// Bound port (useful when configured with port 0).
    uint16_t port() const { return bound_port_; }

    JobManager& jobs() { return jobs_; }

private:
    void accept_loop();
    void handle_connection(std::unique_ptr<boost::asio::ip::tcp::socket> socket);
    void dispatch(HttpExchange& ex);

    void handle_buckets(HttpExchange& ex);
    void handle_objects(HttpExchange& ex);
    void handle_listing(HttpExchange& ex, const std::string& bucket, const std::string& b64prefix);
    void handle_download(HttpExchange& ex, const std::string& bucket, const std::string& b64key,
                         bool attachment);
    void handle_upload(HttpExchange& ex, const std::string& bucket, const std::string& b64key);
    void handle_delete(HttpExchange& ex, const std::string& bucket, const std::string& b64key);
    void handle_transfers(HttpExchange& ex);
    void handle_events(HttpExchange& ex, const std::string& ticket_id);
    void handle_settings(HttpExchange& ex);
    void handle_transfer_jobs(HttpExchange& ex);
    void handle_job_create(HttpExchange& ex);
    void handle_job_progress(HttpExchange& ex, const std::string& job_id);
    void handle_job_cleanup(HttpExchange& ex, const std::string& job_id);
    void handle_check_conflicts(HttpExchange& ex);

    /// Count the request against `operation` for this client and answer 429
    /// when it is over `max` per window. True when the request was refused.
    bool rate_limited(HttpExchange& ex, const std::string& operation, uint64_t max);

    /// Active client, or a 500 answered on `ex` when none is configured.
    std::shared_ptr<const ActiveClient> active_client(HttpExchange& ex);

    /// Replace the backend config, answering 400 on a rejected config.
    void apply_backend(HttpExchange& ex, const BackendConfig& next);

    RelayConfig config_;
    BackendRegistry& registry_;
    ConcurrencyGate& gate_;
    ProgressNotifier& notifier_;
    TransferEngine& engine_;
    AccessLog& access_log_;
    MetricsExporter* metrics_ = nullptr;
    RateLimiter rate_limiter_;
    JobManager jobs_;

    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t bound_port_ = 0;

    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    // Open connection sockets, shut down on stop() to unblock their threads
    std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    std::unordered_set<int> connection_fds_;
    size_t connection_count_ = 0;
};

}  // namespace s3relay
