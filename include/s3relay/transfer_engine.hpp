#pragma once

#include "s3relay/backend_registry.hpp"
#include "s3relay/concurrency_gate.hpp"
#include "s3relay/error_classifier.hpp"
#include "s3relay/progress_notifier.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace s3relay {

class MetricsExporter;

enum class TransferDirection {
    Upload,
    Download
};

const char* transfer_direction_name(TransferDirection direction);

/// Point-in-time copy of a ticket, for listings and the API.
struct TicketInfo {
    std::string id;
    TransferDirection direction = TransferDirection::Upload;
    std::string bucket;
    std::string key;
    std::optional<uint64_t> size;
    TransferPhase phase = TransferPhase::Queued;
    uint64_t bytes_transferred = 0;
    bool cancel_requested = false;
    std::chrono::system_clock::time_point created;
};

nlohmann::json to_json(const TicketInfo& info);

/// Live state of one transfer. Written by the transfer's own thread; read
/// by listings and by cancel() from any thread.
class TransferTicket {
public:
    TransferTicket(std::string id, TransferDirection direction,
                   std::string bucket, std::string key, std::optional<uint64_t> size);

    const std::string& id() const { return id_; }
    TransferDirection direction() const { return direction_; }
    const std::string& bucket() const { return bucket_; }
    const std::string& key() const { return key_; }

    TransferPhase phase() const { return phase_.load(); }
    uint64_t bytes() const { return bytes_.load(); }
    std::optional<uint64_t> size() const;
    bool cancel_requested() const { return cancel_.load(); }

    void request_cancel() { cancel_.store(true); }

    TicketInfo snapshot() const;

private:
    friend class TransferEngine;

    const std::string id_;
    const TransferDirection direction_;
    const std::string bucket_;
    const std::string key_;
    const std::chrono::system_clock::time_point created_;

    std::atomic<TransferPhase> phase_{TransferPhase::Queued};
    std::atomic<uint64_t> bytes_{0};
    std::atomic<uint64_t> size_{0};
    std::atomic<bool> has_size_{false};
    std::atomic<bool> cancel_{false};
};

/// Inbound side of an upload (normally the HTTP request body).
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Read up to buffer.size() bytes, blocking until at least one byte is
    /// available. Returns 0 at end of stream. On failure returns 0 and sets
    /// `error` (ClientDisconnect for a peer that went away, Network/Timeout
    /// for a stalled peer).
    virtual size_t read(std::span<uint8_t> buffer, StorageError& error) = 0;
};

/// Outbound side of a download (normally the HTTP response).
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /// The backend accepted the read: emit status and headers. Return false
    /// when the destination is already gone.
    virtual bool begin(const ObjectInfo& info) = 0;

    /// Deliver bytes in order. Return false when the destination is gone.
    virtual bool write(std::span<const uint8_t> chunk) = 0;

    /// Every byte was delivered; complete the response normally.
    virtual bool finish() = 0;

    /// Terminate the response so the receiver cannot mistake it for a
    /// complete one (close without the final chunk / before Content-Length).
    virtual void abort() = 0;
};

struct UploadRequest {
    std::string bucket;
    std::string key;
    std::string content_type;
    std::optional<uint64_t> size;   // declared Content-Length, if any
};

struct DownloadRequest {
    std::string bucket;
    std::string key;
    std::optional<ByteRange> range;
};

struct TransferOutcome {
    std::string ticket_id;
    TransferPhase phase = TransferPhase::Queued;
    uint64_t bytes = 0;
    std::optional<ClassifiedError> error;
    StorageError cause;             // unclassified failure, for logs
    std::string etag;               // upload
    ObjectInfo info;                // download
    bool headers_sent = false;      // download: sink.begin() succeeded

    bool ok() const { return phase == TransferPhase::Done; }
};

/// Emits a progress event when either the byte threshold or the time
/// interval has elapsed since the last one.
class ProgressThrottle {
public:
    ProgressThrottle(uint64_t byte_threshold, std::chrono::milliseconds interval)
        : byte_threshold_(byte_threshold), interval_(interval) {}

    bool should_emit(uint64_t bytes, std::chrono::steady_clock::time_point now);

    /// Record that an event was emitted outside should_emit (phase change).
    void mark(uint64_t bytes, std::chrono::steady_clock::time_point now);

private:
    uint64_t byte_threshold_;
    std::chrono::milliseconds interval_;
    uint64_t last_bytes_ = 0;
    std::optional<std::chrono::steady_clock::time_point> last_time_;
};

struct EngineConfig {
    size_t part_size = constants::DEFAULT_PART_SIZE;
    uint64_t progress_bytes = constants::DEFAULT_PROGRESS_BYTES;
    std::chrono::milliseconds progress_interval{constants::DEFAULT_PROGRESS_INTERVAL_MS};
    std::chrono::milliseconds cancel_poll{250};   // how often a queued transfer checks for cancel
};

/// Runs uploads and downloads as continuous byte streams between a
/// ByteSource/ByteSink and the active object store, one gate slot each.
///
/// Upload:   Queued -> Admitted -> Streaming -> Committing -> Done | Failed
/// Download: Queued -> Admitted -> Opening -> Streaming -> Done | Failed
///
/// Every transfer snapshots the active backend client when it is admitted
/// and keeps it until it ends, whatever happens to the registry meanwhile.
/// No failure is retried here; the classified error says whether a retry
/// by the caller makes sense.
class TransferEngine {
public:
    TransferEngine(BackendRegistry& registry,
                   ConcurrencyGate& gate,
                   ProgressNotifier& notifier,
                   const EngineConfig& config);

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Register a new Queued ticket so its id can be handed out (and
    /// subscribed to) before the transfer is admitted.
    std::shared_ptr<TransferTicket> create_ticket(TransferDirection direction,
                                                  const std::string& bucket,
                                                  const std::string& key,
                                                  std::optional<uint64_t> size = std::nullopt);

    /// Stream `source` into bucket/key. Blocks until the transfer ends.
    /// Whatever happens in between, including an exception from the source
    /// or the store, the ticket is retired and its progress stream closed.
    TransferOutcome upload(const std::shared_ptr<TransferTicket>& ticket,
                           ByteSource& source,
                           const UploadRequest& request);

    /// Stream bucket/key (optionally a range) into `sink`. Blocks until the
    /// transfer ends. When the outcome has an error and headers_sent is
    /// false, nothing was written to the sink and the caller may report the
    /// error itself; otherwise the sink has been aborted.
    TransferOutcome download(const std::shared_ptr<TransferTicket>& ticket,
                             ByteSink& sink,
                             const DownloadRequest& request);

    /// Ask a running or queued transfer to stop. False for unknown ids.
    bool cancel(const std::string& ticket_id);

    std::vector<TicketInfo> active() const;
    std::optional<TicketInfo> find(const std::string& ticket_id) const;

    const EngineConfig& config() const { return config_; }

private:
    std::string next_ticket_id();

    std::optional<ConcurrencyGate::Slot> admit(TransferTicket& ticket);
    void set_phase(TransferTicket& ticket, TransferPhase phase, ProgressThrottle& throttle);
    void add_bytes(TransferTicket& ticket, uint64_t n, ProgressThrottle& throttle);
    void publish(const TransferTicket& ticket, const std::string& error = {});
    TransferOutcome finish(TransferTicket& ticket, TransferOutcome outcome, StorageError error,
                           std::chrono::steady_clock::time_point started);

    TransferOutcome stream_upload(TransferTicket& ticket, ByteSource& source,
                                  const UploadRequest& request,
                                  std::chrono::steady_clock::time_point started);
    TransferOutcome stream_download(TransferTicket& ticket, ByteSink& sink,
                                    const DownloadRequest& request,
                                    std::chrono::steady_clock::time_point started,
                                    bool& headers_sent);

    TransferOutcome run_upload(TransferTicket& ticket, ByteSource& source,
                               const UploadRequest& request, ObjectStore& store,
                               ProgressThrottle& throttle);

    BackendRegistry& registry_;
    ConcurrencyGate& gate_;
    ProgressNotifier& notifier_;
    EngineConfig config_;
    MetricsExporter* metrics_ = nullptr;

    std::atomic<uint64_t> next_id_{1};

    mutable std::mutex tickets_mutex_;
    std::unordered_map<std::string, std::shared_ptr<TransferTicket>> tickets_;
};

}  // namespace s3relay
