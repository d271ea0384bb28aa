#include "s3relay/transfer_engine.hpp"
#include "s3relay/log.hpp"
#include "s3relay/metrics.hpp"

#include <algorithm>
#include <functional>

namespace s3relay {

const char* transfer_direction_name(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}

nlohmann::json to_json(const TicketInfo& info) {
    nlohmann::json j;
    j["id"] = info.id;
    j["direction"] = transfer_direction_name(info.direction);
    j["bucket"] = info.bucket;
    j["key"] = info.key;
    j["size"] = info.size ? nlohmann::json(*info.size) : nlohmann::json(nullptr);
    j["phase"] = transfer_phase_name(info.phase);
    j["bytesTransferred"] = info.bytes_transferred;
    j["cancelRequested"] = info.cancel_requested;
    j["createdAt"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        info.created.time_since_epoch()).count();
    return j;
}

// --- TransferTicket ---

TransferTicket::TransferTicket(std::string id, TransferDirection direction,
                               std::string bucket, std::string key,
                               std::optional<uint64_t> size)
    : id_(std::move(id))
    , direction_(direction)
    , bucket_(std::move(bucket))
    , key_(std::move(key))
    , created_(std::chrono::system_clock::now()) {
    if (size) {
        size_.store(*size);
        has_size_.store(true);
    }
}

std::optional<uint64_t> TransferTicket::size() const {
    if (!has_size_.load()) return std::nullopt;
    return size_.load();
}

TicketInfo TransferTicket::snapshot() const {
    TicketInfo info;
    info.id = id_;
    info.direction = direction_;
    info.bucket = bucket_;
    info.key = key_;
    info.size = size();
    info.phase = phase();
    info.bytes_transferred = bytes();
    info.cancel_requested = cancel_requested();
    info.created = created_;
    return info;
}

// --- ProgressThrottle ---

bool ProgressThrottle::should_emit(uint64_t bytes, std::chrono::steady_clock::time_point now) {
    bool due = bytes - last_bytes_ >= byte_threshold_ ||
               !last_time_ || now - *last_time_ >= interval_;
    if (due) mark(bytes, now);
    return due;
}

void ProgressThrottle::mark(uint64_t bytes, std::chrono::steady_clock::time_point now) {
    last_bytes_ = bytes;
    last_time_ = now;
}

// --- TransferEngine ---

TransferEngine::TransferEngine(BackendRegistry& registry,
                               ConcurrencyGate& gate,
                               ProgressNotifier& notifier,
                               const EngineConfig& config)
    : registry_(registry)
    , gate_(gate)
    , notifier_(notifier)
    , config_(config) {}

std::string TransferEngine::next_ticket_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "transfer-" + std::to_string(ms) + "-" + std::to_string(next_id_.fetch_add(1));
}

std::shared_ptr<TransferTicket> TransferEngine::create_ticket(TransferDirection direction,
                                                              const std::string& bucket,
                                                              const std::string& key,
                                                              std::optional<uint64_t> size) {
    auto ticket = std::make_shared<TransferTicket>(next_ticket_id(), direction, bucket, key, size);
    {
        std::lock_guard lock(tickets_mutex_);
        tickets_[ticket->id()] = ticket;
    }
    notifier_.open(ticket->id());
    log_debug("Ticket %s: %s %s/%s queued", ticket->id().c_str(),
              transfer_direction_name(direction), bucket.c_str(), key.c_str());
    return ticket;
}

bool TransferEngine::cancel(const std::string& ticket_id) {
    std::shared_ptr<TransferTicket> ticket;
    {
        std::lock_guard lock(tickets_mutex_);
        auto it = tickets_.find(ticket_id);
        if (it == tickets_.end()) return false;
        ticket = it->second;
    }
    ticket->request_cancel();
    log_info("Ticket %s: cancel requested", ticket_id.c_str());
    return true;
}

std::vector<TicketInfo> TransferEngine::active() const {
    std::vector<TicketInfo> out;
    {
        std::lock_guard lock(tickets_mutex_);
        out.reserve(tickets_.size());
        for (const auto& [id, ticket] : tickets_) {
            out.push_back(ticket->snapshot());
        }
    }
    std::sort(out.begin(), out.end(),
              [](const TicketInfo& a, const TicketInfo& b) { return a.created < b.created; });
    return out;
}

std::optional<TicketInfo> TransferEngine::find(const std::string& ticket_id) const {
    std::lock_guard lock(tickets_mutex_);
    auto it = tickets_.find(ticket_id);
    if (it == tickets_.end()) return std::nullopt;
    return it->second->snapshot();
}

void TransferEngine::publish(const TransferTicket& ticket, const std::string& error) {
    ProgressEvent event;
    event.ticket_id = ticket.id();
    event.bytes_transferred = ticket.bytes();
    event.total_bytes = ticket.size();
    event.phase = ticket.phase();
    event.error = error;
    notifier_.publish(event);
}

void TransferEngine::set_phase(TransferTicket& ticket, TransferPhase phase, ProgressThrottle& throttle) {
    ticket.phase_.store(phase);
    throttle.mark(ticket.bytes(), std::chrono::steady_clock::now());
    publish(ticket);
}

void TransferEngine::add_bytes(TransferTicket& ticket, uint64_t n, ProgressThrottle& throttle) {
    uint64_t total = ticket.bytes_.fetch_add(n) + n;
    if (throttle.should_emit(total, std::chrono::steady_clock::now())) {
        publish(ticket);
    }
}

std::optional<ConcurrencyGate::Slot> TransferEngine::admit(TransferTicket& ticket) {
    auto wait_start = std::chrono::steady_clock::now();
    auto slot = gate_.acquire_unless([&ticket] { return ticket.cancel_requested(); },
                                     config_.cancel_poll);
    if (!slot) return std::nullopt;
    if (metrics_) {
        metrics_->gate_wait_duration().Observe(std::chrono::duration<double>(
            std::chrono::steady_clock::now() - wait_start).count());
    }
    return slot;
}

TransferOutcome TransferEngine::finish(TransferTicket& ticket, TransferOutcome outcome,
                                       StorageError error,
                                       std::chrono::steady_clock::time_point started) {
    // A cancelled transfer fails as cancelled, whatever the backend call
    // that was interrupted reported
    if (!error.ok() && ticket.cancel_requested() && error.origin != ErrorOrigin::Cancelled) {
        error = StorageError::cancelled("transfer cancelled: " + error.message);
    }

    outcome.ticket_id = ticket.id();
    outcome.bytes = ticket.bytes();
    std::string error_message;

    if (error.ok()) {
        ticket.phase_.store(TransferPhase::Done);
        outcome.phase = TransferPhase::Done;
        log_info("Ticket %s: %s %s/%s done, %llu bytes", ticket.id().c_str(),
                 transfer_direction_name(ticket.direction()), ticket.bucket().c_str(),
                 ticket.key().c_str(), static_cast<unsigned long long>(outcome.bytes));
    } else {
        ticket.phase_.store(TransferPhase::Failed);
        outcome.phase = TransferPhase::Failed;
        outcome.cause = error;
        outcome.error = classify(error);
        error_message = outcome.error->message;
        if (outcome.error->kind == ErrorKind::ClientDisconnect) {
            log_info("Ticket %s: %s %s/%s stopped: %s", ticket.id().c_str(),
                     transfer_direction_name(ticket.direction()), ticket.bucket().c_str(),
                     ticket.key().c_str(), error.describe().c_str());
        } else {
            log_error("Ticket %s: %s %s/%s failed after %llu bytes: %s", ticket.id().c_str(),
                      transfer_direction_name(ticket.direction()), ticket.bucket().c_str(),
                      ticket.key().c_str(), static_cast<unsigned long long>(outcome.bytes),
                      error.describe().c_str());
        }
    }

    publish(ticket, error_message);
    notifier_.close(ticket.id());
    {
        std::lock_guard lock(tickets_mutex_);
        tickets_.erase(ticket.id());
    }

    if (metrics_) {
        double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        metrics_->record_transfer(ticket.direction(), outcome.ok(), outcome.bytes, secs);
        if (outcome.error) metrics_->errors_total(outcome.error->kind).Increment();
    }
    return outcome;
}

// --- Upload ---

namespace {

// Fill `window` from the source starting at `offset`; returns the new fill
// level. Stops when the window is full, the source is exhausted (eof set)
// or reading fails (error set).
size_t fill_window(ByteSource& source, std::vector<uint8_t>& window, size_t offset, bool& eof,
                   StorageError& error, const std::function<bool(size_t)>& on_read) {
    size_t filled = offset;
    while (filled < window.size()) {
        size_t n = source.read(std::span<uint8_t>(window.data() + filled, window.size() - filled), error);
        if (!error.ok()) return filled;
        if (n == 0) {
            eof = true;
            break;
        }
        filled += n;
        if (!on_read(n)) {
            error = StorageError::cancelled("transfer cancelled");
            return filled;
        }
    }
    return filled;
}

}  // namespace

TransferOutcome TransferEngine::upload(const std::shared_ptr<TransferTicket>& ticket,
                                       ByteSource& source,
                                       const UploadRequest& request) {
    auto started = std::chrono::steady_clock::now();
    try {
        return stream_upload(*ticket, source, request, started);
    } catch (const std::exception& e) {
        // The slot was released while unwinding; the ticket still has to end
        return finish(*ticket, {}, StorageError::internal(std::string("upload aborted: ") + e.what()),
                      started);
    }
}

TransferOutcome TransferEngine::stream_upload(TransferTicket& ticket, ByteSource& source,
                                              const UploadRequest& request,
                                              std::chrono::steady_clock::time_point started) {
    ProgressThrottle throttle(config_.progress_bytes, config_.progress_interval);
    publish(ticket);

    auto slot = admit(ticket);
    if (!slot) {
        return finish(ticket, {}, StorageError::cancelled("cancelled while queued"), started);
    }
    set_phase(ticket, TransferPhase::Admitted, throttle);

    auto client = registry_.get();
    if (!client) {
        return finish(ticket, {}, StorageError::configuration("no storage backend configured"), started);
    }

    // The snapshot keeps this client alive even if the registry swaps it
    auto outcome = run_upload(ticket, source, request, *client->store, throttle);
    StorageError error = outcome.cause;
    outcome.cause = {};
    slot->release();
    return finish(ticket, std::move(outcome), std::move(error), started);
}

TransferOutcome TransferEngine::run_upload(TransferTicket& ticket, ByteSource& source,
                                           const UploadRequest& request, ObjectStore& store,
                                           ProgressThrottle& throttle) {
    TransferOutcome outcome;
    size_t window_size = std::max(config_.part_size, store.min_part_size());

    if (request.size && *request.size > static_cast<uint64_t>(window_size) * constants::S3_MAX_PART_COUNT) {
        outcome.cause = StorageError::service(400, "EntityTooLarge",
            "object exceeds " + std::to_string(constants::S3_MAX_PART_COUNT) + " parts of " +
            std::to_string(window_size) + " bytes");
        return outcome;
    }

    auto cancelled = [&ticket] { return ticket.cancel_requested(); };
    auto on_read = [&](size_t n) {
        add_bytes(ticket, n, throttle);
        return !ticket.cancel_requested();
    };

    // A declared size that fits one window needs no bigger buffer than that
    size_t initial = window_size;
    if (request.size && *request.size < window_size) {
        initial = static_cast<size_t>(*request.size) + 1;
    }
    std::vector<uint8_t> window(initial);

    set_phase(ticket, TransferPhase::Streaming, throttle);

    bool eof = false;
    size_t filled = fill_window(source, window, 0, eof, outcome.cause, on_read);
    if (!outcome.cause.ok()) return outcome;

    if (!eof && window.size() < window_size) {
        // Declared size was short; continue in full windows
        window.resize(window_size);
        filled = fill_window(source, window, filled, eof, outcome.cause, on_read);
        if (!outcome.cause.ok()) return outcome;
    }

    if (eof) {
        set_phase(ticket, TransferPhase::Committing, throttle);
        auto put = store.put_object(request.bucket, request.key,
                                    std::span<const uint8_t>(window.data(), filled),
                                    request.content_type, cancelled);
        outcome.cause = put.error;
        outcome.etag = put.etag;
        return outcome;
    }

    auto mpu = store.create_multipart_upload(request.bucket, request.key, request.content_type);
    if (!mpu.error.ok()) {
        outcome.cause = mpu.error;
        return outcome;
    }
    log_debug("Ticket %s: multipart upload %s started", ticket.id().c_str(), mpu.upload_id.c_str());

    auto abort_upload = [&](const StorageError& cause) {
        auto err = store.abort_multipart_upload(request.bucket, request.key, mpu.upload_id);
        if (!err.ok()) {
            log_warn("Ticket %s: abort of multipart upload %s failed: %s", ticket.id().c_str(),
                     mpu.upload_id.c_str(), err.describe().c_str());
        }
        outcome.cause = cause;
        return outcome;
    };

    // Anything thrown from here on must not leave the upload dangling
    try {
        std::vector<CompletedPart> parts;
        int part_number = 1;
        while (true) {
            if (ticket.cancel_requested()) {
                return abort_upload(StorageError::cancelled("transfer cancelled"));
            }
            auto part = store.upload_part(request.bucket, request.key, mpu.upload_id, part_number,
                                          std::span<const uint8_t>(window.data(), filled), cancelled);
            if (!part.error.ok()) {
                return abort_upload(part.error);
            }
            parts.push_back({part_number, part.etag});
            log_debug("Ticket %s: part %d (%zu bytes) stored", ticket.id().c_str(), part_number, filled);

            if (eof) break;
            filled = fill_window(source, window, 0, eof, outcome.cause, on_read);
            if (!outcome.cause.ok()) {
                return abort_upload(outcome.cause);
            }
            if (filled == 0) break;

            if (++part_number > static_cast<int>(constants::S3_MAX_PART_COUNT)) {
                return abort_upload(StorageError::service(400, "EntityTooLarge",
                    "object exceeds " + std::to_string(constants::S3_MAX_PART_COUNT) + " parts"));
            }
        }

        set_phase(ticket, TransferPhase::Committing, throttle);
        auto done = store.complete_multipart_upload(request.bucket, request.key, mpu.upload_id, parts);
        if (!done.error.ok()) {
            return abort_upload(done.error);
        }
        outcome.etag = done.etag;
        return outcome;
    } catch (const std::exception& e) {
        return abort_upload(StorageError::internal(std::string("upload aborted: ") + e.what()));
    }
}

// --- Download ---

TransferOutcome TransferEngine::download(const std::shared_ptr<TransferTicket>& ticket,
                                         ByteSink& sink,
                                         const DownloadRequest& request) {
    auto started = std::chrono::steady_clock::now();
    bool headers_sent = false;
    try {
        return stream_download(*ticket, sink, request, started, headers_sent);
    } catch (const std::exception& e) {
        if (headers_sent) sink.abort();
        TransferOutcome outcome;
        outcome.headers_sent = headers_sent;
        return finish(*ticket, std::move(outcome),
                      StorageError::internal(std::string("download aborted: ") + e.what()), started);
    }
}

TransferOutcome TransferEngine::stream_download(TransferTicket& ticket, ByteSink& sink,
                                                const DownloadRequest& request,
                                                std::chrono::steady_clock::time_point started,
                                                bool& headers_sent) {
    ProgressThrottle throttle(config_.progress_bytes, config_.progress_interval);
    publish(ticket);

    auto slot = admit(ticket);
    if (!slot) {
        return finish(ticket, {}, StorageError::cancelled("cancelled while queued"), started);
    }
    set_phase(ticket, TransferPhase::Admitted, throttle);

    auto client = registry_.get();
    if (!client) {
        return finish(ticket, {}, StorageError::configuration("no storage backend configured"), started);
    }

    set_phase(ticket, TransferPhase::Opening, throttle);

    TransferOutcome outcome;
    bool sink_failed = false;
    bool overrun = false;
    uint64_t delivered = 0;

    auto on_open = [&](const ObjectInfo& info) {
        if (info.size) {
            ticket.size_.store(*info.size);
            ticket.has_size_.store(true);
        }
        outcome.info = info;
        if (!sink.begin(info)) {
            sink_failed = true;
            return false;
        }
        outcome.headers_sent = true;
        headers_sent = true;
        set_phase(ticket, TransferPhase::Streaming, throttle);
        return true;
    };
    auto on_chunk = [&](std::span<const uint8_t> chunk) {
        // A declared length is a promise to the client; never write past it
        if (outcome.info.size && delivered + chunk.size() > *outcome.info.size) {
            overrun = true;
            return false;
        }
        if (!sink.write(chunk)) {
            sink_failed = true;
            return false;
        }
        delivered += chunk.size();
        add_bytes(ticket, chunk.size(), throttle);
        return true;
    };
    auto cancelled = [&] { return ticket.cancel_requested(); };

    auto result = client->store->get_object(request.bucket, request.key, request.range,
                                            on_open, on_chunk, cancelled);

    StorageError error = result.error;
    if (overrun && error.origin != ErrorOrigin::Cancelled) {
        error = StorageError::network(net::TransportFault::Other,
            "backend sent more than the declared " + std::to_string(*outcome.info.size) + " bytes");
    }
    // Truncation is only detectable against a declared length; without one
    // the backend's own end-of-stream is authoritative
    if (error.ok() && outcome.headers_sent && outcome.info.size &&
        result.bytes_delivered < *outcome.info.size) {
        error = StorageError::network(net::TransportFault::ConnectionReset,
            "backend stream ended after " + std::to_string(result.bytes_delivered) + " of " +
            std::to_string(*outcome.info.size) + " bytes");
    }
    if (!error.ok() && sink_failed && error.origin != ErrorOrigin::Cancelled) {
        error = StorageError::client_disconnect("client stopped receiving: " + error.message);
    }
    if (error.ok() && !sink.finish()) {
        error = StorageError::client_disconnect("client went away before the response completed");
    }

    if (!error.ok() && outcome.headers_sent) {
        // Headers already promised a complete body; make the truncation visible
        sink.abort();
    }

    slot->release();
    return finish(ticket, std::move(outcome), std::move(error), started);
}

}  // namespace s3relay
