#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace s3relay {

enum class TransferPhase {
    Queued,
    Admitted,
    Opening,
    Streaming,
    Committing,
    Done,
    Failed
};

const char* transfer_phase_name(TransferPhase phase);

inline bool is_terminal(TransferPhase phase) {
    return phase == TransferPhase::Done || phase == TransferPhase::Failed;
}

struct ProgressEvent {
    std::string ticket_id;
    uint64_t bytes_transferred = 0;
    std::optional<uint64_t> total_bytes;
    TransferPhase phase = TransferPhase::Queued;
    std::string error;  // set on Failed
};

nlohmann::json to_json(const ProgressEvent& event);

/// Per-ticket publish/subscribe channel for progress events.
///
/// Publishing never blocks on a subscriber: each subscription has a bounded
/// queue and drops its oldest event when full. Events reach a subscriber in
/// publish order. A subscriber only sees events published after it
/// subscribed. close() ends every subscription for the ticket.
class ProgressNotifier {
    struct Channel;

    // Only the notifier can name this, so only it can create subscriptions
    struct SubscriptionKey {
        explicit SubscriptionKey() = default;
    };

public:
    class Subscription {
    public:
        Subscription(SubscriptionKey, std::string ticket_id, std::shared_ptr<Channel> channel)
            : ticket_id_(std::move(ticket_id)), channel_(std::move(channel)) {}
        ~Subscription();

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        /// Next queued event, waiting up to `timeout`. Empty on timeout or
        /// once the ticket is closed and everything queued was consumed.
        std::optional<ProgressEvent> next(std::chrono::milliseconds timeout);

        /// Closed and fully drained; next() will never return an event again.
        bool finished() const;

        /// Events discarded because this subscriber fell behind.
        uint64_t dropped() const;

        const std::string& ticket_id() const { return ticket_id_; }

    private:
        std::string ticket_id_;
        std::shared_ptr<Channel> channel_;
    };

    explicit ProgressNotifier(size_t queue_depth);

    ProgressNotifier(const ProgressNotifier&) = delete;
    ProgressNotifier& operator=(const ProgressNotifier&) = delete;

    /// Make a ticket subscribable. Called when the ticket is created.
    void open(const std::string& ticket_id);

    /// Null when the ticket is unknown or already closed.
    std::unique_ptr<Subscription> subscribe(const std::string& ticket_id);

    /// Deliver to current subscribers; dropped when there are none.
    void publish(const ProgressEvent& event);

    /// End all subscriptions for the ticket and forget it.
    void close(const std::string& ticket_id);

    size_t subscriber_count(const std::string& ticket_id) const;
    size_t open_tickets() const;

private:
    struct Channel {
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::deque<ProgressEvent> queue;
        size_t depth = 0;
        bool closed = false;
        uint64_t dropped = 0;
    };

    size_t queue_depth_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::weak_ptr<Channel>>> topics_;
};

}  // namespace s3relay
