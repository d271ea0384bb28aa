#include "s3relay/progress_notifier.hpp"
#include "s3relay/log.hpp"

#include <algorithm>

namespace s3relay {

const char* transfer_phase_name(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Queued: return "queued";
        case TransferPhase::Admitted: return "admitted";
        case TransferPhase::Opening: return "opening";
        case TransferPhase::Streaming: return "streaming";
        case TransferPhase::Committing: return "committing";
        case TransferPhase::Done: return "done";
        case TransferPhase::Failed: return "failed";
    }
    return "unknown";
}

nlohmann::json to_json(const ProgressEvent& event) {
    nlohmann::json j;
    j["ticketId"] = event.ticket_id;
    j["bytesTransferred"] = event.bytes_transferred;
    j["totalBytes"] = event.total_bytes ? nlohmann::json(*event.total_bytes) : nlohmann::json(nullptr);
    j["phase"] = transfer_phase_name(event.phase);
    if (!event.error.empty()) j["error"] = event.error;
    return j;
}

// --- Subscription ---

ProgressNotifier::Subscription::~Subscription() {
    // The notifier only holds a weak reference; marking closed stops any
    // publisher that already grabbed the channel from queueing into it.
    std::lock_guard lock(channel_->mutex);
    channel_->closed = true;
    channel_->queue.clear();
}

std::optional<ProgressEvent> ProgressNotifier::Subscription::next(std::chrono::milliseconds timeout) {
    std::unique_lock lock(channel_->mutex);
    channel_->cv.wait_for(lock, timeout, [&] {
        return !channel_->queue.empty() || channel_->closed;
    });
    if (channel_->queue.empty()) return std::nullopt;
    ProgressEvent event = std::move(channel_->queue.front());
    channel_->queue.pop_front();
    return event;
}

bool ProgressNotifier::Subscription::finished() const {
    std::lock_guard lock(channel_->mutex);
    return channel_->closed && channel_->queue.empty();
}

uint64_t ProgressNotifier::Subscription::dropped() const {
    std::lock_guard lock(channel_->mutex);
    return channel_->dropped;
}

// --- ProgressNotifier ---

ProgressNotifier::ProgressNotifier(size_t queue_depth)
    : queue_depth_(std::max<size_t>(queue_depth, 1)) {}

void ProgressNotifier::open(const std::string& ticket_id) {
    std::lock_guard lock(mutex_);
    topics_.try_emplace(ticket_id);
}

std::unique_ptr<ProgressNotifier::Subscription> ProgressNotifier::subscribe(const std::string& ticket_id) {
    std::lock_guard lock(mutex_);
    auto it = topics_.find(ticket_id);
    if (it == topics_.end()) {
        return nullptr;
    }
    auto channel = std::make_shared<Channel>();
    channel->depth = queue_depth_;
    it->second.push_back(channel);
    return std::make_unique<Subscription>(SubscriptionKey{}, ticket_id, std::move(channel));
}

void ProgressNotifier::publish(const ProgressEvent& event) {
    try {
        std::vector<std::shared_ptr<Channel>> targets;
        {
            std::lock_guard lock(mutex_);
            auto it = topics_.find(event.ticket_id);
            if (it == topics_.end()) return;

            auto& channels = it->second;
            channels.erase(std::remove_if(channels.begin(), channels.end(),
                                          [](const auto& w) { return w.expired(); }),
                           channels.end());
            for (auto& weak : channels) {
                if (auto channel = weak.lock()) targets.push_back(std::move(channel));
            }
        }

        for (auto& channel : targets) {
            {
                std::lock_guard lock(channel->mutex);
                if (channel->closed) continue;
                if (channel->queue.size() >= channel->depth) {
                    channel->queue.pop_front();
                    ++channel->dropped;
                }
                channel->queue.push_back(event);
            }
            channel->cv.notify_all();
        }
    } catch (const std::exception& e) {
        log_error("Progress publish failed for %s: %s", event.ticket_id.c_str(), e.what());
    }
}

void ProgressNotifier::close(const std::string& ticket_id) {
    std::vector<std::weak_ptr<Channel>> channels;
    {
        std::lock_guard lock(mutex_);
        auto it = topics_.find(ticket_id);
        if (it == topics_.end()) return;
        channels = std::move(it->second);
        topics_.erase(it);
    }

    for (auto& weak : channels) {
        if (auto channel = weak.lock()) {
            {
                std::lock_guard lock(channel->mutex);
                channel->closed = true;
            }
            channel->cv.notify_all();
        }
    }
}

size_t ProgressNotifier::subscriber_count(const std::string& ticket_id) const {
    std::lock_guard lock(mutex_);
    auto it = topics_.find(ticket_id);
    if (it == topics_.end()) return 0;
    return static_cast<size_t>(std::count_if(it->second.begin(), it->second.end(),
                                             [](const auto& w) { return !w.expired(); }));
}

size_t ProgressNotifier::open_tickets() const {
    std::lock_guard lock(mutex_);
    return topics_.size();
}

}  // namespace s3relay
