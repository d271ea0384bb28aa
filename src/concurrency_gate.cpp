#include "s3relay/concurrency_gate.hpp"

#include <algorithm>

namespace s3relay {

// --- Slot ---

ConcurrencyGate::Slot& ConcurrencyGate::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void ConcurrencyGate::Slot::release() {
    if (gate_) {
        auto* gate = gate_;
        gate_ = nullptr;
        gate->release_one();
    }
}

// --- ConcurrencyGate ---

ConcurrencyGate::ConcurrencyGate(size_t limit)
    : limit_(std::max<size_t>(limit, 1)) {}

bool ConcurrencyGate::front_can_enter(uint64_t ticket) const {
    return !waiters_.empty() && waiters_.front() == ticket && in_use_ < limit_;
}

void ConcurrencyGate::remove_waiter(uint64_t ticket) {
    auto it = std::find(waiters_.begin(), waiters_.end(), ticket);
    if (it != waiters_.end()) waiters_.erase(it);
}

ConcurrencyGate::Slot ConcurrencyGate::acquire() {
    std::unique_lock lock(mutex_);
    uint64_t ticket = next_ticket_++;
    waiters_.push_back(ticket);
    cv_.wait(lock, [&] { return front_can_enter(ticket); });
    waiters_.pop_front();
    ++in_use_;
    // The next waiter may also fit (limit raised while we queued)
    cv_.notify_all();
    return Slot(this);
}

std::optional<ConcurrencyGate::Slot> ConcurrencyGate::try_acquire() {
    std::lock_guard lock(mutex_);
    if (!waiters_.empty() || in_use_ >= limit_) {
        return std::nullopt;
    }
    ++in_use_;
    return Slot(this);
}

std::optional<ConcurrencyGate::Slot> ConcurrencyGate::acquire_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    uint64_t ticket = next_ticket_++;
    waiters_.push_back(ticket);
    if (!cv_.wait_for(lock, timeout, [&] { return front_can_enter(ticket); })) {
        remove_waiter(ticket);
        // We may have been blocking the waiter behind us
        cv_.notify_all();
        return std::nullopt;
    }
    waiters_.pop_front();
    ++in_use_;
    cv_.notify_all();
    return Slot(this);
}

std::optional<ConcurrencyGate::Slot> ConcurrencyGate::acquire_unless(const std::function<bool()>& stop,
                                                                     std::chrono::milliseconds poll) {
    std::unique_lock lock(mutex_);
    uint64_t ticket = next_ticket_++;
    waiters_.push_back(ticket);
    while (!cv_.wait_for(lock, poll, [&] { return front_can_enter(ticket); })) {
        if (stop && stop()) {
            remove_waiter(ticket);
            cv_.notify_all();
            return std::nullopt;
        }
    }
    waiters_.pop_front();
    ++in_use_;
    cv_.notify_all();
    return Slot(this);
}

void ConcurrencyGate::release_one() {
    {
        std::lock_guard lock(mutex_);
        if (in_use_ > 0) --in_use_;
    }
    cv_.notify_all();
}

void ConcurrencyGate::set_limit(size_t limit) {
    {
        std::lock_guard lock(mutex_);
        limit_ = std::max<size_t>(limit, 1);
    }
    cv_.notify_all();
}

size_t ConcurrencyGate::limit() const {
    std::lock_guard lock(mutex_);
    return limit_;
}

size_t ConcurrencyGate::in_use() const {
    std::lock_guard lock(mutex_);
    return in_use_;
}

size_t ConcurrencyGate::waiting() const {
    std::lock_guard lock(mutex_);
    return waiters_.size();
}

}  // namespace s3relay
