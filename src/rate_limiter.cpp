#include "s3relay/rate_limiter.hpp"
#include "s3relay/constants.hpp"

namespace s3relay {

RateLimiter::RateLimiter(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) clock_ = [] { return std::chrono::steady_clock::now(); };
}

bool RateLimiter::exceeded(const std::string& key, uint64_t max, std::chrono::milliseconds window) {
    if (max == 0) return false;
    auto now = clock_();

    std::lock_guard lock(mutex_);
    if (windows_.size() > constants::RATE_LIMIT_SWEEP_THRESHOLD) {
        sweep(now);
    }

    auto it = windows_.find(key);
    if (it == windows_.end() || now > it->second.reset_at) {
        windows_[key] = Window{1, now + window};
        return false;
    }
    if (it->second.count >= max) {
        return true;
    }
    ++it->second.count;
    return false;
}

uint64_t RateLimiter::retry_after(const std::string& key) const {
    auto now = clock_();
    std::lock_guard lock(mutex_);
    auto it = windows_.find(key);
    if (it == windows_.end() || now > it->second.reset_at) return 0;
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(it->second.reset_at - now);
    return static_cast<uint64_t>((remaining.count() + 999) / 1000);
}

void RateLimiter::reset() {
    std::lock_guard lock(mutex_);
    windows_.clear();
}

size_t RateLimiter::tracked() const {
    std::lock_guard lock(mutex_);
    return windows_.size();
}

void RateLimiter::sweep(std::chrono::steady_clock::time_point now) {
    for (auto it = windows_.begin(); it != windows_.end();) {
        if (now > it->second.reset_at) {
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace s3relay
