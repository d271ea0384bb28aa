#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace s3relay {

/// Fixed-window request counter keyed by "operation:client".
///
/// The first request for a key opens a window of the given length; up to
/// `max` requests are allowed inside it and later ones are refused until
/// it expires. State is in memory only.
class RateLimiter {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    /// Uses steady_clock::now unless a clock is given.
    explicit RateLimiter(Clock clock = {});

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Count a request for `key`. True when it must be refused. A `max` of
    /// zero disables the limit.
    bool exceeded(const std::string& key, uint64_t max, std::chrono::milliseconds window);

    /// Whole seconds until the window for `key` ends, 0 when none is open.
    uint64_t retry_after(const std::string& key) const;

    void reset();
    size_t tracked() const;

private:
    struct Window {
        uint64_t count = 0;
        std::chrono::steady_clock::time_point reset_at;
    };

    void sweep(std::chrono::steady_clock::time_point now);

    Clock clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Window> windows_;
};

}  // namespace s3relay
