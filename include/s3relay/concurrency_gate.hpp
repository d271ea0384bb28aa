#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace s3relay {

/// Counting admission gate bounding the number of transfers in flight.
///
/// Waiters are admitted strictly in arrival order: a caller that arrives
/// while others are queued waits behind them even if capacity frees up in
/// between. Lowering the limit never revokes slots already handed out; new
/// admissions resume once enough of them are released.
class ConcurrencyGate {
public:
    /// Move-only permit. Releases its capacity when destroyed or on the
    /// first call to release(); later calls are no-ops.
    class Slot {
    public:
        Slot() = default;
        ~Slot() { release(); }

        Slot(Slot&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept;

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        void release();
        bool held() const { return gate_ != nullptr; }

    private:
        friend class ConcurrencyGate;
        explicit Slot(ConcurrencyGate* gate) : gate_(gate) {}

        ConcurrencyGate* gate_ = nullptr;
    };

    explicit ConcurrencyGate(size_t limit);
    ~ConcurrencyGate() = default;

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    /// Block until a slot is available and every earlier waiter was admitted.
    Slot acquire();

    /// Non-blocking: a slot only if one is free and nobody is queued.
    std::optional<Slot> try_acquire();

    /// Wait up to `timeout`. A waiter that times out leaves the queue
    /// without disturbing the order of the others.
    std::optional<Slot> acquire_for(std::chrono::milliseconds timeout);

    /// Like acquire(), but checks `stop` every `poll` while queued and gives
    /// up (keeping everyone else's position) once it returns true.
    std::optional<Slot> acquire_unless(const std::function<bool()>& stop,
                                       std::chrono::milliseconds poll);

    /// Change the maximum. Zero is clamped to one.
    void set_limit(size_t limit);

    size_t limit() const;
    size_t in_use() const;
    size_t waiting() const;

private:
    void release_one();
    bool front_can_enter(uint64_t ticket) const;
    void remove_waiter(uint64_t ticket);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t limit_;
    size_t in_use_ = 0;
    uint64_t next_ticket_ = 0;
    std::deque<uint64_t> waiters_;  // arrival order
};

}  // namespace s3relay
