#pragma once
#include <atomic>
#include <chrono>

namespace sharpmap {

// Cooperative stop signal polled between files. Trips either when cancel()
// is called or once the optional deadline has passed. Set the deadline
// before handing the token to a query.
class CancellationToken {
public:
    using clock = std::chrono::steady_clock;

    CancellationToken() = default;
    explicit CancellationToken(clock::time_point deadline) : deadline_(deadline), has_deadline_(true) {}

    static CancellationToken after(std::chrono::milliseconds timeout) {
        return CancellationToken(clock::now() + timeout);
    }

    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }

    bool is_cancelled() const {
        if (cancelled_.load(std::memory_order_relaxed)) return true;
        return has_deadline_ && clock::now() >= deadline_;
    }

    bool has_deadline() const { return has_deadline_; }

private:
    std::atomic<bool> cancelled_{false};
    clock::time_point deadline_{};
    bool has_deadline_ = false;
};

} // namespace sharpmap
