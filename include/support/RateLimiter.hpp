#pragma once
#include <chrono>
#include <mutex>

namespace support {

// Admits at most one event per interval; the rest are refused, not queued.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(std::chrono::milliseconds interval) : interval_(interval) {}

    bool try_acquire(Clock::time_point now = Clock::now()) {
        std::lock_guard<std::mutex> lock(m_);
        if (has_last_ && now - last_ < interval_) return false;
        last_ = now;
        has_last_ = true;
        return true;
    }

    std::chrono::milliseconds interval() const { return interval_; }

private:
    std::mutex m_;
    std::chrono::milliseconds interval_;
    Clock::time_point last_{};
    bool has_last_{false};
};

}
