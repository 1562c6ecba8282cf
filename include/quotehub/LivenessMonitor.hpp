#pragma once
#include "quotehub/Types.hpp"
#include <chrono>
#include <mutex>
#include <optional>

namespace qh {

/**
 * Tracks whether the push channel is delivering fresh data.
 *
 * Starts in FALLBACK (nothing pushed yet). LIVE -> FALLBACK once the last
 * push is older than `stale_after`; FALLBACK -> LIVE on the next push.
 * Both calls report true only on the edge itself, so callers can log
 * each transition exactly once.
 */
class LivenessMonitor {
public:
    explicit LivenessMonitor(std::chrono::seconds stale_after = std::chrono::seconds(30))
        : stale_after_(stale_after) {}

    // A push update was processed. True on a FALLBACK -> LIVE edge.
    bool record_push(TimePoint now) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_push_ = now;
        if (fallback_active_) {
            fallback_active_ = false;
            return true;
        }
        return false;
    }

    // Periodic check. True on a LIVE -> FALLBACK edge.
    bool evaluate(TimePoint now) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool stale = !last_push_ || (now - *last_push_) > stale_after_;
        if (stale && !fallback_active_) {
            fallback_active_ = true;
            return true;
        }
        return false;
    }

    bool fallback_active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fallback_active_;
    }

    FeedState state() const {
        return fallback_active() ? FeedState::Fallback : FeedState::Live;
    }

    std::optional<TimePoint> last_push() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_push_;
    }

private:
    std::chrono::seconds stale_after_;
    mutable std::mutex mutex_;
    std::optional<TimePoint> last_push_;
    bool fallback_active_{true};
};

}
