#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace support {

// One-shot stop flag that long-running workers sleep on.
class ShutdownSignal {
public:
    void trigger() {
        {
            std::lock_guard<std::mutex> lock(m_);
            triggered_ = true;
        }
        cv_.notify_all();
    }

    bool triggered() const {
        std::lock_guard<std::mutex> lock(m_);
        return triggered_;
    }

    // Sleep for up to `timeout`. Returns true if the signal fired.
    template <class Rep, class Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(m_);
        return cv_.wait_for(lock, timeout, [this] { return triggered_; });
    }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    bool triggered_{false};
};

}
