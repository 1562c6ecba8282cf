// types used throughout the project

#pragma once
#include <string>
#include <chrono>
#include <cstdint>

namespace qh {

using TimePoint = std::chrono::time_point<std::chrono::system_clock>;

// advisory only; nothing in the engine acts on it
enum class Signal {
    Buy,
    Sell,
    Hold
};

enum class MarketStatus {
    Open,
    Closed
};

// direction of a field relative to the previous quote
enum class Direction {
    None,
    Up,
    Down
};

// which channel is currently authoritative
enum class FeedState {
    Live,
    Fallback
};

inline const char* signal_to_string(Signal s) {
    switch (s) {
        case Signal::Buy: return "BUY";
        case Signal::Sell: return "SELL";
        case Signal::Hold: return "HOLD";
    }
    return "HOLD";
}

inline const char* market_status_to_string(MarketStatus status) {
    switch (status) {
        case MarketStatus::Open: return "OPEN";
        case MarketStatus::Closed: return "CLOSED";
    }
    return "CLOSED";
}

inline const char* direction_to_string(Direction d) {
    switch (d) {
        case Direction::Up: return "up";
        case Direction::Down: return "down";
        case Direction::None: return "none";
    }
    return "none";
}

inline const char* feed_state_to_string(FeedState state) {
    switch (state) {
        case FeedState::Live: return "LIVE";
        case FeedState::Fallback: return "FALLBACK";
    }
    return "UNKNOWN";
}

inline long long to_epoch_ms(const TimePoint& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace qh
