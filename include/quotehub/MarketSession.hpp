#pragma once
#include "quotehub/EngineConfig.hpp"
#include "quotehub/Types.hpp"
#include <string>

namespace qh {

// OPEN inside the session window on Monday to Friday (local time), CLOSED otherwise.
MarketStatus market_status_at(TimePoint tp, const SessionWindow& window = SessionWindow{});

inline bool is_market_open(TimePoint tp, const SessionWindow& window = SessionWindow{}) {
    return market_status_at(tp, window) == MarketStatus::Open;
}

// Local calendar date as YYYY-MM-DD.
std::string local_date(TimePoint tp);

}
