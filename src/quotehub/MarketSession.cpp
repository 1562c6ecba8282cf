#include "quotehub/MarketSession.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace qh {

namespace {

std::tm to_local_tm(TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    return local;
}

} // namespace

MarketStatus market_status_at(TimePoint tp, const SessionWindow& window) {
    std::tm local = to_local_tm(tp);
    bool weekend = local.tm_wday == 0 || local.tm_wday == 6;
    int seconds = local.tm_hour * 3600 + local.tm_min * 60 + local.tm_sec;
    bool in_session = seconds >= window.open_seconds && seconds <= window.close_seconds;
    return (in_session && !weekend) ? MarketStatus::Open : MarketStatus::Closed;
}

std::string local_date(TimePoint tp) {
    std::tm local = to_local_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d");
    return oss.str();
}

}
