#include "server/SnapshotJson.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace server {

namespace {

std::string to_iso_local(const qh::TimePoint& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

void put_delta(ordered_json& j, const char* field, const qh::FieldDelta& d) {
    j[std::string(field) + "_changed"] = d.changed;
    if (d.direction == qh::Direction::None) {
        j[std::string(field) + "_direction"] = nullptr;
    } else {
        j[std::string(field) + "_direction"] = qh::direction_to_string(d.direction);
    }
}

} // namespace

ordered_json quote_to_json(const qh::Quote& q) {
    ordered_json j;
    j["symbol"] = q.symbol;
    j["is_index"] = q.is_index;
    j["ltp"] = q.ltp;
    j["open"] = q.open;
    j["high"] = q.high;
    j["low"] = q.low;
    j["close"] = q.close;
    j["volume"] = q.volume;
    j["change"] = q.change;
    j["change_percent"] = q.change_percent;
    j["trading_signal"] = qh::signal_to_string(q.signal);
    j["market_status"] = qh::market_status_to_string(q.market_status);
    j["timestamp"] = to_iso_local(q.timestamp);
    j["ms"] = qh::to_epoch_ms(q.timestamp);

    put_delta(j, "ltp", q.ltp_delta);
    put_delta(j, "open", q.open_delta);
    put_delta(j, "high", q.high_delta);
    put_delta(j, "low", q.low_delta);
    put_delta(j, "volume", q.volume_delta);

    j["prev_ltp"] = q.prev_ltp;
    j["prev_open"] = q.prev_open;
    j["prev_high"] = q.prev_high;
    j["prev_low"] = q.prev_low;
    j["prev_close"] = q.prev_close;
    j["prev_volume"] = q.prev_volume;
    return j;
}

ordered_json snapshot_to_json(const qh::Snapshot& snapshot) {
    ordered_json data = ordered_json::object();
    for (const auto& q : snapshot) {
        data[q.symbol] = quote_to_json(q);
    }
    return data;
}

ordered_json market_data_message(const qh::Snapshot& snapshot) {
    ordered_json msg;
    msg["type"] = "market_data";
    msg["data"] = snapshot_to_json(snapshot);
    return msg;
}

}
