#pragma once
#include <chrono>
#include <string>

namespace qh {

// Exchange session in local wall-clock time, Monday to Friday, both ends inclusive.
struct SessionWindow {
    int open_seconds{9 * 3600 + 15 * 60};    // 09:15:00
    int close_seconds{15 * 3600 + 30 * 60};  // 15:30:00
};

struct EngineConfig {
    // channel timing
    std::chrono::seconds poll_interval{5};
    std::chrono::seconds stale_after{30};        // push silence before fallback is declared
    std::chrono::milliseconds reconnect_backoff{5000};
    std::chrono::milliseconds liveness_tick{1000};

    // historical worker
    bool enable_history{true};
    std::chrono::minutes history_interval{30};
    int history_lookback_days{30};
    std::chrono::milliseconds history_request_pause{500};  // provider rate limit
    std::string history_db_path{"history.db"};

    // reconciliation
    double price_change_threshold_pct{0.01};
    double bid_match_tolerance{0.1};

    SessionWindow session{};

    // provider endpoints
    std::string rest_host{"api-t1.fyers.in"};
    std::string ws_uri{"wss://socket.fyers.in/hsm/v1-5/prod"};
    std::string auth_dir{"."};

    // dashboard bridge
    int port{3000};
    std::chrono::milliseconds emit_interval{100};
};

} // namespace qh
