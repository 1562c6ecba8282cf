#include "server/SnapshotJson.hpp"
#include "support/RateLimiter.hpp"
#include <cassert>
#include <iostream>

using namespace server;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))

namespace {

qh::Snapshot sample() {
    qh::Quote index;
    index.symbol = "NIFTY50-INDEX";
    index.is_index = true;
    index.ltp = 22000;

    qh::Quote foo;
    foo.symbol = "FOO";
    foo.ltp = 100;
    foo.close = 95;
    foo.change = 5;
    foo.change_percent = 5.263;
    foo.volume = 1000;
    foo.signal = qh::Signal::Buy;
    foo.market_status = qh::MarketStatus::Open;
    foo.ltp_delta = {true, qh::Direction::Up};
    foo.volume_delta = {true, qh::Direction::None};
    foo.prev_ltp = 99;
    foo.timestamp = qh::TimePoint(std::chrono::milliseconds(1700000000123));
    return {index, foo};
}

} // namespace

TEST(test_message_envelope_and_order) {
    auto msg = market_data_message(sample());
    ASSERT_EQ(msg["type"], "market_data");
    ASSERT_EQ(msg["data"].size(), 2u);
    ASSERT_EQ(msg["data"].begin().key(), "NIFTY50-INDEX");
}

TEST(test_quote_fields) {
    auto j = quote_to_json(sample()[1]);
    ASSERT_EQ(j["symbol"], "FOO");
    ASSERT_EQ(j["ltp"], 100.0);
    ASSERT_EQ(j["volume"], 1000);
    ASSERT_EQ(j["trading_signal"], "BUY");
    ASSERT_EQ(j["market_status"], "OPEN");
    ASSERT_EQ(j["ms"], 1700000000123LL);
    ASSERT_EQ(j["ltp_changed"], true);
    ASSERT_EQ(j["ltp_direction"], "up");
    ASSERT_EQ(j["volume_changed"], true);
    ASSERT_TRUE(j["volume_direction"].is_null());
    ASSERT_EQ(j["open_changed"], false);
    ASSERT_EQ(j["prev_ltp"], 99.0);
    ASSERT_TRUE(j["timestamp"].is_string());
}

TEST(test_rate_limiter_refuses_inside_interval) {
    support::RateLimiter limiter(std::chrono::milliseconds(100));
    auto t0 = support::RateLimiter::Clock::time_point(std::chrono::seconds(1));
    ASSERT_TRUE(limiter.try_acquire(t0));
    ASSERT_FALSE(limiter.try_acquire(t0 + std::chrono::milliseconds(50)));
    ASSERT_FALSE(limiter.try_acquire(t0 + std::chrono::milliseconds(99)));
    ASSERT_TRUE(limiter.try_acquire(t0 + std::chrono::milliseconds(100)));
    ASSERT_FALSE(limiter.try_acquire(t0 + std::chrono::milliseconds(150)));
}

int main() {
    std::cout << "\n=== SnapshotJson Tests ===\n\n";

    RUN_TEST(test_message_envelope_and_order);
    RUN_TEST(test_quote_fields);
    RUN_TEST(test_rate_limiter_refuses_inside_interval);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
