#include "quotehub/InstrumentRegistry.hpp"
#include "quotehub/SnapshotStore.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace qh;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

namespace {

const TimePoint T0 = TimePoint(std::chrono::seconds(1700000000));

InstrumentRegistry small_registry() {
    InstrumentRegistry r;
    r.register_instrument("NSE:SBIN-EQ");
    r.register_instrument("NSE:INFY-EQ");
    r.register_instrument("NSE:NIFTY50-INDEX", true);
    return r;
}

QuoteFields ltp_close(double ltp, double close) {
    QuoteFields f;
    f.ltp = ltp;
    f.close = close;
    return f;
}

} // namespace

// === Initial state ===

TEST(test_every_instrument_has_zero_entry) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);

    auto snap = store.snapshot_all();
    ASSERT_EQ(snap.size(), 3u);
    ASSERT_EQ(snap[0].symbol, "NIFTY50-INDEX");
    ASSERT_TRUE(snap[0].is_index);
    ASSERT_EQ(snap[1].symbol, "INFY-EQ");
    ASSERT_EQ(snap[2].symbol, "SBIN-EQ");
    for (const auto& q : snap) {
        ASSERT_EQ(q.ltp, 0.0);
        ASSERT_EQ(q.volume, 0);
        ASSERT_TRUE(q.signal == Signal::Hold);
        ASSERT_TRUE(q.market_status == MarketStatus::Closed);
        ASSERT_TRUE(q.timestamp == T0);
    }
    ASSERT_EQ(store.non_zero_count(), 0u);
}

// === Merge semantics ===

TEST(test_upsert_unknown_symbol_is_rejected) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);
    ASSERT_FALSE(store.upsert("NOPE", ltp_close(1, 1), T0));
    ASSERT_EQ(store.size(), 3u);
}

TEST(test_absent_fields_keep_prior_values) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);

    QuoteFields full;
    full.ltp = 100; full.open = 98; full.high = 101; full.low = 97; full.close = 95; full.volume = 1000;
    ASSERT_TRUE(store.upsert("SBIN-EQ", full, T0));

    QuoteFields partial;
    partial.ltp = 102;
    ASSERT_TRUE(store.upsert("SBIN-EQ", partial, T0 + std::chrono::seconds(1)));

    auto q = *store.get("SBIN-EQ");
    ASSERT_EQ(q.ltp, 102.0);
    ASSERT_EQ(q.open, 98.0);
    ASSERT_EQ(q.high, 101.0);
    ASSERT_EQ(q.low, 97.0);
    ASSERT_EQ(q.close, 95.0);
    ASSERT_EQ(q.volume, 1000);
}

TEST(test_zero_value_never_overwrites) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);
    store.upsert("SBIN-EQ", ltp_close(100, 95), T0);

    QuoteFields zeros;
    zeros.ltp = 0; zeros.close = 0; zeros.volume = 0;
    store.upsert("SBIN-EQ", zeros, T0 + std::chrono::seconds(1));

    auto q = *store.get("SBIN-EQ");
    ASSERT_EQ(q.ltp, 100.0);
    ASSERT_EQ(q.close, 95.0);
    ASSERT_FALSE(q.ltp_delta.changed);
}

// === Change detection ===

TEST(test_first_update_flags_changed_without_direction) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);

    QuoteFields f;
    f.ltp = 100; f.open = 99; f.high = 101; f.low = 98; f.volume = 500;
    store.upsert("INFY-EQ", f, T0);

    auto q = *store.get("INFY-EQ");
    ASSERT_TRUE(q.ltp_delta.changed);
    ASSERT_TRUE(q.open_delta.changed);
    ASSERT_TRUE(q.high_delta.changed);
    ASSERT_TRUE(q.low_delta.changed);
    ASSERT_TRUE(q.volume_delta.changed);
    ASSERT_TRUE(q.ltp_delta.direction == Direction::None);
    ASSERT_TRUE(q.volume_delta.direction == Direction::None);
    ASSERT_EQ(q.prev_ltp, 0.0);
}

TEST(test_price_jitter_below_threshold_is_not_flagged) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);
    store.upsert("INFY-EQ", ltp_close(1000, 990), T0);

    // 0.005% move
    store.upsert("INFY-EQ", ltp_close(1000.05, 990), T0);
    auto q = *store.get("INFY-EQ");
    ASSERT_EQ(q.ltp, 1000.05);
    ASSERT_FALSE(q.ltp_delta.changed);
    ASSERT_TRUE(q.ltp_delta.direction == Direction::None);
    ASSERT_EQ(q.prev_ltp, 1000.0);
}

TEST(test_price_moves_flag_direction) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);
    store.upsert("INFY-EQ", ltp_close(1000, 990), T0);

    store.upsert("INFY-EQ", ltp_close(1001, 990), T0);
    auto up = *store.get("INFY-EQ");
    ASSERT_TRUE(up.ltp_delta.changed);
    ASSERT_TRUE(up.ltp_delta.direction == Direction::Up);

    store.upsert("INFY-EQ", ltp_close(999, 990), T0);
    auto down = *store.get("INFY-EQ");
    ASSERT_TRUE(down.ltp_delta.changed);
    ASSERT_TRUE(down.ltp_delta.direction == Direction::Down);
    ASSERT_EQ(down.prev_ltp, 1001.0);
}

TEST(test_volume_flags_any_difference) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);

    QuoteFields f;
    f.volume = 1000000;
    store.upsert("SBIN-EQ", f, T0);
    f.volume = 1000001;
    store.upsert("SBIN-EQ", f, T0);

    auto q = *store.get("SBIN-EQ");
    ASSERT_TRUE(q.volume_delta.changed);
    ASSERT_TRUE(q.volume_delta.direction == Direction::Up);
    ASSERT_EQ(q.prev_volume, 1000000);

    store.upsert("SBIN-EQ", f, T0);
    ASSERT_FALSE(store.get("SBIN-EQ")->volume_delta.changed);
}

TEST(test_repeated_full_update_is_idempotent) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);

    QuoteFields f;
    f.ltp = 812.5;
    f.open = 800;
    f.high = 815;
    f.low = 798;
    f.close = 805;
    f.volume = 1234567;
    store.upsert("SBIN-EQ", f, T0);
    const Quote first = *store.get("SBIN-EQ");
    ASSERT_TRUE(first.ltp_delta.changed);

    store.upsert("SBIN-EQ", f, T0);
    const Quote again = *store.get("SBIN-EQ");

    ASSERT_EQ(again.ltp, first.ltp);
    ASSERT_EQ(again.open, first.open);
    ASSERT_EQ(again.high, first.high);
    ASSERT_EQ(again.low, first.low);
    ASSERT_EQ(again.close, first.close);
    ASSERT_EQ(again.volume, first.volume);
    ASSERT_EQ(again.change, first.change);
    ASSERT_EQ(again.change_percent, first.change_percent);
    ASSERT_TRUE(again.timestamp == first.timestamp);

    ASSERT_FALSE(again.ltp_delta.changed);
    ASSERT_FALSE(again.open_delta.changed);
    ASSERT_FALSE(again.high_delta.changed);
    ASSERT_FALSE(again.low_delta.changed);
    ASSERT_FALSE(again.volume_delta.changed);
    ASSERT_TRUE(again.ltp_delta.direction == Direction::None);
}

TEST(test_change_percent_is_zero_without_close) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);

    QuoteFields f;
    f.ltp = 50;
    store.upsert("SBIN-EQ", f, T0);
    auto q = *store.get("SBIN-EQ");
    ASSERT_EQ(q.change, 50.0);
    ASSERT_EQ(q.change_percent, 0.0);

    store.upsert("SBIN-EQ", ltp_close(100, 95), T0);
    q = *store.get("SBIN-EQ");
    ASSERT_NEAR(q.change, 5.0, 1e-9);
    ASSERT_NEAR(q.change_percent, 5.2631578947, 1e-6);
}

// === Timestamps, signals, status ===

TEST(test_timestamp_never_moves_backwards) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);

    store.upsert("SBIN-EQ", ltp_close(100, 95), T0 + std::chrono::seconds(10));
    store.upsert("SBIN-EQ", ltp_close(101, 95), T0 + std::chrono::seconds(5));
    ASSERT_TRUE(store.get("SBIN-EQ")->timestamp == T0 + std::chrono::seconds(10));

    store.upsert("SBIN-EQ", ltp_close(102, 95), T0 + std::chrono::seconds(11));
    ASSERT_TRUE(store.get("SBIN-EQ")->timestamp == T0 + std::chrono::seconds(11));
}

TEST(test_signal_survives_upserts) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);

    ASSERT_TRUE(store.set_signal("SBIN-EQ", Signal::Buy));
    ASSERT_FALSE(store.set_signal("NOPE", Signal::Buy));
    store.upsert("SBIN-EQ", ltp_close(100, 95), T0);
    ASSERT_TRUE(store.get("SBIN-EQ")->signal == Signal::Buy);
}

TEST(test_market_status_only_changes_when_given) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);

    store.upsert("SBIN-EQ", ltp_close(100, 95), T0, MarketStatus::Open);
    ASSERT_TRUE(store.get("SBIN-EQ")->market_status == MarketStatus::Open);

    store.upsert("SBIN-EQ", ltp_close(101, 95), T0);
    ASSERT_TRUE(store.get("SBIN-EQ")->market_status == MarketStatus::Open);
}

TEST(test_match_ltp_within_tolerance) {
    auto reg = small_registry();
    SnapshotStore store(reg, 0.01, T0);
    store.upsert("SBIN-EQ", ltp_close(100.0, 95), T0);
    store.upsert("INFY-EQ", ltp_close(1500.0, 1490), T0);

    auto m = store.match_ltp(100.05, 0.1);
    ASSERT_EQ(m.size(), 1u);
    ASSERT_EQ(m[0], "SBIN-EQ");
    ASSERT_TRUE(store.match_ltp(100.2, 0.1).empty());
    // never-priced instruments do not match a zero bid
    ASSERT_TRUE(store.match_ltp(0.0, 0.1).empty());
    ASSERT_EQ(store.non_zero_count(), 2u);
}

int main() {
    std::cout << "\n=== SnapshotStore Tests ===\n\n";

    RUN_TEST(test_every_instrument_has_zero_entry);
    RUN_TEST(test_upsert_unknown_symbol_is_rejected);
    RUN_TEST(test_absent_fields_keep_prior_values);
    RUN_TEST(test_zero_value_never_overwrites);
    RUN_TEST(test_first_update_flags_changed_without_direction);
    RUN_TEST(test_price_jitter_below_threshold_is_not_flagged);
    RUN_TEST(test_price_moves_flag_direction);
    RUN_TEST(test_volume_flags_any_difference);
    RUN_TEST(test_repeated_full_update_is_idempotent);
    RUN_TEST(test_change_percent_is_zero_without_close);
    RUN_TEST(test_timestamp_never_moves_backwards);
    RUN_TEST(test_signal_survives_upserts);
    RUN_TEST(test_market_status_only_changes_when_given);
    RUN_TEST(test_match_ltp_within_tolerance);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
