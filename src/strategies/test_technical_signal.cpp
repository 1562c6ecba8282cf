#include "strategies/TechnicalSignal.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace strategy;
using qh::Signal;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

namespace {

qh::HistoricalSeries linear(int n, double start, double step) {
    qh::HistoricalSeries s;
    for (int i = 0; i < n; ++i) {
        double c = start + step * i;
        s.push_back(1704067200 + i * 86400, c, c + 1, c - 1, c, 1000);
    }
    return s;
}

} // namespace

// === Indicators ===

TEST(test_rsi_extremes_and_flat) {
    std::vector<double> up, down, flat, zigzag;
    for (int i = 0; i < 20; ++i) {
        up.push_back(100 + i);
        down.push_back(100 - i);
        flat.push_back(100);
        zigzag.push_back(i % 2 ? 101 : 100);
    }
    ASSERT_EQ(rsi(up), 100.0);
    ASSERT_EQ(rsi(down), 0.0);
    ASSERT_EQ(rsi(flat), 50.0);
    ASSERT_NEAR(rsi(zigzag), 50.0, 1e-9);
    ASSERT_EQ(rsi({1.0, 2.0}), 50.0);   // too short
}

TEST(test_ema_seeds_with_first_value) {
    auto e = ema({10, 20, 30}, 3);   // alpha = 0.5
    ASSERT_EQ(e[0], 10.0);
    ASSERT_EQ(e[1], 15.0);
    ASSERT_EQ(e[2], 22.5);
}

TEST(test_macd_on_trends) {
    auto rising = macd(linear(40, 100, 1).close);
    ASSERT_TRUE(rising.line > 0);
    ASSERT_TRUE(rising.histogram > 0);

    auto falling = macd(linear(40, 200, -1).close);
    ASSERT_TRUE(falling.line < 0);
    ASSERT_TRUE(falling.histogram < 0);

    auto none = macd({});
    ASSERT_EQ(none.line, 0.0);
}

TEST(test_trend_momentum_position) {
    auto ind = compute_indicators(linear(40, 100, 1));
    ASSERT_NEAR(ind.price_trend, 1.0, 1e-9);
    ASSERT_NEAR(ind.momentum, (139.0 / 135.0 - 1.0) * 100.0, 1e-9);
    ASSERT_NEAR(ind.volume_trend, 0.0, 1e-12);
    // last 20 bars span lows from 119 to highs of 140
    ASSERT_NEAR(ind.position, (139.0 - 119.0) / (140.0 - 119.0), 1e-9);
}

// === Rules ===

TEST(test_strong_and_moderate_buy) {
    Indicators strong;
    strong.rsi = 25; strong.macd = 1.0; strong.macd_signal = 0.5; strong.histogram = 0.5;
    strong.price_trend = 0.3; strong.volume_trend = 0.1; strong.position = 0.2; strong.momentum = -1;
    ASSERT_TRUE(classify(strong) == Signal::Buy);

    Indicators moderate;
    moderate.rsi = 35; moderate.histogram = 0.2; moderate.momentum = 0.5; moderate.price_trend = 0.1;
    ASSERT_TRUE(classify(moderate) == Signal::Buy);

    moderate.price_trend = -0.1;
    ASSERT_TRUE(classify(moderate) == Signal::Hold);
}

TEST(test_strong_and_moderate_sell) {
    Indicators strong;
    strong.rsi = 75; strong.macd = -1.0; strong.macd_signal = -0.5; strong.histogram = -0.5;
    strong.price_trend = -0.3; strong.volume_trend = -0.1; strong.position = 0.8; strong.momentum = 1;
    ASSERT_TRUE(classify(strong) == Signal::Sell);

    Indicators moderate;
    moderate.rsi = 65; moderate.histogram = -0.2; moderate.momentum = -0.5; moderate.price_trend = -0.1;
    ASSERT_TRUE(classify(moderate) == Signal::Sell);

    moderate.rsi = 55;
    ASSERT_TRUE(classify(moderate) == Signal::Hold);
}

TEST(test_defaults_hold) {
    ASSERT_TRUE(classify(Indicators{}) == Signal::Hold);
}

// === End to end ===

TEST(test_short_series_holds) {
    ASSERT_TRUE(technical_signal(linear(29, 100, -1)) == Signal::Hold);
    ASSERT_TRUE(technical_signal(qh::HistoricalSeries{}) == Signal::Hold);
}

TEST(test_clean_trends_hold) {
    // overbought but MACD still widening, and the mirror case
    ASSERT_TRUE(technical_signal(linear(40, 100, 1)) == Signal::Hold);
    ASSERT_TRUE(technical_signal(linear(40, 200, -1)) == Signal::Hold);
    ASSERT_TRUE(technical_signal(linear(40, 100, 0)) == Signal::Hold);
}

int main() {
    std::cout << "\n=== TechnicalSignal Tests ===\n\n";

    RUN_TEST(test_rsi_extremes_and_flat);
    RUN_TEST(test_ema_seeds_with_first_value);
    RUN_TEST(test_macd_on_trends);
    RUN_TEST(test_trend_momentum_position);
    RUN_TEST(test_strong_and_moderate_buy);
    RUN_TEST(test_strong_and_moderate_sell);
    RUN_TEST(test_defaults_hold);
    RUN_TEST(test_short_series_holds);
    RUN_TEST(test_clean_trends_hold);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
