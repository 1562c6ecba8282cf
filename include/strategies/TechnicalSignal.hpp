#pragma once
#include "quotehub/MarketDataTypes.hpp"
#include "quotehub/Types.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace strategy {

// Indicator values behind the last signal; exposed for tests and debug logging.
struct Indicators {
    double rsi{50.0};
    double macd{0.0};
    double macd_signal{0.0};
    double histogram{0.0};
    double price_trend{0.0};
    double volume_trend{0.0};
    double momentum{0.0};
    double position{0.5};
};

// RSI over simple rolling means of gains and losses. Flat windows read as 50.
inline double rsi(const std::vector<double>& closes, std::size_t period = 14) {
    if (closes.size() < period + 1) return 50.0;
    double gain = 0.0, loss = 0.0;
    for (std::size_t i = closes.size() - period; i < closes.size(); ++i) {
        double d = closes[i] - closes[i - 1];
        if (d > 0) gain += d;
        else loss -= d;
    }
    gain /= static_cast<double>(period);
    loss /= static_cast<double>(period);
    if (gain == 0.0 && loss == 0.0) return 50.0;
    if (loss == 0.0) return 100.0;
    double value = 100.0 - 100.0 / (1.0 + gain / loss);
    return std::isfinite(value) ? value : 50.0;
}

// Exponential moving average with alpha = 2 / (span + 1), seeded with the first value.
inline std::vector<double> ema(const std::vector<double>& values, std::size_t span) {
    std::vector<double> out;
    out.reserve(values.size());
    const double alpha = 2.0 / (static_cast<double>(span) + 1.0);
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i == 0) out.push_back(values[0]);
        else out.push_back(alpha * values[i] + (1.0 - alpha) * out.back());
    }
    return out;
}

struct Macd {
    double line{0.0};
    double signal{0.0};
    double histogram{0.0};
};

inline Macd macd(const std::vector<double>& closes,
                 std::size_t fast = 12, std::size_t slow = 26, std::size_t signal = 9) {
    Macd m;
    if (closes.empty()) return m;
    auto f = ema(closes, fast);
    auto s = ema(closes, slow);
    std::vector<double> line(closes.size());
    for (std::size_t i = 0; i < closes.size(); ++i) line[i] = f[i] - s[i];
    auto sig = ema(line, signal);

    m.line = std::isfinite(line.back()) ? line.back() : 0.0;
    m.signal = std::isfinite(sig.back()) ? sig.back() : 0.0;
    m.histogram = m.line - m.signal;
    return m;
}

inline Indicators compute_indicators(const qh::HistoricalSeries& s) {
    Indicators ind;
    const auto& c = s.close;
    const std::size_t n = c.size();

    ind.rsi = rsi(c);
    Macd m = macd(c);
    ind.macd = m.line;
    ind.macd_signal = m.signal;
    ind.histogram = m.histogram;

    // mean of the last five close-to-close changes
    {
        std::size_t k = std::min<std::size_t>(5, n - 1);
        double sum = 0.0;
        for (std::size_t i = n - k; i < n; ++i) sum += c[i] - c[i - 1];
        ind.price_trend = k ? sum / static_cast<double>(k) : 0.0;
    }

    // mean of the last five volume percentage changes, skipping undefined ones
    {
        const auto& v = s.volume;
        std::size_t k = v.size() > 1 ? std::min<std::size_t>(5, v.size() - 1) : 0;
        double sum = 0.0;
        std::size_t used = 0;
        for (std::size_t i = v.size() - k; i < v.size(); ++i) {
            if (v[i - 1] == 0) continue;
            sum += static_cast<double>(v[i]) / static_cast<double>(v[i - 1]) - 1.0;
            ++used;
        }
        ind.volume_trend = used ? sum / static_cast<double>(used) : 0.0;
    }

    if (n >= 5 && c[n - 5] != 0.0) {
        ind.momentum = (c[n - 1] / c[n - 5] - 1.0) * 100.0;
    }

    {
        std::size_t k = std::min<std::size_t>(20, n);
        double hi = *std::max_element(s.high.end() - k, s.high.end());
        double lo = *std::min_element(s.low.end() - k, s.low.end());
        ind.position = (hi - lo) > 0 ? (c[n - 1] - lo) / (hi - lo) : 0.5;
    }
    return ind;
}

inline qh::Signal classify(const Indicators& i) {
    if (i.rsi < 30 && i.histogram > 0 && i.macd > i.macd_signal &&
        i.price_trend > 0 && i.volume_trend > 0 && i.position < 0.3) {
        return qh::Signal::Buy;
    }
    if (i.rsi < 40 && i.histogram > 0 && i.momentum > 0 && i.price_trend > 0) {
        return qh::Signal::Buy;
    }
    if (i.rsi > 70 && i.histogram < 0 && i.macd < i.macd_signal &&
        i.price_trend < 0 && i.volume_trend < 0 && i.position > 0.7) {
        return qh::Signal::Sell;
    }
    if (i.rsi > 60 && i.histogram < 0 && i.momentum < 0 && i.price_trend < 0) {
        return qh::Signal::Sell;
    }
    return qh::Signal::Hold;
}

// Default signal function for the historical worker. Needs 30 daily bars.
inline qh::Signal technical_signal(const qh::HistoricalSeries& series) {
    if (series.close.size() < 30) return qh::Signal::Hold;
    return classify(compute_indicators(series));
}

} // namespace strategy
