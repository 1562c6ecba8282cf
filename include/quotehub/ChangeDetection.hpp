#pragma once
#include "quotehub/MarketDataTypes.hpp"
#include <cmath>
#include <cstdint>
#include <utility>

namespace qh {

// A price field is "changed" once it moves by more than threshold_pct percent.
// The first positive value over a zero baseline is always changed, without a direction.
inline FieldDelta detect_price_change(double previous, double current, double threshold_pct) {
    FieldDelta delta;
    if (current <= 0.0 || current == previous) return delta;
    if (previous <= 0.0) {
        delta.changed = true;
        return delta;
    }
    double change_pct = std::abs(current - previous) / previous * 100.0;
    if (change_pct > threshold_pct) {
        delta.changed = true;
        delta.direction = current > previous ? Direction::Up : Direction::Down;
    }
    return delta;
}

// Volume flags on any difference.
inline FieldDelta detect_volume_change(std::int64_t previous, std::int64_t current) {
    FieldDelta delta;
    if (current <= 0 || current == previous) return delta;
    delta.changed = true;
    if (previous > 0) {
        delta.direction = current > previous ? Direction::Up : Direction::Down;
    }
    return delta;
}

// (change, change_percent) of the last traded price against the close.
inline std::pair<double, double> compute_change(double ltp, double close) {
    double change = ltp - close;
    double change_percent = close > 0.0 ? change / close * 100.0 : 0.0;
    return {change, change_percent};
}

}
