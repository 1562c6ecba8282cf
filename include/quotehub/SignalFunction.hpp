#pragma once
#include "quotehub/MarketDataTypes.hpp"
#include <functional>

namespace qh {

// Pure mapping from a historical OHLCV series to an advisory signal.
using SignalFunction = std::function<Signal(const HistoricalSeries&)>;

}
