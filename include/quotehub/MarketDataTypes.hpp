#pragma once
#include "quotehub/Types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace qh {

// ---- Instrument definition ----

struct Instrument {
    std::string symbol;       // exchange-qualified, e.g. "NSE:SBIN-EQ"
    std::string short_name;   // post-prefix, e.g. "SBIN-EQ"
    bool        is_index{false};
};

// Strip an exchange prefix ("NSE:SBIN-EQ" -> "SBIN-EQ"); identifiers without one pass through.
inline std::string strip_exchange_prefix(const std::string& identifier) {
    auto pos = identifier.find(':');
    if (pos == std::string::npos) return identifier;
    return identifier.substr(pos + 1);
}

// ---- Ingestion boundary ----

// Typed value bag for one instrument. An unset field was absent from the
// provider message; a set but non-positive one means "not available".
struct QuoteFields {
    std::optional<double>       ltp;
    std::optional<double>       open;
    std::optional<double>       high;
    std::optional<double>       low;
    std::optional<double>       close;
    std::optional<std::int64_t> volume;

    bool empty() const {
        return !ltp && !open && !high && !low && !close && !volume;
    }

    // At least one field carries a usable (positive) value.
    bool has_data() const {
        auto positive = [](const std::optional<double>& v) { return v && *v > 0.0; };
        return positive(ltp) || positive(open) || positive(high) || positive(low) ||
               positive(close) || (volume && *volume > 0);
    }
};

// One entry of a bulk quote response.
struct PolledQuote {
    std::string identifier;
    QuoteFields fields;
};

// Everything a push message carried that might name its instrument.
struct IdentityHints {
    std::optional<std::string>  alternate_id;     // symbol, sym, symbol_name, n, name, tk, token, id
    std::optional<std::string>  instrument_name;  // instrument_name, then instrument
    std::optional<double>       bid_price;
    std::optional<std::string>  security_id;
    std::optional<std::int64_t> sequence;         // seq, sequence, seq_no
};

// One streaming update. `identifier` is set only for the identified shape.
struct PushUpdate {
    std::optional<std::string> identifier;
    IdentityHints              hints;
    QuoteFields                fields;

    bool identified() const { return identifier.has_value(); }
};

// ---- Reconciled state ----

struct FieldDelta {
    bool      changed{false};
    Direction direction{Direction::None};
};

struct Quote {
    std::string  symbol;            // short name
    bool         is_index{false};

    double       ltp{0.0};
    double       open{0.0};
    double       high{0.0};
    double       low{0.0};
    double       close{0.0};
    std::int64_t volume{0};
    double       change{0.0};
    double       change_percent{0.0};

    Signal       signal{Signal::Hold};
    TimePoint    timestamp{};
    MarketStatus market_status{MarketStatus::Closed};

    // relative to the immediately preceding quote
    FieldDelta   ltp_delta;
    FieldDelta   open_delta;
    FieldDelta   high_delta;
    FieldDelta   low_delta;
    FieldDelta   volume_delta;

    double       prev_ltp{0.0};
    double       prev_open{0.0};
    double       prev_high{0.0};
    double       prev_low{0.0};
    double       prev_close{0.0};
    std::int64_t prev_volume{0};
};

// Index instrument(s) first, then ascending short name.
using Snapshot = std::vector<Quote>;

// ---- Historical data ----

// Parallel arrays ordered by time, one element per daily bar.
struct HistoricalSeries {
    std::vector<std::int64_t> timestamp;   // epoch seconds
    std::vector<double>       open;
    std::vector<double>       high;
    std::vector<double>       low;
    std::vector<double>       close;
    std::vector<double>       volume;

    std::size_t size() const { return close.size(); }
    bool empty() const { return close.empty(); }

    void push_back(std::int64_t ts, double o, double h, double l, double c, double v) {
        timestamp.push_back(ts);
        open.push_back(o);
        high.push_back(h);
        low.push_back(l);
        close.push_back(c);
        volume.push_back(v);
    }
};

}
