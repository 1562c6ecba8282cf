#pragma once
#include "quotehub/MarketDataTypes.hpp"
#include "quotehub/SnapshotStore.hpp"
#include "quotehub/SymbolMapping.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/*
SymbolResolver:
  Works out which instrument a push update belongs to.

  Identified updates carry their identifier. Unidentified ones are resolved by
  the first step that yields a candidate:
    (i)   an alternate identifier-like field
    (ii)  instrument_name / instrument
    (iii) bid_price matching the ltp of exactly one tracked instrument
    (iv)  security_id looked up through the SymbolMapping
    (v)   sequence number mod the subscribed-instrument count
    (vi)  wall-clock milliseconds mod the subscribed-instrument count

  Steps (v) and (vi) are guesses with no correctness guarantee: they can
  attribute an update to the wrong instrument. They are kept so unidentified
  feeds still move the table, and every such guess is debug-logged.
  An ambiguous bid match drops the update instead of falling through to them.
*/

namespace qh {

enum class ResolutionStep {
    Explicit,
    AlternateField,
    InstrumentName,
    BidPrice,
    SecurityId,
    Sequence,
    Timestamp
};

const char* resolution_step_to_string(ResolutionStep step);

struct Resolution {
    std::string    short_name;
    ResolutionStep step{ResolutionStep::Explicit};
};

class SymbolResolver {
public:
    SymbolResolver(SymbolMapping& mapping, const SnapshotStore& store, double bid_tolerance = 0.1);

    // The exchange-qualified list the push channel subscribed to, in subscription order.
    void set_active_symbols(std::vector<std::string> symbols);
    size_t active_count() const;

    // Empty result: no tracked instrument could be identified; drop the update.
    std::optional<Resolution> resolve(const PushUpdate& update, TimePoint now) const;

private:
    // Map a raw identifier onto a tracked short name, extending the mapping.
    std::optional<std::string> canonicalize(const std::string& raw, bool learn) const;

    SymbolMapping& mapping_;
    const SnapshotStore& store_;
    double bid_tolerance_;

    mutable std::mutex active_mutex_;
    std::vector<std::string> active_symbols_;
};

}
