#pragma once

#include "quotehub/InstrumentRegistry.hpp"
#include "quotehub/MarketDataTypes.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/*
SnapshotStore:
  The per-instrument current-state table. Every registered instrument has a
  quote from construction on; quotes are overwritten, never removed.

  One coarse mutex guards the table. Each upsert is a complete
  read-modify-write of one quote, and snapshot_all() copies the whole table
  under the same lock, so a copy never observes a half-applied update.
*/

namespace qh {

class SnapshotStore {
public:
  explicit SnapshotStore(const InstrumentRegistry& registry,
                         double price_change_threshold_pct = 0.01,
                         TimePoint created = std::chrono::system_clock::now());

  SnapshotStore(const SnapshotStore&) = delete;
  SnapshotStore& operator=(const SnapshotStore&) = delete;

  bool contains(const std::string& short_name) const;

  // Merge the positive fields of `fields` into the quote, recompute the
  // per-field deltas and change/change_percent, and stamp the timestamp.
  // Returns false (and changes nothing) for an unknown instrument.
  bool upsert(const std::string& short_name, const QuoteFields& fields, TimePoint now,
              std::optional<MarketStatus> market_status = std::nullopt);

  // Historical signal hook.
  bool set_signal(const std::string& short_name, Signal signal);

  std::optional<Quote> get(const std::string& short_name) const;

  // Deep copy in publication order with every numeric field finite.
  Snapshot snapshot_all() const;

  // Short names whose positive ltp lies strictly within `tolerance` of `price`.
  std::vector<std::string> match_ltp(double price, double tolerance) const;

  size_t size() const;
  size_t non_zero_count() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Quote> quotes_;
  std::vector<std::string> order_;
  double price_change_threshold_pct_;
};

} // namespace qh
