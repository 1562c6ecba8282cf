#include "quotehub/SnapshotStore.hpp"
#include "quotehub/ChangeDetection.hpp"
#include <algorithm>
#include <cmath>

namespace qh {

namespace {

double finite_or_zero(double v) {
  return std::isfinite(v) ? v : 0.0;
}

// 0 (or less) from the provider means "not available"; keep what we had.
double merge_price(const std::optional<double>& incoming, double current) {
  if (incoming && std::isfinite(*incoming) && *incoming > 0.0) return *incoming;
  return current;
}

std::int64_t merge_volume(const std::optional<std::int64_t>& incoming, std::int64_t current) {
  if (incoming && *incoming > 0) return *incoming;
  return current;
}

} // namespace

SnapshotStore::SnapshotStore(const InstrumentRegistry& registry,
                             double price_change_threshold_pct,
                             TimePoint created)
    : price_change_threshold_pct_(price_change_threshold_pct) {
  for (const auto& instr : registry.display_order()) {
    Quote q;
    q.symbol = instr.short_name;
    q.is_index = instr.is_index;
    q.timestamp = created;
    quotes_.emplace(instr.short_name, q);
    order_.push_back(instr.short_name);
  }
}

bool SnapshotStore::contains(const std::string& short_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return quotes_.count(short_name) > 0;
}

bool SnapshotStore::upsert(const std::string& short_name, const QuoteFields& fields,
                           TimePoint now, std::optional<MarketStatus> market_status) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = quotes_.find(short_name);
  if (it == quotes_.end()) return false;

  Quote& q = it->second;
  const Quote prev = q;

  q.ltp = merge_price(fields.ltp, prev.ltp);
  q.open = merge_price(fields.open, prev.open);
  q.high = merge_price(fields.high, prev.high);
  q.low = merge_price(fields.low, prev.low);
  q.close = merge_price(fields.close, prev.close);
  q.volume = merge_volume(fields.volume, prev.volume);

  q.ltp_delta = detect_price_change(prev.ltp, q.ltp, price_change_threshold_pct_);
  q.open_delta = detect_price_change(prev.open, q.open, price_change_threshold_pct_);
  q.high_delta = detect_price_change(prev.high, q.high, price_change_threshold_pct_);
  q.low_delta = detect_price_change(prev.low, q.low, price_change_threshold_pct_);
  q.volume_delta = detect_volume_change(prev.volume, q.volume);

  q.prev_ltp = prev.ltp;
  q.prev_open = prev.open;
  q.prev_high = prev.high;
  q.prev_low = prev.low;
  q.prev_close = prev.close;
  q.prev_volume = prev.volume;

  auto [change, change_percent] = compute_change(q.ltp, q.close);
  q.change = change;
  q.change_percent = change_percent;

  // never step backwards, even if the wall clock does
  q.timestamp = std::max(now, prev.timestamp);
  if (market_status) q.market_status = *market_status;
  return true;
}

bool SnapshotStore::set_signal(const std::string& short_name, Signal signal) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = quotes_.find(short_name);
  if (it == quotes_.end()) return false;
  it->second.signal = signal;
  return true;
}

std::optional<Quote> SnapshotStore::get(const std::string& short_name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = quotes_.find(short_name);
  if (it == quotes_.end()) return std::nullopt;
  return it->second;
}

Snapshot SnapshotStore::snapshot_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot out;
  out.reserve(order_.size());
  for (const auto& name : order_) {
    Quote q = quotes_.at(name);
    q.ltp = finite_or_zero(q.ltp);
    q.open = finite_or_zero(q.open);
    q.high = finite_or_zero(q.high);
    q.low = finite_or_zero(q.low);
    q.close = finite_or_zero(q.close);
    q.change = finite_or_zero(q.change);
    q.change_percent = finite_or_zero(q.change_percent);
    q.prev_ltp = finite_or_zero(q.prev_ltp);
    q.prev_open = finite_or_zero(q.prev_open);
    q.prev_high = finite_or_zero(q.prev_high);
    q.prev_low = finite_or_zero(q.prev_low);
    q.prev_close = finite_or_zero(q.prev_close);
    if (q.volume < 0) q.volume = 0;
    out.push_back(std::move(q));
  }
  return out;
}

std::vector<std::string> SnapshotStore::match_ltp(double price, double tolerance) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> matches;
  for (const auto& name : order_) {
    const Quote& q = quotes_.at(name);
    if (q.ltp > 0.0 && std::abs(q.ltp - price) < tolerance) {
      matches.push_back(name);
    }
  }
  return matches;
}

size_t SnapshotStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return quotes_.size();
}

size_t SnapshotStore::non_zero_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::count_if(quotes_.begin(), quotes_.end(), [](const auto& kv) {
    const Quote& q = kv.second;
    return q.ltp > 0.0 || q.open > 0.0 || q.high > 0.0 || q.low > 0.0;
  });
}

} // namespace qh
