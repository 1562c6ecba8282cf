#pragma once

#include "quotehub/MarketDataTypes.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

/*
HistoryStore:
  SQLite persistence for the daily bars the historical worker fetches.

  Each refresh replaces an instrument's stored window wholesale. At startup the
  worker reads the stored windows back so signals are available before the
  first refresh (which only runs during market hours).
*/

namespace qh {

class HistoryStore {
public:
  // ":memory:" gives a private in-memory database.
  explicit HistoryStore(const std::string& db_path);
  ~HistoryStore();

  HistoryStore(const HistoryStore&) = delete;
  HistoryStore& operator=(const HistoryStore&) = delete;

  // Initialize database schema (idempotent)
  void ensure_schema();

  // Replace every stored bar for the instrument with `series`.
  void save_series(const std::string& short_name, const HistoricalSeries& series);

  // Bars at or after `since_epoch_s`, oldest first.
  HistoricalSeries load_series(const std::string& short_name, std::int64_t since_epoch_s = 0);

  std::vector<std::string> symbols();

private:
  std::string db_path_;
  sqlite3* db_{nullptr};
  std::mutex db_mutex_;

  // must hold db_mutex_
  void exec_sql(const std::string& sql);
  int query_int(const std::string& sql, int default_value = 0);
};

} // namespace qh
