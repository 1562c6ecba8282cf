#include "quotehub/HistoryStore.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>

namespace qh {

namespace {

// Finalizes on every exit path, including a throw from BEGIN.
using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

} // namespace

HistoryStore::HistoryStore(const std::string& db_path)
    : db_path_(db_path) {
  int rc = sqlite3_open(db_path_.c_str(), &db_);
  if (rc != SQLITE_OK) {
    std::string msg = "Failed to open database: " + std::string(sqlite3_errmsg(db_));
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  std::cout << "[HistoryStore] Opened database: " << db_path_ << "\n";
  ensure_schema();
}

HistoryStore::~HistoryStore() {
  if (db_) {
    // SQLITE_BUSY here means a statement was never finalized
    if (sqlite3_close(db_) != SQLITE_OK) {
      std::cerr << "[HistoryStore] Close failed: " << sqlite3_errmsg(db_) << "\n";
      sqlite3_close_v2(db_);
      return;
    }
    std::cout << "[HistoryStore] Closed database\n";
  }
}

void HistoryStore::ensure_schema() {
  std::lock_guard<std::mutex> lock(db_mutex_);

  exec_sql("PRAGMA journal_mode=WAL;");
  exec_sql("PRAGMA synchronous=NORMAL;");
  exec_sql("PRAGMA busy_timeout=5000;");

  // Schema version tracking
  exec_sql("CREATE TABLE IF NOT EXISTS schema_version(version INTEGER NOT NULL);");
  int v = query_int("SELECT version FROM schema_version LIMIT 1;", 0);

  exec_sql("BEGIN;");
  try {
    if (v < 1) {
      exec_sql(R"SQL(
        CREATE TABLE IF NOT EXISTS daily_bars(
          symbol TEXT NOT NULL,
          ts INTEGER NOT NULL,
          open REAL NOT NULL,
          high REAL NOT NULL,
          low REAL NOT NULL,
          close REAL NOT NULL,
          volume REAL NOT NULL,
          ingestion_time DATETIME DEFAULT CURRENT_TIMESTAMP,
          PRIMARY KEY(symbol, ts)
        );
      )SQL");

      exec_sql("DELETE FROM schema_version;");
      exec_sql("INSERT INTO schema_version(version) VALUES (1);");
      std::cout << "[HistoryStore] Schema initialized (v1)\n";
    }
    exec_sql("COMMIT;");
  } catch (const std::exception&) {
    exec_sql("ROLLBACK;");
    throw;
  }
}

void HistoryStore::save_series(const std::string& short_name, const HistoricalSeries& series) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  sqlite3_stmt* raw = nullptr;
  const char* sql = R"SQL(
    INSERT OR REPLACE INTO daily_bars(symbol, ts, open, high, low, close, volume)
    VALUES(?, ?, ?, ?, ?, ?, ?);
  )SQL";

  int rc = sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr);
  Statement stmt(raw, &sqlite3_finalize);
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
  }

  exec_sql("BEGIN TRANSACTION;");
  try {
    sqlite3_stmt* raw_del = nullptr;
    rc = sqlite3_prepare_v2(db_, "DELETE FROM daily_bars WHERE symbol = ?;", -1, &raw_del, nullptr);
    Statement del(raw_del, &sqlite3_finalize);
    if (rc != SQLITE_OK) {
      throw std::runtime_error(std::string("Failed to prepare delete: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(del.get(), 1, short_name.c_str(), -1, SQLITE_TRANSIENT);
    rc = sqlite3_step(del.get());
    if (rc != SQLITE_DONE) {
      throw std::runtime_error(std::string("Failed to clear bars: ") + sqlite3_errmsg(db_));
    }

    for (size_t i = 0; i < series.size(); ++i) {
      sqlite3_bind_text(stmt.get(), 1, short_name.c_str(), -1, SQLITE_TRANSIENT);
      sqlite3_bind_int64(stmt.get(), 2, series.timestamp[i]);
      sqlite3_bind_double(stmt.get(), 3, series.open[i]);
      sqlite3_bind_double(stmt.get(), 4, series.high[i]);
      sqlite3_bind_double(stmt.get(), 5, series.low[i]);
      sqlite3_bind_double(stmt.get(), 6, series.close[i]);
      sqlite3_bind_double(stmt.get(), 7, series.volume[i]);

      rc = sqlite3_step(stmt.get());
      if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to insert bar: ") + sqlite3_errmsg(db_));
      }
      sqlite3_reset(stmt.get());
    }
    exec_sql("COMMIT;");
  } catch (const std::exception&) {
    exec_sql("ROLLBACK;");
    throw;
  }
}

HistoricalSeries HistoryStore::load_series(const std::string& short_name, std::int64_t since_epoch_s) {
  std::lock_guard<std::mutex> lock(db_mutex_);

  sqlite3_stmt* stmt = nullptr;
  const char* sql = R"SQL(
    SELECT ts, open, high, low, close, volume
    FROM daily_bars
    WHERE symbol = ? AND ts >= ?
    ORDER BY ts ASC;
  )SQL";

  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("Failed to prepare query: ") + sqlite3_errmsg(db_));
  }

  sqlite3_bind_text(stmt, 1, short_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 2, since_epoch_s);

  HistoricalSeries series;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    series.push_back(sqlite3_column_int64(stmt, 0),
                     sqlite3_column_double(stmt, 1),
                     sqlite3_column_double(stmt, 2),
                     sqlite3_column_double(stmt, 3),
                     sqlite3_column_double(stmt, 4),
                     sqlite3_column_double(stmt, 5));
  }

  sqlite3_finalize(stmt);
  return series;
}

std::vector<std::string> HistoryStore::symbols() {
  std::lock_guard<std::mutex> lock(db_mutex_);

  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, "SELECT DISTINCT symbol FROM daily_bars ORDER BY symbol;", -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string("Failed to prepare query: ") + sqlite3_errmsg(db_));
  }

  std::vector<std::string> out;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    out.emplace_back(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
  }
  sqlite3_finalize(stmt);
  return out;
}

void HistoryStore::exec_sql(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("SQL error: " + msg);
  }
}

int HistoryStore::query_int(const std::string& sql, int default_value) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return default_value;
  }
  int value = default_value;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    value = sqlite3_column_int(stmt, 0);
  }
  sqlite3_finalize(stmt);
  return value;
}

} // namespace qh
