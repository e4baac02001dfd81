#include "storage/SqliteStorage.hpp"
#include "util/Log.hpp"

#include <SQLiteCpp/SQLiteCpp.h>

namespace bwmon::storage {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* SQL_CREATE_SAMPLE = R"(
  CREATE TABLE IF NOT EXISTS sample (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    timestamp INTEGER NOT NULL,
    pid INTEGER NOT NULL,
    process_name TEXT NOT NULL,
    app_name TEXT,
    bytes_sent INTEGER NOT NULL,
    bytes_recv INTEGER NOT NULL
  ))";

constexpr const char* SQL_CREATE_DAILY_SUMMARY = R"(
  CREATE TABLE IF NOT EXISTS daily_summary (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    date TEXT NOT NULL,
    app_name TEXT NOT NULL,
    bytes_sent INTEGER NOT NULL,
    bytes_recv INTEGER NOT NULL
  ))";

constexpr const char* SQL_INDEXES[] = {
  "CREATE INDEX IF NOT EXISTS idx_sample_timestamp ON sample(timestamp)",
  "CREATE INDEX IF NOT EXISTS idx_sample_pid ON sample(pid)",
  "CREATE UNIQUE INDEX IF NOT EXISTS idx_daily_app ON daily_summary(date, app_name)",
};

constexpr const char* SQL_INSERT_SAMPLE =
  "INSERT INTO sample (timestamp, pid, process_name, app_name, bytes_sent, bytes_recv) "
  "VALUES (?, ?, ?, ?, ?, ?)";

constexpr const char* SQL_AGGREGATE_DAY = R"(
  INSERT INTO daily_summary (date, app_name, bytes_sent, bytes_recv)
  SELECT ?, COALESCE(app_name, process_name), SUM(bytes_sent), SUM(bytes_recv)
  FROM sample
  WHERE timestamp >= ? AND timestamp < ?
  GROUP BY COALESCE(app_name, process_name))";

// Runs fn, reporting SQLiteCpp failures as StorageError.
template <typename Fn>
auto guarded(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const SQLite::Exception& ex) {
    throw StorageError(std::string(what) + ": " + ex.what() +
                       " (code " + std::to_string(ex.getErrorCode()) + ")");
  }
}

void bind_sample(SQLite::Statement& st, const model::Sample& s) {
  st.bind(1, s.timestamp);
  st.bind(2, static_cast<int64_t>(s.pid));
  st.bind(3, s.process_name);
  if (s.app_name) st.bind(4, *s.app_name); else st.bind(4);
  st.bind(5, static_cast<int64_t>(s.bytes_sent));
  st.bind(6, static_cast<int64_t>(s.bytes_recv));
}

} // namespace

SqliteStorage::SqliteStorage(const std::filesystem::path& path) : path_(path) {
  if (path_ != ":memory:" && path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) throw StorageError("create " + path_.parent_path().string() + ": " + ec.message());
  }
  guarded("open", [&] {
    db_ = std::make_unique<SQLite::Database>(path_.string(), SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE,
                                             kBusyTimeoutMs);
  });
  configure();
  ensure_schema();
  util::log_info("SqliteStorage", "opened %s", path_.c_str());
}

SqliteStorage::~SqliteStorage() = default;

void SqliteStorage::configure() {
  guarded("configure", [&] {
    db_->exec("PRAGMA journal_mode = WAL");
    db_->exec("PRAGMA synchronous = NORMAL");
  });
}

void SqliteStorage::ensure_schema() {
  std::lock_guard<std::mutex> lk(mu_);
  guarded("schema", [&] {
    SQLite::Transaction tx(*db_, SQLite::TransactionBehavior::IMMEDIATE);
    db_->exec(SQL_CREATE_SAMPLE);
    db_->exec(SQL_CREATE_DAILY_SUMMARY);
    for (const char* sql : SQL_INDEXES) db_->exec(sql);
    tx.commit();
  });
}

void SqliteStorage::insert_sample(const model::Sample& s) {
  std::lock_guard<std::mutex> lk(mu_);
  guarded("insert sample", [&] {
    SQLite::Statement st(*db_, SQL_INSERT_SAMPLE);
    bind_sample(st, s);
    st.exec();
  });
}

void SqliteStorage::insert_samples_batch(const std::vector<model::Sample>& samples) {
  if (samples.empty()) return;
  std::lock_guard<std::mutex> lk(mu_);
  guarded("insert batch", [&] {
    SQLite::Transaction tx(*db_, SQLite::TransactionBehavior::IMMEDIATE);
    SQLite::Statement st(*db_, SQL_INSERT_SAMPLE);
    for (const auto& s : samples) {
      bind_sample(st, s);
      st.exec();
      st.reset();
      st.clearBindings();
    }
    tx.commit();
  });
  util::log_debug("SqliteStorage", "inserted %zu samples", samples.size());
}

std::vector<model::Sample> SqliteStorage::get_samples_for_range(int64_t start_ts, int64_t end_ts) {
  std::lock_guard<std::mutex> lk(mu_);
  return guarded("query samples", [&] {
    SQLite::Statement st(*db_,
      "SELECT timestamp, pid, process_name, app_name, bytes_sent, bytes_recv FROM sample "
      "WHERE timestamp >= ? AND timestamp <= ? ORDER BY timestamp, id");
    st.bind(1, start_ts);
    st.bind(2, end_ts);
    std::vector<model::Sample> out;
    while (st.executeStep()) {
      model::Sample s;
      s.timestamp = st.getColumn(0).getInt64();
      s.pid = st.getColumn(1).getInt();
      s.process_name = st.getColumn(2).getString();
      if (!st.getColumn(3).isNull()) s.app_name = st.getColumn(3).getString();
      s.bytes_sent = static_cast<uint64_t>(st.getColumn(4).getInt64());
      s.bytes_recv = static_cast<uint64_t>(st.getColumn(5).getInt64());
      out.push_back(std::move(s));
    }
    return out;
  });
}

void SqliteStorage::aggregate_daily(const util::Date& date) {
  const auto day = util::format_date(date);
  const int64_t start_ts = util::local_midnight(date);
  const int64_t end_ts = start_ts + 86400;

  std::lock_guard<std::mutex> lk(mu_);
  guarded("aggregate", [&] {
    SQLite::Transaction tx(*db_, SQLite::TransactionBehavior::IMMEDIATE);
    SQLite::Statement del(*db_, "DELETE FROM daily_summary WHERE date = ?");
    del.bind(1, day);
    del.exec();
    SQLite::Statement ins(*db_, SQL_AGGREGATE_DAY);
    ins.bind(1, day);
    ins.bind(2, start_ts);
    ins.bind(3, end_ts);
    ins.exec();
    tx.commit();
  });
  util::log_info("SqliteStorage", "aggregated daily summary for %s", day.c_str());
}

std::vector<model::DailySummaryRow> SqliteStorage::get_daily_summary(const util::Date& date) {
  std::lock_guard<std::mutex> lk(mu_);
  return guarded("query summary", [&] {
    SQLite::Statement st(*db_,
      "SELECT app_name, bytes_sent, bytes_recv, (bytes_sent + bytes_recv) AS total_bytes "
      "FROM daily_summary WHERE date = ? ORDER BY total_bytes DESC, app_name");
    st.bind(1, util::format_date(date));
    std::vector<model::DailySummaryRow> out;
    while (st.executeStep()) {
      out.push_back(model::DailySummaryRow{
        st.getColumn(0).getString(),
        static_cast<uint64_t>(st.getColumn(1).getInt64()),
        static_cast<uint64_t>(st.getColumn(2).getInt64()),
        static_cast<uint64_t>(st.getColumn(3).getInt64())});
    }
    return out;
  });
}

uint64_t SqliteStorage::cleanup_old_data_at(int retention_days, int64_t now_ts) {
  const int64_t cutoff = now_ts - static_cast<int64_t>(retention_days) * 86400;
  std::lock_guard<std::mutex> lk(mu_);
  auto deleted = guarded("cleanup", [&] {
    SQLite::Statement st(*db_, "DELETE FROM sample WHERE timestamp < ?");
    st.bind(1, cutoff);
    return static_cast<uint64_t>(st.exec());
  });
  if (deleted > 0) util::log_info("SqliteStorage", "removed %llu samples older than %d days",
                                  static_cast<unsigned long long>(deleted), retention_days);
  return deleted;
}

std::vector<util::Date> SqliteStorage::get_available_dates() {
  std::lock_guard<std::mutex> lk(mu_);
  return guarded("query dates", [&] {
    SQLite::Statement st(*db_, "SELECT DISTINCT date FROM daily_summary ORDER BY date DESC");
    std::vector<util::Date> out;
    while (st.executeStep()) {
      auto text = st.getColumn(0).getString();
      if (auto d = util::parse_date(text)) out.push_back(*d);
      else util::log_warn("SqliteStorage", "ignoring malformed summary date '%s'", text.c_str());
    }
    return out;
  });
}

uint64_t SqliteStorage::sample_count() {
  std::lock_guard<std::mutex> lk(mu_);
  return guarded("count samples", [&] {
    return static_cast<uint64_t>(db_->execAndGet("SELECT COUNT(*) FROM sample").getInt64());
  });
}

bool SqliteStorage::has_table(const std::string& name) {
  std::lock_guard<std::mutex> lk(mu_);
  return guarded("table lookup", [&] { return db_->tableExists(name); });
}

} // namespace bwmon::storage
