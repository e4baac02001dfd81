#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include "storage/IStorage.hpp"

namespace SQLite { class Database; }

namespace bwmon::storage {

// IStorage over a single SQLite connection (WAL journal). The constructor
// creates the schema and throws StorageError if the database is unusable.
class SqliteStorage : public IStorage {
public:
  explicit SqliteStorage(const std::filesystem::path& path);
  ~SqliteStorage() override;
  SqliteStorage(const SqliteStorage&) = delete;
  SqliteStorage& operator=(const SqliteStorage&) = delete;

  void insert_sample(const model::Sample& s) override;
  void insert_samples_batch(const std::vector<model::Sample>& samples) override;
  std::vector<model::Sample> get_samples_for_range(int64_t start_ts, int64_t end_ts) override;
  void aggregate_daily(const util::Date& date) override;
  std::vector<model::DailySummaryRow> get_daily_summary(const util::Date& date) override;
  uint64_t cleanup_old_data_at(int retention_days, int64_t now_ts) override;
  std::vector<util::Date> get_available_dates() override;
  uint64_t sample_count() override;

  [[nodiscard]] bool has_table(const std::string& name);
  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
  void configure();
  void ensure_schema();

  std::filesystem::path path_;
  std::mutex mu_;
  std::unique_ptr<SQLite::Database> db_;
};

} // namespace bwmon::storage
